#include "url.h"
#include <cctype>

namespace I3dm::Content {

bool isAbsoluteUrl(const std::string& url) {
    if (url.empty()) {
        return false;
    }
    if (url[0] == '/') {
        return true;
    }
    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < url.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(url[i]);
        if (c == ':') {
            return true;
        }
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return false;
}

std::string joinUrls(const std::string& base, const std::string& relative) {
    if (base.empty() || isAbsoluteUrl(relative)) {
        return relative;
    }
    std::string result = base;
    if (result.back() != '/') {
        result.push_back('/');
    }
    result += relative;
    return result;
}

}
