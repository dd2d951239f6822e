#pragma once

#include <string>

namespace I3dm::Content {

// True for urls with a scheme ("http://", "data:") or an absolute path
bool isAbsoluteUrl(const std::string& url);

/**
 * Join a base url and a relative url separated by a single slash.
 * An absolute relative url, or an empty base, is returned unchanged.
 */
std::string joinUrls(const std::string& base, const std::string& relative);

}
