#include "attribute_compression.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace I3dm::Core::Geo {

double AttributeCompression::fromSNorm(double value, double rangeMax) {
    return std::clamp(value, 0.0, rangeMax) / rangeMax * 2.0 - 1.0;
}

double AttributeCompression::toSNorm(double value, double rangeMax) {
    return std::round((std::clamp(value, -1.0, 1.0) * 0.5 + 0.5) * rangeMax);
}

glm::dvec3 AttributeCompression::octDecodeInRange(uint32_t x, uint32_t y, uint32_t rangeMax) {
    if (rangeMax == 0) {
        throw std::invalid_argument("octDecodeInRange: rangeMax must be positive");
    }
    double range = static_cast<double>(rangeMax);

    glm::dvec3 result;
    result.x = fromSNorm(static_cast<double>(x), range);
    result.y = fromSNorm(static_cast<double>(y), range);
    result.z = 1.0 - (std::abs(result.x) + std::abs(result.y));

    // Lower hemisphere is folded over the diagonals
    if (result.z < 0.0) {
        double oldX = result.x;
        result.x = (1.0 - std::abs(result.y)) * signNotZero(oldX);
        result.y = (1.0 - std::abs(oldX)) * signNotZero(result.y);
    }

    return glm::normalize(result);
}

glm::uvec2 AttributeCompression::octEncodeInRange(const glm::dvec3& vector, uint32_t rangeMax) {
    double l1 = std::abs(vector.x) + std::abs(vector.y) + std::abs(vector.z);
    if (l1 == 0.0) {
        throw std::invalid_argument("octEncodeInRange: vector must be non-zero");
    }
    double x = vector.x / l1;
    double y = vector.y / l1;
    if (vector.z < 0.0) {
        double oldX = x;
        x = (1.0 - std::abs(y)) * signNotZero(oldX);
        y = (1.0 - std::abs(oldX)) * signNotZero(y);
    }
    double range = static_cast<double>(rangeMax);
    return glm::uvec2(static_cast<uint32_t>(toSNorm(x, range)),
                      static_cast<uint32_t>(toSNorm(y, range)));
}

}
