#pragma once

#include <cstdint>
#include <glm/glm.hpp>

namespace I3dm::Core::Geo {

/**
 * Decoding of compressed vertex attributes.
 */
class AttributeCompression {
public:
    /**
     * Decode an oct-encoded unit vector.
     *
     * @param x Encoded x in [0, rangeMax]
     * @param y Encoded y in [0, rangeMax]
     * @param rangeMax Largest encoded value, 65535 for OCT32P
     * @return Unit-length vector
     */
    static glm::dvec3 octDecodeInRange(uint32_t x, uint32_t y, uint32_t rangeMax);

    /**
     * Encode a unit vector in [0, rangeMax] per component. Inverse of octDecodeInRange
     * up to quantization.
     */
    static glm::uvec2 octEncodeInRange(const glm::dvec3& vector, uint32_t rangeMax);

    // Map a value in [0, rangeMax] to [-1, 1]
    static double fromSNorm(double value, double rangeMax);

    // Map a value in [-1, 1] to [0, rangeMax]
    static double toSNorm(double value, double rangeMax);

    static double signNotZero(double value) { return value < 0.0 ? -1.0 : 1.0; }
};

}
