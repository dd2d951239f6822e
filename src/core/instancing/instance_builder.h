#pragma once

#include "../format/feature_table.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace I3dm::Core::Instancing {

// One placement of the instanced model
struct Instance {
    glm::dmat4 modelMatrix = glm::dmat4(1.0);
    uint32_t batchId = 0;
};

// Feature table semantics of the i3dm format
namespace Semantic {
    inline constexpr const char* INSTANCES_LENGTH = "INSTANCES_LENGTH";
    inline constexpr const char* POSITION = "POSITION";
    inline constexpr const char* POSITION_QUANTIZED = "POSITION_QUANTIZED";
    inline constexpr const char* QUANTIZED_VOLUME_OFFSET = "QUANTIZED_VOLUME_OFFSET";
    inline constexpr const char* QUANTIZED_VOLUME_SCALE = "QUANTIZED_VOLUME_SCALE";
    inline constexpr const char* NORMAL_UP = "NORMAL_UP";
    inline constexpr const char* NORMAL_RIGHT = "NORMAL_RIGHT";
    inline constexpr const char* NORMAL_UP_OCT32P = "NORMAL_UP_OCT32P";
    inline constexpr const char* NORMAL_RIGHT_OCT32P = "NORMAL_RIGHT_OCT32P";
    inline constexpr const char* SCALE = "SCALE";
    inline constexpr const char* SCALE_NON_UNIFORM = "SCALE_NON_UNIFORM";
    inline constexpr const char* BATCH_ID = "BATCH_ID";
}

/**
 * Builds the instance array of an i3dm tile from its feature table.
 *
 * For every instance the position (explicit or quantized), the orientation
 * (explicit normals, oct-encoded normals or the east-north-up frame of the
 * position) and the scale are resolved and composed into one model matrix.
 * A missing required property aborts the whole build.
 */
class InstanceBuilder {
public:
    static constexpr double QUANTIZED_RANGE = 65535.0;
    static constexpr uint32_t OCT_RANGE = 65535;

    /**
     * @param featureTable Table of the tile; its featuresLength is set to INSTANCES_LENGTH
     * @throws MissingRequiredPropertyError, InconsistentOrientationError,
     *         MalformedTileError (bad binary references)
     */
    static std::vector<Instance> build(Format::FeatureTable& featureTable);

    static uint32_t readInstancesLength(const Format::FeatureTable& featureTable);

    static glm::dvec3 resolvePosition(const Format::FeatureTable& featureTable, std::size_t index);

    static glm::dquat resolveRotation(const Format::FeatureTable& featureTable, std::size_t index,
                                      const glm::dvec3& position);

    static glm::dvec3 resolveScale(const Format::FeatureTable& featureTable, std::size_t index);

    static uint32_t resolveBatchId(const Format::FeatureTable& featureTable, std::size_t index);

    // q / 65535 * volumeScale + volumeOffset, per axis
    static glm::dvec3 dequantizePosition(const glm::dvec3& quantized,
                                         const glm::dvec3& volumeOffset,
                                         const glm::dvec3& volumeScale);
};

}
