#include "instance_builder.h"
#include "../coordinate/attribute_compression.h"
#include "../coordinate/transform_builder.h"
#include "../format/errors.h"
#include "../../log.h"
#include <cmath>
#include <fmt/format.h>

namespace I3dm::Core::Instancing {

using Format::ComponentType;
using Format::FeatureTable;
using Format::PropertyValue;
using Geo::AttributeCompression;
using Geo::TransformBuilder;

namespace {

glm::dvec3 toVec3(const PropertyValue& value) {
    return glm::dvec3(value[0], value[1], value[2]);
}

// Integral value in [0, maxValue]; checked before any integer conversion
uint32_t toUint32(double value, double maxValue, const std::string& what) {
    if (!(value >= 0.0 && value <= maxValue) || std::floor(value) != value) {
        throw Format::MalformedTileError(fmt::format("{} {} is not an integer in [0, {}]", what, value, maxValue));
    }
    return static_cast<uint32_t>(value);
}

// Both members of a normal pair must be given together
void checkPair(const std::optional<PropertyValue>& up, const std::optional<PropertyValue>& right,
               const char* upName, const char* rightName) {
    if (up.has_value() != right.has_value()) {
        throw Format::InconsistentOrientationError(fmt::format(
            "To define a custom orientation, both {} and {} must be defined.", upName, rightName));
    }
}

}

glm::dvec3 InstanceBuilder::dequantizePosition(const glm::dvec3& quantized,
                                               const glm::dvec3& volumeOffset,
                                               const glm::dvec3& volumeScale) {
    glm::dvec3 position;
    for (int a = 0; a < 3; ++a) {
        position[a] = quantized[a] / QUANTIZED_RANGE * volumeScale[a] + volumeOffset[a];
    }
    return position;
}

uint32_t InstanceBuilder::readInstancesLength(const FeatureTable& featureTable) {
    auto instancesLength = featureTable.getGlobalProperty(Semantic::INSTANCES_LENGTH, ComponentType::UNSIGNED_INT);
    if (!instancesLength) {
        throw Format::MissingRequiredPropertyError("Feature table global property: INSTANCES_LENGTH must be defined");
    }
    return toUint32(instancesLength->scalar(), UINT32_MAX, Semantic::INSTANCES_LENGTH);
}

glm::dvec3 InstanceBuilder::resolvePosition(const FeatureTable& featureTable, std::size_t index) {
    auto position = featureTable.getProperty(Semantic::POSITION, index, ComponentType::FLOAT, 3);
    if (position) {
        return toVec3(*position);
    }

    auto quantized = featureTable.getProperty(Semantic::POSITION_QUANTIZED, index, ComponentType::UNSIGNED_SHORT, 3);
    if (!quantized) {
        throw Format::MissingRequiredPropertyError(
            "Either POSITION or POSITION_QUANTIZED must be defined for each instance.");
    }
    auto volumeOffset = featureTable.getGlobalProperty(Semantic::QUANTIZED_VOLUME_OFFSET, ComponentType::FLOAT, 3);
    if (!volumeOffset) {
        throw Format::MissingRequiredPropertyError(
            "Global property: QUANTIZED_VOLUME_OFFSET must be defined for quantized positions.");
    }
    auto volumeScale = featureTable.getGlobalProperty(Semantic::QUANTIZED_VOLUME_SCALE, ComponentType::FLOAT, 3);
    if (!volumeScale) {
        throw Format::MissingRequiredPropertyError(
            "Global property: QUANTIZED_VOLUME_SCALE must be defined for quantized positions.");
    }
    return dequantizePosition(toVec3(*quantized), toVec3(*volumeOffset), toVec3(*volumeScale));
}

glm::dquat InstanceBuilder::resolveRotation(const FeatureTable& featureTable, std::size_t index,
                                            const glm::dvec3& position) {
    auto normalUp = featureTable.getProperty(Semantic::NORMAL_UP, index, ComponentType::FLOAT, 3);
    auto normalRight = featureTable.getProperty(Semantic::NORMAL_RIGHT, index, ComponentType::FLOAT, 3);
    checkPair(normalUp, normalRight, Semantic::NORMAL_UP, Semantic::NORMAL_RIGHT);

    glm::dmat3 rotation;
    if (normalUp) {
        rotation = TransformBuilder::buildRotationFromUpRight(toVec3(*normalUp), toVec3(*normalRight));
    } else {
        auto octUp = featureTable.getProperty(Semantic::NORMAL_UP_OCT32P, index, ComponentType::UNSIGNED_SHORT, 2);
        auto octRight = featureTable.getProperty(Semantic::NORMAL_RIGHT_OCT32P, index, ComponentType::UNSIGNED_SHORT, 2);
        checkPair(octUp, octRight, Semantic::NORMAL_UP_OCT32P, Semantic::NORMAL_RIGHT_OCT32P);

        if (octUp) {
            glm::dvec3 up = AttributeCompression::octDecodeInRange(
                toUint32((*octUp)[0], OCT_RANGE, Semantic::NORMAL_UP_OCT32P),
                toUint32((*octUp)[1], OCT_RANGE, Semantic::NORMAL_UP_OCT32P), OCT_RANGE);
            glm::dvec3 right = AttributeCompression::octDecodeInRange(
                toUint32((*octRight)[0], OCT_RANGE, Semantic::NORMAL_RIGHT_OCT32P),
                toUint32((*octRight)[1], OCT_RANGE, Semantic::NORMAL_RIGHT_OCT32P), OCT_RANGE);
            rotation = TransformBuilder::buildRotationFromUpRight(up, right);
        } else {
            // No custom orientation, default to the WGS84 east-north-up frame
            rotation = TransformBuilder::buildEnuRotation(position);
        }
    }
    return glm::normalize(glm::quat_cast(rotation));
}

glm::dvec3 InstanceBuilder::resolveScale(const FeatureTable& featureTable, std::size_t index) {
    glm::dvec3 scale(1.0);
    auto uniform = featureTable.getProperty(Semantic::SCALE, index, ComponentType::FLOAT);
    if (uniform) {
        scale *= uniform->scalar();
    }
    auto nonUniform = featureTable.getProperty(Semantic::SCALE_NON_UNIFORM, index, ComponentType::FLOAT, 3);
    if (nonUniform) {
        scale *= toVec3(*nonUniform);
    }
    return scale;
}

uint32_t InstanceBuilder::resolveBatchId(const FeatureTable& featureTable, std::size_t index) {
    auto batchId = featureTable.getProperty(Semantic::BATCH_ID, index, ComponentType::UNSIGNED_SHORT);
    if (!batchId) {
        return static_cast<uint32_t>(index);
    }
    return toUint32(batchId->scalar(), UINT32_MAX, fmt::format("BATCH_ID of instance {}", index));
}

std::vector<Instance> InstanceBuilder::build(FeatureTable& featureTable) {
    uint32_t instancesLength = readInstancesLength(featureTable);
    featureTable.setFeaturesLength(instancesLength);

    // The last instance must be addressable before storage for all of them is reserved
    if (instancesLength > 0) {
        resolvePosition(featureTable, instancesLength - 1);
    }

    std::vector<Instance> instances;
    instances.reserve(instancesLength);
    for (uint32_t i = 0; i < instancesLength; ++i) {
        glm::dvec3 position = resolvePosition(featureTable, i);
        glm::dquat rotation = resolveRotation(featureTable, i, position);
        glm::dvec3 scale = resolveScale(featureTable, i);

        Instance instance;
        instance.modelMatrix = TransformBuilder::buildTranslationRotationScale(position, rotation, scale);
        instance.batchId = resolveBatchId(featureTable, i);
        instances.push_back(instance);
    }

    LOG_D("built %u instances", instancesLength);
    return instances;
}

}
