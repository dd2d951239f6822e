#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <vector>

namespace I3dm::Core::Geo {

/**
 * Builder for the per-instance model matrices of instanced tiles.
 */
class TransformBuilder {
public:
    /**
     * Rotation whose columns are right, up and normalize(cross(right, up)).
     *
     * @param up Unit up vector of the instance
     * @param right Unit right vector of the instance
     */
    static glm::dmat3 buildRotationFromUpRight(const glm::dvec3& up, const glm::dvec3& right);

    /**
     * Rotation part of the east-north-up frame at an ECEF position.
     */
    static glm::dmat3 buildEnuRotation(const glm::dvec3& ecefPosition);

    /**
     * Compose translation, rotation and scale as T * R * S (column-major).
     */
    static glm::dmat4 buildTranslationRotationScale(const glm::dvec3& translation,
                                                    const glm::dquat& rotation,
                                                    const glm::dvec3& scale);

    static constexpr double DEGENERATE_DETERMINANT = 1e-10;

    /**
     * True when a model matrix is finite and its linear part is invertible.
     * Instances with a zero SCALE fail this check.
     */
    static bool validateTransform(const glm::dmat4& transform);

    /**
     * Serialize matrix to vector.
     * Returns column-major order array of 16 doubles, as glTF and tileset.json expect.
     */
    static std::vector<double> serializeMatrix(const glm::dmat4& mat);
};

}
