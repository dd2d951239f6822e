#include "transform_builder.h"
#include "coordinate_converter.h"
#include <cmath>
#include <glm/gtc/matrix_transform.hpp>

namespace I3dm::Core::Geo {

glm::dmat3 TransformBuilder::buildRotationFromUpRight(const glm::dvec3& up, const glm::dvec3& right) {
    glm::dvec3 forward = glm::normalize(glm::cross(right, up));
    glm::dmat3 rotation;
    rotation[0] = right;
    rotation[1] = up;
    rotation[2] = forward;
    return rotation;
}

glm::dmat3 TransformBuilder::buildEnuRotation(const glm::dvec3& ecefPosition) {
    return glm::dmat3(CoordinateConverter::eastNorthUpToFixedFrame(ecefPosition));
}

glm::dmat4 TransformBuilder::buildTranslationRotationScale(const glm::dvec3& translation,
                                                           const glm::dquat& rotation,
                                                           const glm::dvec3& scale) {
    glm::dmat4 transform = glm::translate(glm::dmat4(1.0), translation);
    transform = transform * glm::mat4_cast(rotation);
    transform = glm::scale(transform, scale);
    return transform;
}

bool TransformBuilder::validateTransform(const glm::dmat4& transform) {
    for (int col = 0; col < 4; ++col) {
        if (glm::any(glm::isnan(transform[col])) || glm::any(glm::isinf(transform[col]))) {
            return false;
        }
    }
    // Zero scale on any axis collapses the instance
    return std::abs(glm::determinant(glm::dmat3(transform))) >= DEGENERATE_DETERMINANT;
}

std::vector<double> TransformBuilder::serializeMatrix(const glm::dmat4& mat) {
    std::vector<double> result(16);
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            result[col * 4 + row] = mat[col][row];
        }
    }
    return result;
}

}
