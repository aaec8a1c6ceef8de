#include "math/Transform.hpp"

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/euler_angles.hpp>

namespace Hullgen {

glm::quat MakeQuat(float w, float x, float y, float z) {
    glm::quat q;
    q.w = w;
    q.x = x;
    q.y = y;
    q.z = z;
    return q;
}

glm::quat QuatFromXYZW(const std::array<float, 4>& xyzw) {
    return MakeQuat(xyzw[3], xyzw[0], xyzw[1], xyzw[2]);
}

NodeTransform DecomposeMatrix(const glm::mat4& matrix) {
    NodeTransform transform;
    transform.translation = glm::vec3(matrix[3]);

    glm::mat3 basis(matrix);
    glm::vec3 scale(glm::length(basis[0]), glm::length(basis[1]), glm::length(basis[2]));
    if (glm::determinant(basis) < 0.0f) {
        scale.x = -scale.x;
    }
    for (int i = 0; i < 3; ++i) {
        if (scale[i] != 0.0f) {
            basis[i] /= scale[i];
        }
    }

    transform.rotation = glm::normalize(glm::quat_cast(basis));
    transform.scale = scale;
    return transform;
}

// ============================================================================
// PointTransform
// ============================================================================

PointTransform::PointTransform(const glm::vec3& translation, const glm::mat3& rotation,
                               const glm::vec3& scale, const glm::vec3& eulerZYX)
    : m_translation(translation)
    , m_rotation(rotation)
    , m_scale(scale)
    , m_eulerZYX(eulerZYX) {}

glm::vec3 PointTransform::Apply(const glm::vec3& point) const {
    return m_translation + m_rotation * (m_scale * point);
}

void PointTransform::ApplyInPlace(std::vector<glm::vec3>& points) const {
    for (auto& p : points) {
        p = Apply(p);
    }
}

glm::mat4 PointTransform::ToMatrix() const {
    glm::mat4 translation = glm::translate(glm::mat4(1.0f), m_translation);
    glm::mat4 rot = glm::mat4(m_rotation);
    glm::mat4 scl = glm::scale(glm::mat4(1.0f), m_scale);
    return translation * rot * scl;
}

// ============================================================================
// Composition
// ============================================================================

PointTransform ComposeTransform(const NodeTransform& transform) {
    glm::quat q = transform.rotation;
    float len = glm::length(q);
    q = len > 0.0f ? q / len : glm::quat(glm::vec3(0.0f));

    float z = 0.0f;
    float y = 0.0f;
    float x = 0.0f;
    glm::extractEulerAngleZYX(glm::mat4_cast(q), z, y, x);

    glm::mat3 rotation = glm::mat3(glm::eulerAngleZYX(z, y, x));

    return PointTransform(transform.translation, rotation, transform.scale, glm::vec3(z, y, x));
}

namespace Transform {

glm::mat4 Compose(const glm::vec3& position, const glm::quat& rotation, const glm::vec3& scale) {
    glm::mat4 translation = glm::translate(glm::mat4(1.0f), position);
    glm::mat4 rot = glm::mat4_cast(rotation);
    glm::mat4 scl = glm::scale(glm::mat4(1.0f), scale);
    return translation * rot * scl;
}

} // namespace Transform

} // namespace Hullgen
