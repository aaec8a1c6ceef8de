#pragma once

#include <array>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Hullgen {

/**
 * @brief Decomposed local transform of a scene node
 *
 * The rotation is a unit quaternion whose components are addressed by name
 * (w, x, y, z). Never build it with the four-argument glm::quat constructor,
 * whose parameter order depends on GLM_FORCE_QUAT_DATA_XYZW; use MakeQuat or
 * QuatFromXYZW instead.
 */
struct NodeTransform {
    glm::vec3 translation{0.0f};
    glm::quat rotation = glm::quat(glm::vec3(0.0f));   // identity
    glm::vec3 scale{1.0f};
};

/**
 * @brief Build a quaternion from named components
 */
[[nodiscard]] glm::quat MakeQuat(float w, float x, float y, float z);

/**
 * @brief Build a quaternion from an array in glTF storage order (x, y, z, w)
 */
[[nodiscard]] glm::quat QuatFromXYZW(const std::array<float, 4>& xyzw);

/**
 * @brief Split an affine T * R * S matrix into a NodeTransform
 *
 * A mirroring matrix comes back with a negative x scale. Shear is lost.
 */
[[nodiscard]] NodeTransform DecomposeMatrix(const glm::mat4& matrix);

/**
 * @brief World-space point transform of one node
 *
 * Apply() scales component-wise first, then rotates, then translates:
 * p' = T + R * (S * p).
 */
class PointTransform {
public:
    PointTransform() = default;
    PointTransform(const glm::vec3& translation, const glm::mat3& rotation,
                   const glm::vec3& scale, const glm::vec3& eulerZYX);

    [[nodiscard]] glm::vec3 Apply(const glm::vec3& point) const;
    void ApplyInPlace(std::vector<glm::vec3>& points) const;

    [[nodiscard]] const glm::vec3& GetTranslation() const { return m_translation; }
    [[nodiscard]] const glm::mat3& GetRotation() const { return m_rotation; }
    [[nodiscard]] const glm::vec3& GetScale() const { return m_scale; }

    /// Intrinsic Z-Y-X angles in radians: (z, y, x)
    [[nodiscard]] const glm::vec3& GetEulerZYX() const { return m_eulerZYX; }

    [[nodiscard]] glm::mat4 ToMatrix() const;

private:
    glm::vec3 m_translation{0.0f};
    glm::mat3 m_rotation{1.0f};
    glm::vec3 m_scale{1.0f};
    glm::vec3 m_eulerZYX{0.0f};
};

/**
 * @brief Resolve a node's TRS into a point transform
 *
 * The rotation goes through an intrinsic Z-Y-X Euler triple and is rebuilt
 * as a rotation matrix from it.
 */
[[nodiscard]] PointTransform ComposeTransform(const NodeTransform& transform);

namespace Transform {

/**
 * @brief T * R * S as a single matrix
 */
[[nodiscard]] glm::mat4 Compose(const glm::vec3& position, const glm::quat& rotation, const glm::vec3& scale);

} // namespace Transform

} // namespace Hullgen
