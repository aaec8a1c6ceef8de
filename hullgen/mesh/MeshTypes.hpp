#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace Hullgen {

// ============================================================================
// Geometry primitives
// ============================================================================

using Vertex = glm::vec3;

/**
 * @brief Three vertex indices into the owning mesh's vertex list
 */
using Triangle = std::array<uint32_t, 3>;

/**
 * @brief Indexed triangle geometry
 *
 * Used both for local-space meshes straight out of the extractor and for
 * world-space / combined meshes further down the pipeline.
 */
struct RawMesh {
    std::vector<Vertex> vertices;
    std::vector<Triangle> triangles;

    [[nodiscard]] size_t GetVertexCount() const { return vertices.size(); }
    [[nodiscard]] size_t GetTriangleCount() const { return triangles.size(); }
    [[nodiscard]] bool IsEmpty() const { return vertices.empty() || triangles.empty(); }
};

/**
 * @brief Mesh whose vertices were mapped through its node's world transform
 */
struct WorldMesh {
    std::string name;   ///< Display name, never empty
    RawMesh mesh;
};

/**
 * @brief Unit of work handed to the decomposition service
 *
 * Either one WorldMesh on its own, or every WorldMesh of the run fused
 * into a single vertex/index buffer.
 */
struct MeshGroup {
    std::string name;
    RawMesh mesh;
    size_t sourceMeshCount = 1;
};

/**
 * @brief Convex piece produced by the decomposition service
 *
 * Triangle indices refer to this hull's own point list.
 */
struct ConvexHull {
    std::vector<glm::vec3> points;
    std::vector<Triangle> triangles;
};

/**
 * @brief Hulls produced for one mesh group, in service order
 */
struct DecomposedGroup {
    std::string name;
    std::vector<ConvexHull> hulls;
};

} // namespace Hullgen
