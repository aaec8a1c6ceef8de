#pragma once

#include "math/Transform.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <glm/glm.hpp>

namespace Hullgen {

/**
 * @brief Position and index streams of one mesh primitive
 *
 * Either stream may be absent. Indices refer to this primitive's own
 * positions.
 */
struct MeshPrimitive {
    std::optional<std::vector<glm::vec3>> positions;
    std::optional<std::vector<uint32_t>> indices;
};

/**
 * @brief Mesh referenced by a scene node
 */
struct MeshRef {
    std::string name;   ///< May be empty
    std::vector<MeshPrimitive> primitives;
};

/**
 * @brief Scene graph node as delivered by the scene loader
 */
struct SceneNode {
    std::string name;   ///< May be empty
    std::optional<MeshRef> mesh;
    NodeTransform transform;
    std::vector<SceneNode> children;
};

/**
 * @brief One scene of a file with its direct (top-level) nodes
 */
struct SceneGraph {
    std::string name;
    std::vector<SceneNode> nodes;
};

/**
 * @brief Everything the loader read from one input file
 */
struct Scene {
    std::filesystem::path sourcePath;
    std::vector<SceneGraph> scenes;

    [[nodiscard]] size_t GetTopLevelNodeCount() const {
        size_t count = 0;
        for (const auto& scene : scenes) {
            count += scene.nodes.size();
        }
        return count;
    }
};

} // namespace Hullgen
