#pragma once

#include "config/ConversionConfig.hpp"
#include "core/Error.hpp"
#include "mesh/MeshTypes.hpp"
#include "scene/Scene.hpp"
#include <vector>

namespace Hullgen {

/**
 * @brief World-space meshes collected from a scene, plus per-mesh failures
 */
struct WalkResult {
    std::vector<WorldMesh> meshes;
    std::vector<Error> failures;
};

/**
 * @brief Collect world-space meshes from every scene's top-level nodes
 *
 * Only the direct node list of each scene is visited; children of those
 * nodes are not descended into. Nodes without a mesh are skipped. A mesh
 * that fails extraction is reported in WalkResult::failures and skipped.
 */
[[nodiscard]] WalkResult WalkScene(const Scene& scene, const ConversionConfig& config);

/**
 * @brief Display name of a node's mesh with the placeholder fallback
 */
[[nodiscard]] std::string MeshDisplayName(const MeshRef& mesh, const ConversionConfig& config);

} // namespace Hullgen
