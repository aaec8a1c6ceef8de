#pragma once

#include "mesh/MeshTypes.hpp"
#include <string>
#include <vector>

namespace Hullgen {

/**
 * @brief Concatenate meshes into one vertex/index buffer
 *
 * Vertices keep enumeration order; each source's triangle indices are
 * offset by the total vertex count of the meshes before it.
 */
[[nodiscard]] RawMesh CombineMeshes(const std::vector<WorldMesh>& meshes);

/**
 * @brief Turn world meshes into decomposition groups
 *
 * With combine set, the result holds a single group named combinedName
 * (or nothing when there are no meshes). Otherwise every mesh becomes its
 * own group, in order, keeping its name.
 */
[[nodiscard]] std::vector<MeshGroup> GroupMeshes(std::vector<WorldMesh> meshes,
                                                 bool combine,
                                                 const std::string& combinedName);

} // namespace Hullgen
