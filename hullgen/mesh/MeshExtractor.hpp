#pragma once

#include "core/Error.hpp"
#include "mesh/MeshTypes.hpp"
#include "scene/Scene.hpp"
#include <expected>

namespace Hullgen {

/**
 * @brief Flatten a mesh's primitives into one local-space RawMesh
 *
 * - Positions of all primitives are concatenated in order, without
 *   deduplication.
 * - Each primitive's indices are rebased by the number of vertices appended
 *   before it and grouped into consecutive triples.
 * - A primitive without positions contributes nothing.
 * - A primitive without indices contributes its vertices but no triangles.
 * - Triangles that repeat an index are dropped.
 *
 * Fails with ErrorCode::MalformedMesh when an index stream length is not a
 * multiple of 3 or an index is out of its primitive's range.
 */
[[nodiscard]] std::expected<RawMesh, Error> ExtractMesh(const MeshRef& mesh);

} // namespace Hullgen
