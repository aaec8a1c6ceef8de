#include "decomposition/DecompositionDriver.hpp"
#include "core/Logger.hpp"
#include <exception>

namespace Hullgen {

size_t DecompositionResult::GetHullCount() const {
    size_t count = 0;
    for (const auto& g : groups) {
        count += g.hulls.size();
    }
    return count;
}

DecompositionResult DecomposeGroups(const std::vector<MeshGroup>& groups,
                                    IConvexDecomposer& decomposer,
                                    const DecompositionParameters& params) {
    DecompositionResult result;

    for (const auto& group : groups) {
        if (group.mesh.IsEmpty()) {
            Error error(ErrorCode::DecompositionError,
                        "group '" + group.name + "' has " +
                        std::to_string(group.mesh.GetVertexCount()) + " vertices and " +
                        std::to_string(group.mesh.GetTriangleCount()) + " triangles");
            HULLGEN_LOG_ERROR("{}", error.ToString());
            result.failures.push_back(std::move(error));
            continue;
        }

        HULLGEN_LOG_INFO("Decomposing '{}' ({} vertices, {} triangles, max {} hulls)",
                         group.name, group.mesh.GetVertexCount(),
                         group.mesh.GetTriangleCount(), params.maxHulls);

        std::expected<std::vector<ConvexHull>, Error> hulls;
        try {
            hulls = decomposer.Decompose(group.mesh, params);
        } catch (const std::exception& e) {
            hulls = std::unexpected(Error(ErrorCode::DecompositionError, e.what()));
        }

        if (!hulls) {
            Error error(ErrorCode::DecompositionError,
                        "group '" + group.name + "': " + hulls.error().message);
            HULLGEN_LOG_ERROR("{}", error.ToString());
            result.failures.push_back(std::move(error));
            continue;
        }

        HULLGEN_LOG_DEBUG("'{}' produced {} hulls", group.name, hulls->size());

        DecomposedGroup decomposed;
        decomposed.name = group.name;
        decomposed.hulls = std::move(*hulls);
        result.groups.push_back(std::move(decomposed));
    }

    return result;
}

} // namespace Hullgen
