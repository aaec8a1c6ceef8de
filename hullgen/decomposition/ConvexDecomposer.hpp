#pragma once

#include "core/Error.hpp"
#include "decomposition/DecompositionParameters.hpp"
#include "mesh/MeshTypes.hpp"
#include <expected>
#include <vector>

namespace Hullgen {

/**
 * @brief Convex decomposition service
 *
 * Blocking call from (parameters, vertices, triangles) to an ordered list
 * of convex hulls. Implementations report failure through the error value
 * with ErrorCode::DecompositionError.
 */
class IConvexDecomposer {
public:
    virtual ~IConvexDecomposer() = default;

    /**
     * @brief Decompose a mesh into convex hulls
     * @param mesh Triangle mesh; never empty when called by the driver
     * @param params Run-wide decomposition parameters
     * @return Hulls in the order the service produced them
     */
    [[nodiscard]] virtual std::expected<std::vector<ConvexHull>, Error>
    Decompose(const RawMesh& mesh, const DecompositionParameters& params) = 0;
};

} // namespace Hullgen
