#pragma once

#include "core/Error.hpp"
#include "decomposition/ConvexDecomposer.hpp"
#include "mesh/MeshTypes.hpp"
#include <vector>

namespace Hullgen {

/**
 * @brief Hulls per successfully decomposed group, plus per-group failures
 */
struct DecompositionResult {
    std::vector<DecomposedGroup> groups;
    std::vector<Error> failures;

    [[nodiscard]] size_t GetHullCount() const;
};

/**
 * @brief Run the decomposition service once per mesh group
 *
 * Hull order is kept as returned by the service. A failing group (service
 * error, thrown exception, or empty geometry) is reported and skipped;
 * the remaining groups are still processed.
 */
[[nodiscard]] DecompositionResult DecomposeGroups(const std::vector<MeshGroup>& groups,
                                                  IConvexDecomposer& decomposer,
                                                  const DecompositionParameters& params);

} // namespace Hullgen
