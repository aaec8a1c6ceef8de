#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Hullgen {

/**
 * @brief How the voxelizer treats the interior of a mesh
 */
enum class FillMode {
    FloodFill,      ///< Flood fill the inside from the outer boundary
    SurfaceOnly,    ///< Only voxels touching the surface are solid
    Raycast         ///< Inside/outside decided by ray casting
};

[[nodiscard]] const char* FillModeToString(FillMode mode) noexcept;
[[nodiscard]] std::optional<FillMode> FillModeFromString(std::string_view str);

/**
 * @brief Convex decomposition settings, constant for a whole run
 */
struct DecompositionParameters {
    uint32_t maxHulls = 1024;
    uint32_t voxelResolution = 128;     ///< Voxels along each axis
    FillMode fillMode = FillMode::FloodFill;
    bool detectCavities = false;        ///< FloodFill only; keeps enclosed voids hollow
    uint32_t maxVerticesPerHull = 64;
};

/**
 * @brief Fill mode the voxelizer actually runs
 *
 * Flood fill with cavity detection is done by ray casting, which leaves
 * voids the flood fill would have filled solid.
 */
[[nodiscard]] FillMode EffectiveFillMode(const DecompositionParameters& params) noexcept;

} // namespace Hullgen
