#include "decomposition/DecompositionParameters.hpp"

namespace Hullgen {

const char* FillModeToString(FillMode mode) noexcept {
    switch (mode) {
        case FillMode::FloodFill:   return "flood";
        case FillMode::SurfaceOnly: return "surface";
        case FillMode::Raycast:     return "raycast";
        default: return "flood";
    }
}

std::optional<FillMode> FillModeFromString(std::string_view str) {
    if (str == "flood" || str == "flood_fill")     return FillMode::FloodFill;
    if (str == "surface" || str == "surface_only") return FillMode::SurfaceOnly;
    if (str == "raycast" || str == "raycast_fill") return FillMode::Raycast;
    return std::nullopt;
}

FillMode EffectiveFillMode(const DecompositionParameters& params) noexcept {
    if (params.fillMode == FillMode::FloodFill && params.detectCavities) {
        return FillMode::Raycast;
    }
    return params.fillMode;
}

} // namespace Hullgen
