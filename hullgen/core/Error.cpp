#include "core/Error.hpp"

namespace Hullgen {

const char* ErrorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SceneLoadError:     return "Scene load error";
        case ErrorCode::MalformedMesh:      return "Malformed mesh";
        case ErrorCode::DecompositionError: return "Decomposition error";
        case ErrorCode::WriteError:         return "Write error";
        case ErrorCode::InvalidConfig:      return "Invalid configuration";
        default: return "Unknown error";
    }
}

std::string Error::ToString() const {
    return std::string(ErrorCodeToString(code)) + ": " + message;
}

} // namespace Hullgen
