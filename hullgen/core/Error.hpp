#pragma once

#include <string>
#include <utility>

namespace Hullgen {

/**
 * @brief Failure categories reported by the conversion pipeline
 *
 * SceneLoadError and InvalidConfig abort a run. MalformedMesh,
 * DecompositionError and WriteError are scoped to one mesh, mesh group or
 * output file; the run continues with the remaining units of work.
 */
enum class ErrorCode {
    SceneLoadError,
    MalformedMesh,
    DecompositionError,
    WriteError,
    InvalidConfig
};

/**
 * @brief Get error description string
 */
[[nodiscard]] const char* ErrorCodeToString(ErrorCode code) noexcept;

/**
 * @brief Error value carried by std::expected results
 */
struct Error {
    ErrorCode code = ErrorCode::SceneLoadError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /**
     * @brief "<category>: <message>"
     */
    [[nodiscard]] std::string ToString() const;

    /**
     * @brief True for categories that abort the whole run
     */
    [[nodiscard]] bool IsFatal() const {
        return code == ErrorCode::SceneLoadError || code == ErrorCode::InvalidConfig;
    }
};

} // namespace Hullgen
