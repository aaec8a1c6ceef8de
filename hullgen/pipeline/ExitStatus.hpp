#pragma once

#include "core/Error.hpp"
#include "pipeline/ConversionPipeline.hpp"
#include <expected>

namespace Hullgen {

/**
 * @brief Process exit status of the command-line tool
 */
enum class ExitStatus : int {
    Success = 0,
    Usage = 1,              ///< Bad arguments or configuration
    Fatal = 2,              ///< Run aborted, nothing converted
    PartialFailure = 3      ///< Run finished with recorded failures
};

/**
 * @brief Map the outcome of ConversionPipeline::Run to an exit status
 */
[[nodiscard]] ExitStatus ExitStatusFor(const std::expected<ConversionReport, Error>& result) noexcept;

[[nodiscard]] constexpr int ToExitCode(ExitStatus status) noexcept {
    return static_cast<int>(status);
}

} // namespace Hullgen
