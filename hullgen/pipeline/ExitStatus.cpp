#include "pipeline/ExitStatus.hpp"

namespace Hullgen {

ExitStatus ExitStatusFor(const std::expected<ConversionReport, Error>& result) noexcept {
    if (!result) {
        return result.error().code == ErrorCode::InvalidConfig ? ExitStatus::Usage : ExitStatus::Fatal;
    }
    return result->HasFailures() ? ExitStatus::PartialFailure : ExitStatus::Success;
}

} // namespace Hullgen
