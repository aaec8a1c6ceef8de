#pragma once

#include "core/Error.hpp"
#include <expected>
#include <filesystem>
#include <string_view>

namespace Hullgen {

/**
 * @brief Create or truncate a file and write text to it
 *
 * Open, write and flush failures are reported as ErrorCode::WriteError.
 */
[[nodiscard]] std::expected<void, Error> WriteTextFile(const std::filesystem::path& path,
                                                       std::string_view contents);

/**
 * @brief Make sure an output directory exists
 */
[[nodiscard]] std::expected<void, Error> EnsureDirectory(const std::filesystem::path& directory);

} // namespace Hullgen
