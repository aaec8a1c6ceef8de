#pragma once

#include "core/Error.hpp"
#include "mesh/MeshTypes.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace Hullgen {

/**
 * @brief Wavefront OBJ text for one hull
 *
 * "o <name>", then one "v x y z" per point, then one "f i j k" per
 * triangle with 1-based indices. Every line ends with '\n'.
 */
[[nodiscard]] std::string FormatObj(const std::string& name, const ConvexHull& hull);

/**
 * @brief Write a hull to "<directory>/<name><suffix>.obj"
 *
 * The file is created or truncated. The object record inside the file is
 * named after name without the suffix.
 *
 * @return Path of the written file
 */
[[nodiscard]] std::expected<std::filesystem::path, Error>
WriteHullObj(const std::filesystem::path& directory,
             const std::string& name,
             const std::string& suffix,
             const ConvexHull& hull);

} // namespace Hullgen
