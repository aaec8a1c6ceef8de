#pragma once

#include "core/Error.hpp"
#include "mesh/MeshTypes.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Hullgen {

/**
 * @brief Aggregate document of every hull in a run
 *
 * {"shapes":[{"points":[{"x":..,"y":..,"z":..}],"tris":[[i,j,k]]}]}
 * Shapes follow group order, then hull order. Triangle indices are 0-based.
 */
[[nodiscard]] nlohmann::json BuildShapeDocument(const std::vector<DecomposedGroup>& groups);

/**
 * @brief Pretty-printed (2-space indent) UTF-8 text of a shape document
 */
[[nodiscard]] std::string SerializeShapeDocument(const nlohmann::json& document);

/**
 * @brief Write a document to "<directory>/<baseName><suffix>.json"
 *
 * @return Path of the written file
 */
[[nodiscard]] std::expected<std::filesystem::path, Error>
WriteShapeDocument(const std::filesystem::path& directory,
                   const std::string& baseName,
                   const std::string& suffix,
                   const nlohmann::json& document);

} // namespace Hullgen
