#pragma once

#include "core/Error.hpp"
#include "decomposition/DecompositionParameters.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace Hullgen {

/**
 * @brief Settings for one conversion run
 *
 * Every fallback the pipeline uses lives here with its default, so nothing
 * downstream invents values of its own.
 */
struct ConversionConfig {
    std::filesystem::path inputPath;
    std::filesystem::path outputDirectory;      ///< Empty means current working directory
    std::string appendSuffix = "-shape";
    std::string placeholderName = "New Obj";    ///< Used for meshes without a name

    DecompositionParameters decomposition;

    bool logSuccess = true;
    bool jsonOnly = false;
    bool combineMeshes = false;

    /**
     * @brief Output directory with the working-directory fallback applied
     */
    [[nodiscard]] std::filesystem::path ResolveOutputDirectory() const;

    /**
     * @brief Input file name without directory and extension
     */
    [[nodiscard]] std::string InputBaseName() const;

    /**
     * @brief Check value ranges
     */
    [[nodiscard]] std::expected<void, Error> Validate() const;

    /**
     * @brief Overlay keys present in a JSON object onto this config
     *
     * Keys missing from the object keep their current value.
     */
    [[nodiscard]] std::expected<void, Error> ApplyJson(const nlohmann::json& json);

    [[nodiscard]] nlohmann::json ToJson() const;

    /**
     * @brief Load a config file on top of the defaults
     */
    [[nodiscard]] static std::expected<ConversionConfig, Error> LoadFile(const std::filesystem::path& path);
};

} // namespace Hullgen
