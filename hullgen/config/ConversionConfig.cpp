#include "config/ConversionConfig.hpp"
#include "core/Logger.hpp"
#include <array>
#include <cstdint>
#include <fstream>
#include <string_view>

namespace Hullgen {

namespace {
    constexpr std::array<std::string_view, 11> kKnownKeys = {
        "output_directory", "append", "placeholder_name",
        "max_hulls", "voxel_resolution", "fill_mode", "detect_cavities",
        "max_vertices_per_hull", "log_success", "json_only", "combine_meshes"
    };

    bool IsKnownKey(const std::string& key) {
        for (auto known : kKnownKeys) {
            if (key == known) return true;
        }
        return false;
    }

    Error ConfigError(const std::string& message) {
        return Error(ErrorCode::InvalidConfig, message);
    }

    std::expected<uint32_t, Error> ReadPositive(const nlohmann::json& value, const char* key) {
        if (!value.is_number_integer()) {
            return std::unexpected(ConfigError(std::string(key) + " must be an integer"));
        }
        auto v = value.get<int64_t>();
        if (v <= 0 || v > static_cast<int64_t>(UINT32_MAX)) {
            return std::unexpected(ConfigError(std::string(key) + " must be a positive integer"));
        }
        return static_cast<uint32_t>(v);
    }
}

std::filesystem::path ConversionConfig::ResolveOutputDirectory() const {
    if (!outputDirectory.empty()) {
        return outputDirectory;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::string ConversionConfig::InputBaseName() const {
    return inputPath.stem().string();
}

std::expected<void, Error> ConversionConfig::Validate() const {
    if (decomposition.maxHulls == 0) {
        return std::unexpected(ConfigError("max_hulls must be positive"));
    }
    if (decomposition.voxelResolution == 0) {
        return std::unexpected(ConfigError("voxel_resolution must be positive"));
    }
    if (decomposition.maxVerticesPerHull < 4) {
        return std::unexpected(ConfigError("max_vertices_per_hull must be at least 4"));
    }
    if (decomposition.detectCavities && decomposition.fillMode != FillMode::FloodFill) {
        return std::unexpected(ConfigError(std::string("detect_cavities requires fill_mode 'flood', not '") +
                                           FillModeToString(decomposition.fillMode) + "'"));
    }
    if (placeholderName.empty()) {
        return std::unexpected(ConfigError("placeholder_name must not be empty"));
    }
    return {};
}

std::expected<void, Error> ConversionConfig::ApplyJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected(ConfigError("configuration root must be a JSON object"));
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (!IsKnownKey(it.key())) {
            HULLGEN_LOG_WARN("Ignoring unknown configuration key '{}'", it.key());
        }
    }

    try {
        if (json.contains("output_directory")) {
            outputDirectory = json["output_directory"].get<std::string>();
        }
        if (json.contains("append")) {
            appendSuffix = json["append"].get<std::string>();
        }
        if (json.contains("placeholder_name")) {
            placeholderName = json["placeholder_name"].get<std::string>();
        }
        if (json.contains("max_hulls")) {
            auto v = ReadPositive(json["max_hulls"], "max_hulls");
            if (!v) return std::unexpected(v.error());
            decomposition.maxHulls = *v;
        }
        if (json.contains("voxel_resolution")) {
            auto v = ReadPositive(json["voxel_resolution"], "voxel_resolution");
            if (!v) return std::unexpected(v.error());
            decomposition.voxelResolution = *v;
        }
        if (json.contains("max_vertices_per_hull")) {
            auto v = ReadPositive(json["max_vertices_per_hull"], "max_vertices_per_hull");
            if (!v) return std::unexpected(v.error());
            decomposition.maxVerticesPerHull = *v;
        }
        if (json.contains("fill_mode")) {
            auto mode = FillModeFromString(json["fill_mode"].get<std::string>());
            if (!mode) {
                return std::unexpected(ConfigError("unknown fill_mode '" +
                                                   json["fill_mode"].get<std::string>() + "'"));
            }
            decomposition.fillMode = *mode;
        }
        if (json.contains("detect_cavities")) {
            decomposition.detectCavities = json["detect_cavities"].get<bool>();
        }
        if (json.contains("log_success")) {
            logSuccess = json["log_success"].get<bool>();
        }
        if (json.contains("json_only")) {
            jsonOnly = json["json_only"].get<bool>();
        }
        if (json.contains("combine_meshes")) {
            combineMeshes = json["combine_meshes"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError(std::string("wrong value type: ") + e.what()));
    }

    return {};
}

nlohmann::json ConversionConfig::ToJson() const {
    nlohmann::json j;
    j["output_directory"] = outputDirectory.string();
    j["append"] = appendSuffix;
    j["placeholder_name"] = placeholderName;
    j["max_hulls"] = decomposition.maxHulls;
    j["voxel_resolution"] = decomposition.voxelResolution;
    j["fill_mode"] = FillModeToString(decomposition.fillMode);
    j["detect_cavities"] = decomposition.detectCavities;
    j["max_vertices_per_hull"] = decomposition.maxVerticesPerHull;
    j["log_success"] = logSuccess;
    j["json_only"] = jsonOnly;
    j["combine_meshes"] = combineMeshes;
    return j;
}

std::expected<ConversionConfig, Error> ConversionConfig::LoadFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError("cannot open config file " + path.string()));
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError("failed to parse " + path.string() + ": " + e.what()));
    }

    ConversionConfig config;
    auto applied = config.ApplyJson(json);
    if (!applied) {
        return std::unexpected(applied.error());
    }

    HULLGEN_LOG_DEBUG("Loaded configuration from {}", path.string());
    return config;
}

} // namespace Hullgen
