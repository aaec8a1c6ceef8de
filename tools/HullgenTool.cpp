/**
 * @file HullgenTool.cpp
 * @brief Command-line tool converting scene files into convex collision hulls
 *
 * Usage:
 *   hullgen --gltf_file scene.glb [options]
 *
 * Exit codes:
 *   0  success
 *   1  usage or configuration error
 *   2  the run was aborted (unreadable scene, unusable output directory)
 *   3  the run finished but some meshes, groups or files failed
 */

#include "config/ConversionConfig.hpp"
#include "core/Logger.hpp"
#include "pipeline/ConversionPipeline.hpp"
#include "pipeline/ExitStatus.hpp"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

using Hullgen::ExitStatus;
using Hullgen::ToExitCode;

// ============================================================================
// Configuration
// ============================================================================

struct ToolOptions {
    std::string configFile;
    std::string logFile;
    bool verbose = false;
    bool showHelp = false;
};

void PrintUsage() {
    std::cout << R"(
hullgen - Convert scene meshes into convex collision hulls

Usage:
  hullgen --gltf_file <file> [options]
  hullgen <file> [options]

Options:
  -g, --gltf_file <file>          Scene file to convert (.gltf, .glb, ...)

  -o, --output_directory <dir>    Where to write results
                                  Default: current working directory

  -a, --append <suffix>           String appended to created file names
                                  Default: -shape

  -m, --max_hulls <count>         Max number of hulls per mesh group
                                  Default: 1024

  -r, --voxel_resolution <n>      Voxels along each axis
                                  Default: 128

      --fill_mode <mode>          Voxel fill (flood, surface, raycast)
                                  Default: flood

      --detect_cavities [true|false]
                                  Keep enclosed voids hollow (flood only)
                                  Default: false

  -l, --log_success [true|false]  Log each file on creation
                                  Default: true

  -j, --json_only [true|false]    Write all hulls into a single JSON file
                                  Default: false

  -c, --combine_meshes [true|false]
                                  Fuse all meshes before decomposition
                                  Default: false

      --config <file.json>        Load settings from a JSON file first;
                                  command-line options override it

      --log_file <file>           Also write the log to a file

  -v, --verbose                   Print detailed progress

  -h, --help                      Show this help

Output:
  Per hull:   <mesh name><hull index><append>.obj
  JSON mode:  <input name><append>.json
)";
}

std::optional<bool> ParseBool(std::string_view str) {
    if (str == "true" || str == "1" || str == "yes" || str == "on") return true;
    if (str == "false" || str == "0" || str == "no" || str == "off") return false;
    return std::nullopt;
}

std::optional<uint32_t> ParsePositive(const std::string& str) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(str, &consumed);
        if (consumed != str.size() || value <= 0 || value > static_cast<long long>(UINT32_MAX)) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Argument Parsing
// ============================================================================

/**
 * @brief First pass: options that change how the rest is interpreted
 */
bool ParseToolOptions(int argc, char* argv[], ToolOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        }
        else if (arg == "--config") {
            if (i + 1 >= argc) return false;
            options.configFile = argv[++i];
        }
        else if (arg == "--log_file") {
            if (i + 1 >= argc) return false;
            options.logFile = argv[++i];
        }
    }
    return true;
}

/**
 * @brief Second pass: conversion settings on top of defaults or a config file
 */
bool ParseArguments(int argc, char* argv[], Hullgen::ConversionConfig& config) {
    bool haveInput = !config.inputPath.empty();

    auto readBool = [&](int& i, bool& target) {
        if (i + 1 < argc) {
            if (auto value = ParseBool(argv[i + 1])) {
                target = *value;
                ++i;
                return;
            }
        }
        target = true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h" || arg == "--verbose" || arg == "-v") {
            continue;
        }
        else if (arg == "--config" || arg == "--log_file") {
            ++i;
        }
        else if ((arg == "--gltf_file" || arg == "-g") && i + 1 < argc) {
            config.inputPath = argv[++i];
            haveInput = true;
        }
        else if ((arg == "--output_directory" || arg == "-o") && i + 1 < argc) {
            config.outputDirectory = argv[++i];
        }
        else if ((arg == "--append" || arg == "-a") && i + 1 < argc) {
            config.appendSuffix = argv[++i];
        }
        else if ((arg == "--max_hulls" || arg == "-m") && i + 1 < argc) {
            auto value = ParsePositive(argv[++i]);
            if (!value) {
                TOOL_LOG_ERROR("--max_hulls expects a positive integer, got '{}'", argv[i]);
                return false;
            }
            config.decomposition.maxHulls = *value;
        }
        else if ((arg == "--voxel_resolution" || arg == "-r") && i + 1 < argc) {
            auto value = ParsePositive(argv[++i]);
            if (!value) {
                TOOL_LOG_ERROR("--voxel_resolution expects a positive integer, got '{}'", argv[i]);
                return false;
            }
            config.decomposition.voxelResolution = *value;
        }
        else if (arg == "--fill_mode" && i + 1 < argc) {
            auto mode = Hullgen::FillModeFromString(argv[++i]);
            if (!mode) {
                TOOL_LOG_ERROR("Unknown fill mode '{}'", argv[i]);
                return false;
            }
            config.decomposition.fillMode = *mode;
        }
        else if (arg == "--detect_cavities") {
            readBool(i, config.decomposition.detectCavities);
        }
        else if (arg == "--log_success" || arg == "-l") {
            readBool(i, config.logSuccess);
        }
        else if (arg == "--json_only" || arg == "-j") {
            readBool(i, config.jsonOnly);
        }
        else if (arg == "--combine_meshes" || arg == "-c") {
            readBool(i, config.combineMeshes);
        }
        else if (!arg.empty() && arg[0] != '-' && !haveInput) {
            config.inputPath = arg;
            haveInput = true;
        }
        else {
            TOOL_LOG_ERROR("Unknown or incomplete option '{}'", arg);
            return false;
        }
    }

    if (!haveInput) {
        TOOL_LOG_ERROR("No input file given (--gltf_file)");
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    ToolOptions options;
    if (!ParseToolOptions(argc, argv, options)) {
        PrintUsage();
        return ToExitCode(ExitStatus::Usage);
    }
    if (options.showHelp || argc < 2) {
        PrintUsage();
        return ToExitCode(options.showHelp ? ExitStatus::Success : ExitStatus::Usage);
    }

    Hullgen::Logger::Initialize(options.logFile, true);
    if (options.verbose) {
        Hullgen::Logger::SetLevel(spdlog::level::debug);
    }

    Hullgen::ConversionConfig config;
    if (!options.configFile.empty()) {
        auto loaded = Hullgen::ConversionConfig::LoadFile(options.configFile);
        if (!loaded) {
            TOOL_LOG_ERROR("{}", loaded.error().ToString());
            Hullgen::Logger::Shutdown();
            return ToExitCode(ExitStatus::Usage);
        }
        config = std::move(*loaded);
    }

    if (!ParseArguments(argc, argv, config)) {
        PrintUsage();
        Hullgen::Logger::Shutdown();
        return ToExitCode(ExitStatus::Usage);
    }

    auto valid = config.Validate();
    if (!valid) {
        TOOL_LOG_ERROR("{}", valid.error().ToString());
        Hullgen::Logger::Shutdown();
        return ToExitCode(ExitStatus::Usage);
    }

    TOOL_LOG_DEBUG("Configuration: {}", config.ToJson().dump());

    Hullgen::ConversionPipeline pipeline(config);
    auto report = pipeline.Run();

    if (!report) {
        TOOL_LOG_CRITICAL("{}", report.error().ToString());
    } else {
        for (const auto& failure : report->failures) {
            TOOL_LOG_WARN("{}", failure.ToString());
        }
    }

    const ExitStatus status = Hullgen::ExitStatusFor(report);
    Hullgen::Logger::Shutdown();
    return ToExitCode(status);
}
