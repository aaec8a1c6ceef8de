#pragma once

#include "config/ConversionConfig.hpp"
#include "core/Error.hpp"
#include "decomposition/ConvexDecomposer.hpp"
#include "scene/Scene.hpp"
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace Hullgen {

/**
 * @brief Outcome of a conversion run that was not aborted
 */
struct ConversionReport {
    std::vector<std::filesystem::path> filesWritten;
    std::vector<Error> failures;    ///< Per-mesh, per-group and per-file failures
    size_t meshCount = 0;
    size_t groupCount = 0;
    size_t hullCount = 0;

    [[nodiscard]] bool HasFailures() const { return !failures.empty(); }
};

/**
 * @brief Scene → world meshes → groups → hulls → files
 *
 * Runs sequentially: scene walk, optional mesh fusion, one decomposition
 * per group, then either one OBJ per hull or a single JSON document.
 * Invalid configuration, an unreadable scene and an unusable output
 * directory abort the run; every other failure is recorded in the report.
 */
class ConversionPipeline {
public:
    /**
     * @param config Run settings
     * @param decomposer Decomposition service; V-HACD when null
     */
    explicit ConversionPipeline(ConversionConfig config,
                                std::unique_ptr<IConvexDecomposer> decomposer = nullptr);
    ~ConversionPipeline();

    ConversionPipeline(const ConversionPipeline&) = delete;
    ConversionPipeline& operator=(const ConversionPipeline&) = delete;

    /**
     * @brief Load config.inputPath and convert it
     */
    [[nodiscard]] std::expected<ConversionReport, Error> Run();

    /**
     * @brief Convert an already loaded scene
     */
    [[nodiscard]] std::expected<ConversionReport, Error> Run(const Scene& scene);

    [[nodiscard]] const ConversionConfig& GetConfig() const { return m_config; }

private:
    void EmitObjFiles(const std::filesystem::path& directory,
                      const std::vector<DecomposedGroup>& groups,
                      ConversionReport& report) const;

    void EmitShapeDocument(const std::filesystem::path& directory,
                           const std::string& baseName,
                           const std::vector<DecomposedGroup>& groups,
                           ConversionReport& report) const;

    ConversionConfig m_config;
    std::unique_ptr<IConvexDecomposer> m_decomposer;
};

} // namespace Hullgen
