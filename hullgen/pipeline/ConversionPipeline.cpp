#include "pipeline/ConversionPipeline.hpp"
#include "core/Logger.hpp"
#include "decomposition/DecompositionDriver.hpp"
#include "decomposition/VhacdDecomposer.hpp"
#include "export/FileOutput.hpp"
#include "export/ObjWriter.hpp"
#include "export/ShapeDocument.hpp"
#include "mesh/MeshAggregator.hpp"
#include "scene/SceneLoader.hpp"
#include "scene/SceneWalker.hpp"

namespace Hullgen {

ConversionPipeline::ConversionPipeline(ConversionConfig config,
                                       std::unique_ptr<IConvexDecomposer> decomposer)
    : m_config(std::move(config))
    , m_decomposer(std::move(decomposer)) {
    if (!m_decomposer) {
        m_decomposer = std::make_unique<VhacdDecomposer>();
    }
}

ConversionPipeline::~ConversionPipeline() = default;

std::expected<ConversionReport, Error> ConversionPipeline::Run() {
    auto valid = m_config.Validate();
    if (!valid) {
        return std::unexpected(valid.error());
    }

    auto scene = SceneLoader::Load(m_config.inputPath);
    if (!scene) {
        return std::unexpected(scene.error());
    }
    return Run(*scene);
}

std::expected<ConversionReport, Error> ConversionPipeline::Run(const Scene& scene) {
    auto valid = m_config.Validate();
    if (!valid) {
        return std::unexpected(valid.error());
    }

    const auto outputDirectory = m_config.ResolveOutputDirectory();
    auto directoryReady = EnsureDirectory(outputDirectory);
    if (!directoryReady) {
        return std::unexpected(directoryReady.error());
    }

    ConversionReport report;

    // Scene → world-space meshes
    WalkResult walk = WalkScene(scene, m_config);
    report.meshCount = walk.meshes.size();
    report.failures.insert(report.failures.end(), walk.failures.begin(), walk.failures.end());

    if (walk.meshes.empty()) {
        HULLGEN_LOG_WARN("No meshes found in top-level nodes of {}", scene.sourcePath.string());
    }

    // World meshes → decomposition groups
    std::string baseName = m_config.InputBaseName();
    if (baseName.empty()) {
        baseName = scene.sourcePath.stem().string();
    }
    if (baseName.empty()) {
        baseName = m_config.placeholderName;
    }
    std::vector<MeshGroup> groups = GroupMeshes(std::move(walk.meshes), m_config.combineMeshes, baseName);
    report.groupCount = groups.size();

    // Groups → hulls
    DecompositionResult decomposition = DecomposeGroups(groups, *m_decomposer, m_config.decomposition);
    report.hullCount = decomposition.GetHullCount();
    report.failures.insert(report.failures.end(),
                           decomposition.failures.begin(), decomposition.failures.end());

    // Hulls → files
    if (m_config.jsonOnly) {
        EmitShapeDocument(outputDirectory, baseName, decomposition.groups, report);
    } else {
        EmitObjFiles(outputDirectory, decomposition.groups, report);
    }

    HULLGEN_LOG_INFO("Converted {} meshes into {} hulls across {} groups ({} files, {} failures)",
                     report.meshCount, report.hullCount, report.groupCount,
                     report.filesWritten.size(), report.failures.size());
    return report;
}

void ConversionPipeline::EmitObjFiles(const std::filesystem::path& directory,
                                      const std::vector<DecomposedGroup>& groups,
                                      ConversionReport& report) const {
    for (const auto& group : groups) {
        for (size_t i = 0; i < group.hulls.size(); ++i) {
            const std::string name = group.name + std::to_string(i);
            auto written = WriteHullObj(directory, name, m_config.appendSuffix, group.hulls[i]);
            if (!written) {
                HULLGEN_LOG_ERROR("{}", written.error().ToString());
                report.failures.push_back(written.error());
                continue;
            }
            if (m_config.logSuccess) {
                HULLGEN_LOG_INFO("Writing file {}", written->string());
            }
            report.filesWritten.push_back(*written);
        }
    }
}

void ConversionPipeline::EmitShapeDocument(const std::filesystem::path& directory,
                                           const std::string& baseName,
                                           const std::vector<DecomposedGroup>& groups,
                                           ConversionReport& report) const {
    auto written = WriteShapeDocument(directory, baseName, m_config.appendSuffix,
                                      BuildShapeDocument(groups));
    if (!written) {
        HULLGEN_LOG_ERROR("{}", written.error().ToString());
        report.failures.push_back(written.error());
        return;
    }
    if (m_config.logSuccess) {
        HULLGEN_LOG_INFO("Writing file {}", written->string());
    }
    report.filesWritten.push_back(*written);
}

} // namespace Hullgen
