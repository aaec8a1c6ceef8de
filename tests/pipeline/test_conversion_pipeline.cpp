/**
 * @file test_conversion_pipeline.cpp
 * @brief End-to-end tests for the conversion pipeline with a stand-in decomposer
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "export/FileOutput.hpp"
#include "pipeline/ConversionPipeline.hpp"

#include "mocks/MockDecomposer.hpp"
#include "utils/TestFixtures.hpp"
#include "utils/TestHelpers.hpp"

#include <nlohmann/json.hpp>

using namespace Hullgen;
using namespace Hullgen::Test;
using json = nlohmann::json;
using ::testing::_;
using ::testing::Return;

// =============================================================================
// Fixture
// =============================================================================

class ConversionPipelineTest : public ScratchDirectoryTest {
protected:
    ConversionConfig MakeConfig() const {
        ConversionConfig config;
        config.outputDirectory = Directory();
        config.logSuccess = false;
        return config;
    }

    /**
     * @brief Run with a BoundingBoxDecomposer and keep a handle to it
     */
    std::expected<ConversionReport, Error> RunWithBoxes(const ConversionConfig& config,
                                                        const Scene& scene,
                                                        size_t hullsPerCall = 1) {
        auto decomposer = std::make_unique<BoundingBoxDecomposer>(hullsPerCall);
        m_decomposer = decomposer.get();
        m_pipeline = std::make_unique<ConversionPipeline>(config, std::move(decomposer));
        return m_pipeline->Run(scene);
    }

    int DecomposeCalls() const { return m_decomposer ? m_decomposer->GetCallCount() : 0; }

    std::unique_ptr<ConversionPipeline> m_pipeline;
    BoundingBoxDecomposer* m_decomposer = nullptr;     // owned by m_pipeline
};

// =============================================================================
// OBJ Mode
// =============================================================================

TEST_F(ConversionPipelineTest, SingleTriangleWritesOneObj) {
    Scene scene = MakeScene({MakeNode("node", MakeTriangleMesh("Tri"))});

    // The service hands back the triangle itself as the only hull
    ConvexHull triangleHull;
    triangleHull.points = {glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)};
    triangleHull.triangles = {{0, 1, 2}};

    auto decomposer = std::make_unique<MockConvexDecomposer>();
    EXPECT_CALL(*decomposer, Decompose(_, _))
        .WillOnce(Return(std::vector<ConvexHull>{triangleHull}));

    ConversionPipeline pipeline(MakeConfig(), std::move(decomposer));
    auto report = pipeline.Run(scene);
    ASSERT_TRUE(report.has_value()) << report.error().ToString();

    EXPECT_FALSE(report->HasFailures());
    EXPECT_EQ(1u, report->meshCount);
    EXPECT_EQ(1u, report->hullCount);
    ASSERT_EQ(1u, report->filesWritten.size());
    EXPECT_EQ(Directory() / "Tri0-shape.obj", report->filesWritten[0]);

    auto lines = SplitLines(ReadFileText(Directory() / "Tri0-shape.obj"));
    ASSERT_EQ(5u, lines.size());
    EXPECT_EQ("o Tri0", lines[0]);
    EXPECT_EQ("v 0 0 0", lines[1]);
    EXPECT_EQ("v 1 0 0", lines[2]);
    EXPECT_EQ("v 0 1 0", lines[3]);
    EXPECT_EQ("f 1 2 3", lines[4]);

    EXPECT_EQ((std::vector<std::string>{"Tri0-shape.obj"}), ListFileNames(Directory()));
}

TEST_F(ConversionPipelineTest, HullIndexNamesEachFile) {
    Scene scene = MakeScene({
        MakeNode("a", MakeTriangleMesh("Crate")),
        MakeNode("b", MakeTriangleMesh(""))
    });

    auto report = RunWithBoxes(MakeConfig(), scene, 3);
    ASSERT_TRUE(report.has_value());

    EXPECT_EQ(2, DecomposeCalls());
    EXPECT_EQ(6u, report->hullCount);
    EXPECT_EQ((std::vector<std::string>{
                  "Crate0-shape.obj", "Crate1-shape.obj", "Crate2-shape.obj",
                  "New Obj0-shape.obj", "New Obj1-shape.obj", "New Obj2-shape.obj"}),
              ListFileNames(Directory()));
}

TEST_F(ConversionPipelineTest, CustomSuffix) {
    ConversionConfig config = MakeConfig();
    config.appendSuffix = "_col";

    auto report = RunWithBoxes(config, MakeScene({MakeNode("a", MakeTriangleMesh("Rock"))}));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ((std::vector<std::string>{"Rock0_col.obj"}), ListFileNames(Directory()));
}

TEST_F(ConversionPipelineTest, CreatesMissingOutputDirectory) {
    ConversionConfig config = MakeConfig();
    config.outputDirectory = Directory() / "nested" / "out";

    auto report = RunWithBoxes(config, MakeScene({MakeNode("a", MakeTriangleMesh("Rock"))}));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(std::filesystem::exists(config.outputDirectory / "Rock0-shape.obj"));
}

// =============================================================================
// JSON Mode
// =============================================================================

TEST_F(ConversionPipelineTest, CombinedJsonOnlyWritesSingleDocument) {
    NodeTransform shifted;
    shifted.translation = glm::vec3(0.0f, 0.0f, 4.0f);

    Scene scene = MakeScene({
        MakeNode("a", MakeTriangleMesh("Left")),
        MakeNode("b", MakeTriangleMesh("Right"), shifted)
    }, "level01.gltf");

    ConversionConfig config = MakeConfig();
    config.combineMeshes = true;
    config.jsonOnly = true;

    auto report = RunWithBoxes(config, scene, 2);
    ASSERT_TRUE(report.has_value()) << report.error().ToString();

    EXPECT_EQ(1, DecomposeCalls());
    EXPECT_EQ(6u, m_decomposer->GetLastVertexCount());
    EXPECT_EQ(2u, m_decomposer->GetLastTriangleCount());
    EXPECT_EQ(1u, report->groupCount);
    EXPECT_EQ(2u, report->meshCount);

    EXPECT_EQ((std::vector<std::string>{"level01-shape.json"}), ListFileNames(Directory()));

    json doc = json::parse(ReadFileText(Directory() / "level01-shape.json"));
    ASSERT_EQ(report->hullCount, doc["shapes"].size());
    EXPECT_EQ(2u, doc["shapes"].size());

    // The fused box spans both nodes
    double maxZ = 0.0;
    for (const auto& p : doc["shapes"][0]["points"]) {
        maxZ = std::max(maxZ, p["z"].get<double>());
    }
    EXPECT_DOUBLE_EQ(4.0, maxZ);
}

TEST_F(ConversionPipelineTest, JsonNamedAfterInputPath) {
    ConversionConfig config = MakeConfig();
    config.jsonOnly = true;
    config.inputPath = "assets/harbour.glb";

    auto report = RunWithBoxes(config, MakeScene({MakeNode("a", MakeTriangleMesh("Pier"))}));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ((std::vector<std::string>{"harbour-shape.json"}), ListFileNames(Directory()));
}

TEST_F(ConversionPipelineTest, JsonOutputIsIdempotent) {
    ConversionConfig config = MakeConfig();
    config.jsonOnly = true;

    Scene scene = MakeScene({
        MakeNode("a", MakeTriangleMesh("One")),
        MakeNode("b", MakeTriangleMesh("Two"))
    });

    ASSERT_TRUE(RunWithBoxes(config, scene).has_value());
    std::string first = ReadFileText(Directory() / "scene-shape.json");

    ASSERT_TRUE(RunWithBoxes(config, scene).has_value());
    std::string second = ReadFileText(Directory() / "scene-shape.json");

    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
    EXPECT_EQ(1u, ListFileNames(Directory()).size());
}

TEST_F(ConversionPipelineTest, JsonWrittenEvenWithoutMeshes) {
    ConversionConfig config = MakeConfig();
    config.jsonOnly = true;

    auto report = RunWithBoxes(config, MakeScene({MakeNode("empty", std::nullopt)}));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(0, DecomposeCalls());

    json doc = json::parse(ReadFileText(Directory() / "scene-shape.json"));
    EXPECT_TRUE(doc["shapes"].empty());
}

// =============================================================================
// Failure Handling
// =============================================================================

TEST_F(ConversionPipelineTest, MalformedMeshIsReportedAndRunContinues) {
    MeshRef broken;
    broken.name = "Broken";
    broken.primitives.push_back(MakePrimitive(
        {glm::vec3(0), glm::vec3(1, 0, 0), glm::vec3(0, 1, 0)}, {0, 1, 2, 0}));

    Scene scene = MakeScene({
        MakeNode("bad", broken),
        MakeNode("good", MakeTriangleMesh("Fine"))
    });

    auto report = RunWithBoxes(MakeConfig(), scene);
    ASSERT_TRUE(report.has_value());

    ASSERT_TRUE(report->HasFailures());
    ASSERT_EQ(1u, report->failures.size());
    EXPECT_EQ(ErrorCode::MalformedMesh, report->failures[0].code);
    EXPECT_EQ(1, DecomposeCalls());
    EXPECT_EQ((std::vector<std::string>{"Fine0-shape.obj"}), ListFileNames(Directory()));
}

TEST_F(ConversionPipelineTest, DecompositionFailureSkipsGroup) {
    auto decomposer = std::make_unique<MockConvexDecomposer>();
    EXPECT_CALL(*decomposer, Decompose(_, _))
        .WillOnce(Return(std::unexpected(Error(ErrorCode::DecompositionError, "failed"))))
        .WillOnce(Return(std::vector<ConvexHull>{MakeTetrahedronHull()}));

    Scene scene = MakeScene({
        MakeNode("a", MakeTriangleMesh("First")),
        MakeNode("b", MakeTriangleMesh("Second"))
    });

    ConversionPipeline pipeline(MakeConfig(), std::move(decomposer));
    auto report = pipeline.Run(scene);
    ASSERT_TRUE(report.has_value());

    ASSERT_EQ(1u, report->failures.size());
    EXPECT_EQ(ErrorCode::DecompositionError, report->failures[0].code);
    EXPECT_EQ((std::vector<std::string>{"Second0-shape.obj"}), ListFileNames(Directory()));
}

TEST_F(ConversionPipelineTest, WriteFailureIsIsolatedPerFile) {
    // A directory squatting on the first hull's file name blocks that write only
    std::filesystem::create_directories(Directory() / "Crate0-shape.obj");

    auto report = RunWithBoxes(MakeConfig(), MakeScene({MakeNode("a", MakeTriangleMesh("Crate"))}), 2);
    ASSERT_TRUE(report.has_value());

    ASSERT_EQ(1u, report->failures.size());
    EXPECT_EQ(ErrorCode::WriteError, report->failures[0].code);
    ASSERT_EQ(1u, report->filesWritten.size());
    EXPECT_EQ(Directory() / "Crate1-shape.obj", report->filesWritten[0]);
}

TEST_F(ConversionPipelineTest, InvalidConfigIsFatal) {
    ConversionConfig config = MakeConfig();
    config.decomposition.maxHulls = 0;

    auto report = RunWithBoxes(config, MakeScene({MakeNode("a", MakeTriangleMesh("Rock"))}));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(ErrorCode::InvalidConfig, report.error().code);
    EXPECT_EQ(0, DecomposeCalls());
    EXPECT_TRUE(ListFileNames(Directory()).empty());
}

TEST_F(ConversionPipelineTest, UnusableOutputDirectoryIsFatal) {
    ASSERT_TRUE(WriteTextFile(Directory() / "file", "x").has_value());

    ConversionConfig config = MakeConfig();
    config.outputDirectory = Directory() / "file" / "out";

    auto report = RunWithBoxes(config, MakeScene({MakeNode("a", MakeTriangleMesh("Rock"))}));
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(ErrorCode::WriteError, report.error().code);
}

TEST_F(ConversionPipelineTest, MissingInputFileIsSceneLoadError) {
    ConversionConfig config = MakeConfig();
    config.inputPath = Directory() / "missing.glb";

    ConversionPipeline pipeline(config, std::make_unique<BoundingBoxDecomposer>());
    auto report = pipeline.Run();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(ErrorCode::SceneLoadError, report.error().code);
    EXPECT_TRUE(report.error().IsFatal());
}
