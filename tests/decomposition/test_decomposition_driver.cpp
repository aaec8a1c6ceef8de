/**
 * @file test_decomposition_driver.cpp
 * @brief Unit tests for running the decomposition service over mesh groups
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "decomposition/DecompositionDriver.hpp"

#include "mocks/MockDecomposer.hpp"
#include "utils/TestFixtures.hpp"

#include <stdexcept>

using namespace Hullgen;
using namespace Hullgen::Test;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

namespace {

MeshGroup MakeGroup(const std::string& name, float z = 0.0f) {
    MeshGroup group;
    group.name = name;
    group.mesh.vertices = {glm::vec3(0, 0, z), glm::vec3(1, 0, z), glm::vec3(0, 1, z)};
    group.mesh.triangles = {{0, 1, 2}};
    return group;
}

std::vector<ConvexHull> Hulls(size_t count) {
    std::vector<ConvexHull> hulls;
    for (size_t i = 0; i < count; ++i) {
        hulls.push_back(MakeTetrahedronHull(glm::vec3(static_cast<float>(i), 0.0f, 0.0f)));
    }
    return hulls;
}

} // namespace

// =============================================================================
// Success Path
// =============================================================================

TEST(DecompositionDriverTest, CallsServiceOncePerGroupInOrder) {
    MockConvexDecomposer decomposer;
    {
        InSequence seq;
        EXPECT_CALL(decomposer, Decompose(Field(&RawMesh::vertices, ::testing::Contains(glm::vec3(0, 0, 1))), _))
            .WillOnce(Return(Hulls(2)));
        EXPECT_CALL(decomposer, Decompose(Field(&RawMesh::vertices, ::testing::Contains(glm::vec3(0, 0, 2))), _))
            .WillOnce(Return(Hulls(3)));
    }

    DecompositionResult result = DecomposeGroups({MakeGroup("A", 1.0f), MakeGroup("B", 2.0f)},
                                                 decomposer, DecompositionParameters{});

    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(2u, result.groups.size());
    EXPECT_EQ("A", result.groups[0].name);
    EXPECT_EQ(2u, result.groups[0].hulls.size());
    EXPECT_EQ("B", result.groups[1].name);
    EXPECT_EQ(3u, result.groups[1].hulls.size());
    EXPECT_EQ(5u, result.GetHullCount());
}

TEST(DecompositionDriverTest, KeepsServiceHullOrder) {
    MockConvexDecomposer decomposer;
    EXPECT_CALL(decomposer, Decompose(_, _)).WillOnce(Return(Hulls(3)));

    DecompositionResult result = DecomposeGroups({MakeGroup("A")}, decomposer, DecompositionParameters{});

    ASSERT_EQ(1u, result.groups.size());
    ASSERT_EQ(3u, result.groups[0].hulls.size());
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_FLOAT_EQ(static_cast<float>(i), result.groups[0].hulls[i].points[0].x);
    }
}

TEST(DecompositionDriverTest, PassesParametersThrough) {
    DecompositionParameters params;
    params.maxHulls = 7;
    params.voxelResolution = 32;
    params.fillMode = FillMode::Raycast;

    MockConvexDecomposer decomposer;
    EXPECT_CALL(decomposer, Decompose(_, ::testing::AllOf(
                    Field(&DecompositionParameters::maxHulls, 7u),
                    Field(&DecompositionParameters::voxelResolution, 32u),
                    Field(&DecompositionParameters::fillMode, FillMode::Raycast))))
        .WillOnce(Return(Hulls(1)));

    DecompositionResult result = DecomposeGroups({MakeGroup("A")}, decomposer, params);
    EXPECT_EQ(1u, result.GetHullCount());
}

TEST(DecompositionDriverTest, ZeroHullsIsNotAFailure) {
    MockConvexDecomposer decomposer;
    EXPECT_CALL(decomposer, Decompose(_, _)).WillOnce(Return(std::vector<ConvexHull>{}));

    DecompositionResult result = DecomposeGroups({MakeGroup("A")}, decomposer, DecompositionParameters{});

    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(1u, result.groups.size());
    EXPECT_TRUE(result.groups[0].hulls.empty());
}

// =============================================================================
// Failure Isolation
// =============================================================================

TEST(DecompositionDriverTest, ServiceErrorSkipsOnlyThatGroup) {
    MockConvexDecomposer decomposer;
    EXPECT_CALL(decomposer, Decompose(_, _))
        .WillOnce(Return(std::unexpected(Error(ErrorCode::DecompositionError, "no convergence"))))
        .WillOnce(Return(Hulls(1)));

    DecompositionResult result = DecomposeGroups({MakeGroup("Bad"), MakeGroup("Good")},
                                                 decomposer, DecompositionParameters{});

    ASSERT_EQ(1u, result.failures.size());
    EXPECT_EQ(ErrorCode::DecompositionError, result.failures[0].code);
    EXPECT_NE(std::string::npos, result.failures[0].message.find("Bad"));
    ASSERT_EQ(1u, result.groups.size());
    EXPECT_EQ("Good", result.groups[0].name);
}

TEST(DecompositionDriverTest, ThrownExceptionBecomesFailure) {
    MockConvexDecomposer decomposer;
    EXPECT_CALL(decomposer, Decompose(_, _))
        .WillOnce(Throw(std::runtime_error("voxelizer exploded")))
        .WillOnce(Return(Hulls(2)));

    DecompositionResult result = DecomposeGroups({MakeGroup("Bad"), MakeGroup("Good")},
                                                 decomposer, DecompositionParameters{});

    ASSERT_EQ(1u, result.failures.size());
    EXPECT_EQ(ErrorCode::DecompositionError, result.failures[0].code);
    EXPECT_NE(std::string::npos, result.failures[0].message.find("voxelizer exploded"));
    ASSERT_EQ(1u, result.groups.size());
    EXPECT_EQ(2u, result.groups[0].hulls.size());
}

TEST(DecompositionDriverTest, EmptyGroupNeverReachesService) {
    MockConvexDecomposer decomposer;
    EXPECT_CALL(decomposer, Decompose(_, _)).Times(0);

    MeshGroup empty;
    empty.name = "Empty";
    MeshGroup pointsOnly = MakeGroup("PointsOnly");
    pointsOnly.mesh.triangles.clear();

    DecompositionResult result = DecomposeGroups({empty, pointsOnly}, decomposer, DecompositionParameters{});

    EXPECT_TRUE(result.groups.empty());
    ASSERT_EQ(2u, result.failures.size());
    EXPECT_EQ(ErrorCode::DecompositionError, result.failures[0].code);
    EXPECT_EQ(ErrorCode::DecompositionError, result.failures[1].code);
}

// =============================================================================
// Parameter Helpers
// =============================================================================

TEST(FillModeTest, StringConversions) {
    EXPECT_STREQ("flood", FillModeToString(FillMode::FloodFill));
    EXPECT_STREQ("surface", FillModeToString(FillMode::SurfaceOnly));
    EXPECT_STREQ("raycast", FillModeToString(FillMode::Raycast));

    EXPECT_EQ(FillMode::FloodFill, FillModeFromString("flood"));
    EXPECT_EQ(FillMode::SurfaceOnly, FillModeFromString("surface_only"));
    EXPECT_EQ(FillMode::Raycast, FillModeFromString("raycast"));
    EXPECT_FALSE(FillModeFromString("solid").has_value());
}

TEST(DecompositionParametersTest, Defaults) {
    DecompositionParameters params;
    EXPECT_EQ(1024u, params.maxHulls);
    EXPECT_EQ(128u, params.voxelResolution);
    EXPECT_EQ(FillMode::FloodFill, params.fillMode);
    EXPECT_FALSE(params.detectCavities);
    EXPECT_EQ(FillMode::FloodFill, EffectiveFillMode(params));
}

TEST(DecompositionParametersTest, CavityDetectionRunsAsRaycastFill) {
    DecompositionParameters params;
    params.detectCavities = true;
    EXPECT_EQ(FillMode::Raycast, EffectiveFillMode(params));

    params.detectCavities = false;
    params.fillMode = FillMode::SurfaceOnly;
    EXPECT_EQ(FillMode::SurfaceOnly, EffectiveFillMode(params));
}
