/**
 * @file test_cleaning_stages.cpp
 * @brief Unit tests for the individual cleaning stages
 *
 * Validates:
 * - Curvature thresholds (strict comparisons, first stage wins)
 * - Neighbor variance (population variance, isolated vertices)
 * - Border ring dilation (exact hop distance, monotone in rings)
 * - Face max-aggregation
 * - Island selection over preliminarily kept faces only
 */

#include <gtest/gtest.h>
#include <backscan/cleaning/CleaningStages.hpp>
#include <backscan/core/Logger.hpp>
#include <cstdlib>

using namespace backscan;
using namespace backscan::cleaning;

namespace {

// Path 0-1-2-...-(n-1)
mesh::AdjacencyGraph makePath(int n) {
    std::vector<std::vector<int>> lists(n);
    for (int i = 0; i + 1 < n; ++i) {
        lists[i].push_back(i + 1);
        lists[i + 1].push_back(i);
    }
    return mesh::AdjacencyGraph::fromNeighborLists(lists);
}

mesh::ClusterAssignment makeClusters(const std::vector<int>& ids) {
    mesh::ClusterAssignment clusters;
    clusters.faceCluster = ids;
    for (int id : ids) {
        if (static_cast<size_t>(id) >= clusters.clusterFaceCounts.size()) {
            clusters.clusterFaceCounts.resize(id + 1, 0);
        }
        clusters.clusterFaceCounts[id]++;
    }
    return clusters;
}

} // namespace

class CleaningStagesTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }
};

// ============================================================================
// Stage 1: curvature
// ============================================================================

TEST_F(CleaningStagesTest, CurvatureMarksOnlyOutOfRangeVertices) {
    const std::vector<double> curvature = {0.1, -0.2, 0, 0, 0, 0, 0, 0, 0, 0};
    VertexReasonBuffer reasons(10, VertexReason::Kept);

    const size_t marked = applyCurvatureStage(curvature, 0.05, -0.1, reasons);

    EXPECT_EQ(marked, 2u);
    EXPECT_EQ(reasons[0], VertexReason::Curvature);
    EXPECT_EQ(reasons[1], VertexReason::Curvature);
    for (size_t v = 2; v < reasons.size(); ++v) {
        EXPECT_EQ(reasons[v], VertexReason::Kept) << "vertex " << v;
    }
}

TEST_F(CleaningStagesTest, CurvatureThresholdsAreStrict) {
    const std::vector<double> curvature = {0.05, -0.1, 0.0500001, -0.1000001};
    VertexReasonBuffer reasons(4, VertexReason::Kept);

    applyCurvatureStage(curvature, 0.05, -0.1, reasons);

    EXPECT_EQ(reasons[0], VertexReason::Kept);
    EXPECT_EQ(reasons[1], VertexReason::Kept);
    EXPECT_EQ(reasons[2], VertexReason::Curvature);
    EXPECT_EQ(reasons[3], VertexReason::Curvature);
}

TEST_F(CleaningStagesTest, CurvatureDoesNotOverwriteMarkedVertices) {
    const std::vector<double> curvature = {1.0, 1.0};
    VertexReasonBuffer reasons = {VertexReason::Border, VertexReason::Kept};

    EXPECT_EQ(applyCurvatureStage(curvature, 0.05, -0.1, reasons), 1u);
    EXPECT_EQ(reasons[0], VertexReason::Border);
    EXPECT_EQ(reasons[1], VertexReason::Curvature);
}

// ============================================================================
// Stage 2: variance
// ============================================================================

TEST_F(CleaningStagesTest, NeighborVarianceExcludesCenterVertex) {
    // Star: 0 is connected to 1, 2, 3
    const mesh::AdjacencyGraph star = mesh::AdjacencyGraph::fromNeighborLists({{1, 2, 3}, {0}, {0}, {0}});
    const std::vector<double> curvature = {100.0, 1.0, 2.0, 3.0};

    // Population variance of {1, 2, 3} = 2/3
    EXPECT_NEAR(neighborCurvatureVariance(star, curvature, 0), 2.0 / 3.0, 1e-12);
    // Single neighbor: variance 0
    EXPECT_DOUBLE_EQ(neighborCurvatureVariance(star, curvature, 1), 0.0);
}

TEST_F(CleaningStagesTest, IsolatedVertexHasZeroVarianceAndIsNotMarked) {
    const mesh::AdjacencyGraph graph = mesh::AdjacencyGraph::fromNeighborLists({{1}, {0}, {}});
    const std::vector<double> curvature = {0.0, 10.0, 5.0};
    VertexReasonBuffer reasons(3, VertexReason::Kept);

    EXPECT_DOUBLE_EQ(neighborCurvatureVariance(graph, curvature, 2), 0.0);
    EXPECT_EQ(applyVarianceStage(curvature, graph, 0.001, reasons), 0u);
    for (VertexReason r : reasons) {
        EXPECT_EQ(r, VertexReason::Kept);
    }
}

TEST_F(CleaningStagesTest, VarianceMarksOnlyKeptVerticesAboveThreshold) {
    // Vertex 1 sees {0.0, 0.2}: variance 0.01. Vertex 2 sees {0.1, 0.1}: variance 0
    const mesh::AdjacencyGraph path = makePath(4);
    const std::vector<double> curvature = {0.0, 0.1, 0.2, 0.1};
    VertexReasonBuffer reasons = {VertexReason::Kept, VertexReason::Kept,
                                  VertexReason::Kept, VertexReason::Curvature};

    const std::vector<double> variances = computeNeighborVariances(path, curvature);
    ASSERT_EQ(variances.size(), 4u);
    EXPECT_NEAR(variances[1], 0.01, 1e-12);
    EXPECT_NEAR(variances[2], 0.0, 1e-12);

    const size_t marked = applyVarianceStage(curvature, path, 0.001, reasons);
    EXPECT_EQ(marked, 1u);
    EXPECT_EQ(reasons[0], VertexReason::Kept);
    EXPECT_EQ(reasons[1], VertexReason::Variance);
    EXPECT_EQ(reasons[2], VertexReason::Kept);
    EXPECT_EQ(reasons[3], VertexReason::Curvature);
}

// ============================================================================
// Stage 3: border dilation
// ============================================================================

TEST_F(CleaningStagesTest, ZeroRingsMarksExactlyTheSeeds) {
    const mesh::AdjacencyGraph path = makePath(10);
    VertexReasonBuffer reasons(10, VertexReason::Kept);

    const size_t marked = applyBorderStage({3, 7}, path, 0, reasons);

    EXPECT_EQ(marked, 2u);
    for (int v = 0; v < 10; ++v) {
        const VertexReason expected = (v == 3 || v == 7) ? VertexReason::Border : VertexReason::Kept;
        EXPECT_EQ(reasons[v], expected) << "vertex " << v;
    }
}

TEST_F(CleaningStagesTest, EachRingAddsExactlyOneHop) {
    const mesh::AdjacencyGraph path = makePath(20);

    for (unsigned int rings = 0; rings <= 4; ++rings) {
        const std::vector<uint8_t> region = dilateBorderRegion(path, {10}, rings);
        for (int v = 0; v < 20; ++v) {
            const bool inside = std::abs(v - 10) <= static_cast<int>(rings);
            EXPECT_EQ(region[v] != 0, inside) << "rings " << rings << ", vertex " << v;
        }
    }
}

TEST_F(CleaningStagesTest, RegionGrowsMonotonicallyWithRings) {
    // Small grid-like graph: two paths joined at one end
    const mesh::AdjacencyGraph graph = mesh::AdjacencyGraph::fromNeighborLists(
        {{1, 5}, {0, 2}, {1, 3}, {2, 4}, {3}, {0, 6}, {5, 7}, {6}});

    std::vector<uint8_t> previous = dilateBorderRegion(graph, {4}, 0);
    for (unsigned int rings = 1; rings <= 8; ++rings) {
        const std::vector<uint8_t> current = dilateBorderRegion(graph, {4}, rings);
        for (size_t v = 0; v < current.size(); ++v) {
            if (previous[v]) {
                EXPECT_TRUE(current[v]) << "vertex " << v << " lost at rings " << rings;
            }
        }
        previous = current;
    }
    // Farthest vertex (7) is 7 hops from 4
    EXPECT_FALSE(dilateBorderRegion(graph, {4}, 6)[7]);
    EXPECT_TRUE(dilateBorderRegion(graph, {4}, 7)[7]);
}

TEST_F(CleaningStagesTest, EmptySeedSetMarksNothing) {
    const mesh::AdjacencyGraph path = makePath(5);
    VertexReasonBuffer reasons(5, VertexReason::Kept);

    EXPECT_EQ(applyBorderStage({}, path, 5, reasons), 0u);
    for (VertexReason r : reasons) {
        EXPECT_EQ(r, VertexReason::Kept);
    }
}

TEST_F(CleaningStagesTest, BorderKeepsEarlierReasons) {
    const mesh::AdjacencyGraph path = makePath(5);
    VertexReasonBuffer reasons = {VertexReason::Kept, VertexReason::Curvature, VertexReason::Kept,
                                  VertexReason::Variance, VertexReason::Kept};

    // Two rings from 0 reach {0, 1, 2}; vertex 1 is already Curvature
    const size_t marked = applyBorderStage({0}, path, 2, reasons);

    EXPECT_EQ(marked, 2u);
    EXPECT_EQ(reasons[0], VertexReason::Border);
    EXPECT_EQ(reasons[1], VertexReason::Curvature);
    EXPECT_EQ(reasons[2], VertexReason::Border);
    EXPECT_EQ(reasons[3], VertexReason::Variance);
    EXPECT_EQ(reasons[4], VertexReason::Kept);
}

// ============================================================================
// Face aggregation
// ============================================================================

TEST_F(CleaningStagesTest, FaceTakesNumericMaxOfVertexReasons) {
    const VertexReasonBuffer vertexReasons = {VertexReason::Kept, VertexReason::Curvature,
                                              VertexReason::Variance, VertexReason::Border};
    const std::vector<cv::Vec3i> faces = {
        cv::Vec3i(0, 0, 0),
        cv::Vec3i(0, 1, 0),
        cv::Vec3i(1, 2, 0),
        cv::Vec3i(3, 1, 2),
        cv::Vec3i(2, 0, 0)
    };

    const FaceReasonBuffer faceReasons = aggregateFaceReasons(faces, vertexReasons);

    ASSERT_EQ(faceReasons.size(), faces.size());
    EXPECT_EQ(faceReasons[0], FaceReason::Kept);
    EXPECT_EQ(faceReasons[1], FaceReason::Curvature);
    EXPECT_EQ(faceReasons[2], FaceReason::Variance);
    EXPECT_EQ(faceReasons[3], FaceReason::Border);
    EXPECT_EQ(faceReasons[4], FaceReason::Variance);
}

// ============================================================================
// Stage 4: islands
// ============================================================================

TEST_F(CleaningStagesTest, IslandCountsOnlyPreliminarilyKeptFaces) {
    // Cluster 0 has 10 faces but only 2 kept; cluster 1 has 6 kept faces
    std::vector<int> ids(16);
    FaceReasonBuffer faceReasons(16, FaceReason::Kept);
    for (int f = 0; f < 10; ++f) {
        ids[f] = 0;
        if (f >= 2) faceReasons[f] = FaceReason::Border;
    }
    for (int f = 10; f < 16; ++f) {
        ids[f] = 1;
    }

    const IslandSelection selection = applyIslandStage(makeClusters(ids), faceReasons);

    EXPECT_EQ(selection.keptCluster, 1);
    EXPECT_EQ(selection.keptClusterFaces, 6u);
    EXPECT_EQ(selection.islandClusters, 1u);
    EXPECT_EQ(selection.facesMarked, 2u);
    EXPECT_EQ(faceReasons[0], FaceReason::Island);
    EXPECT_EQ(faceReasons[1], FaceReason::Island);
    for (int f = 2; f < 10; ++f) {
        EXPECT_EQ(faceReasons[f], FaceReason::Border);
    }
    for (int f = 10; f < 16; ++f) {
        EXPECT_EQ(faceReasons[f], FaceReason::Kept);
    }
}

TEST_F(CleaningStagesTest, SingleClusterMarksNothing) {
    FaceReasonBuffer faceReasons = {FaceReason::Kept, FaceReason::Curvature, FaceReason::Kept};
    const FaceReasonBuffer before = faceReasons;

    const IslandSelection selection = applyIslandStage(makeClusters({0, 0, 0}), faceReasons);

    EXPECT_EQ(selection.keptCluster, 0);
    EXPECT_EQ(selection.facesMarked, 0u);
    EXPECT_EQ(faceReasons, before);
}

TEST_F(CleaningStagesTest, NoKeptFacesIsNoOp) {
    FaceReasonBuffer faceReasons = {FaceReason::Curvature, FaceReason::Border};
    const FaceReasonBuffer before = faceReasons;

    const IslandSelection selection = applyIslandStage(makeClusters({0, 1}), faceReasons);

    EXPECT_EQ(selection.keptCluster, -1);
    EXPECT_EQ(selection.facesMarked, 0u);
    EXPECT_EQ(faceReasons, before);
}

TEST_F(CleaningStagesTest, IslandTieGoesToLowestClusterId) {
    // Clusters 2 and 5 both have 3 kept faces; 7 has 1
    FaceReasonBuffer faceReasons(7, FaceReason::Kept);
    const mesh::ClusterAssignment clusters = makeClusters({5, 2, 5, 2, 7, 5, 2});

    const IslandSelection selection = applyIslandStage(clusters, faceReasons);

    EXPECT_EQ(selection.keptCluster, 2);
    EXPECT_EQ(selection.islandClusters, 2u);
    EXPECT_EQ(selection.facesMarked, 4u);
    for (size_t f = 0; f < faceReasons.size(); ++f) {
        const FaceReason expected = clusters.faceCluster[f] == 2 ? FaceReason::Kept : FaceReason::Island;
        EXPECT_EQ(faceReasons[f], expected) << "face " << f;
    }
}

TEST_F(CleaningStagesTest, ReasonColorsMatchLegend) {
    EXPECT_EQ(reasonColor(FaceReason::Kept), cv::Vec3b(0x90, 0x90, 0x90));
    EXPECT_EQ(reasonColor(FaceReason::Curvature), cv::Vec3b(0xe6, 0x39, 0x46));
    EXPECT_EQ(reasonColor(FaceReason::Variance), cv::Vec3b(0xf4, 0xa2, 0x61));
    EXPECT_EQ(reasonColor(FaceReason::Border), cv::Vec3b(0xe9, 0xc4, 0x6a));
    EXPECT_EQ(reasonColor(FaceReason::Island), cv::Vec3b(0x45, 0x7b, 0x9d));
    EXPECT_EQ(reasonColor(VertexReason::Border), reasonColor(FaceReason::Border));
    EXPECT_EQ(legendLabel(FaceReason::Island), "Removed: Isolated Island");
    EXPECT_EQ(toCodes(FaceReasonBuffer{FaceReason::Island, FaceReason::Kept}),
              (std::vector<uint8_t>{4, 0}));
}
