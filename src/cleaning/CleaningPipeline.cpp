#include "backscan/cleaning/CleaningPipeline.hpp"
#include "backscan/mesh/BoundaryDetector.hpp"
#include "backscan/core/exception.h"
#include "backscan/core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace backscan {
namespace cleaning {

namespace {

using Clock = std::chrono::high_resolution_clock;

double elapsedMs(const core::Timestamp& start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

} // namespace

// ============================================================================
// CleaningResult
// ============================================================================

size_t CleaningResult::verticesKept() const {
    return static_cast<size_t>(std::count(vertexReasons.begin(), vertexReasons.end(),
                                          VertexReason::Kept));
}

std::string CleaningResult::toString() const {
    std::stringstream ss;
    ss << "Mesh Cleaning Result:\n";
    ss << "  Processing Time: " << std::fixed << std::setprecision(2) << processingTimeMs << " ms\n";
    ss << "\nVertex Statistics:\n";
    ss << "  Total: " << vertexReasons.size() << "\n";
    ss << "  Kept: " << verticesKept() << "\n";
    ss << "  Curvature: " << curvatureMarked << "\n";
    ss << "  Variance: " << varianceMarked << "\n";
    ss << "  Border: " << borderMarked << " (from " << borderSeeds << " seeds)\n";
    ss << "\nFace Statistics:\n";
    ss << "  Total: " << faceReasons.size() << "\n";
    for (int code = 0; code < kFaceReasonCount; ++code) {
        ss << "  " << cleaning::toString(static_cast<FaceReason>(code)) << ": " << faceReasonCounts[code] << "\n";
    }
    ss << "  Removed: " << std::setprecision(1) << getRemovedFacePercentage() << "%";
    if (islands.keptCluster >= 0) {
        ss << "\n  Main Component: #" << islands.keptCluster << " (" << islands.keptClusterFaces
           << " kept faces, " << islands.islandClusters << " islands)";
    }
    return ss.str();
}

// ============================================================================
// CleaningPipeline
// ============================================================================

CleaningPipeline::CleaningPipeline(const CleaningConfig& config)
    : config_(config) {
    const std::string error = config_.validationError();
    if (!error.empty()) {
        BACKSCAN_THROW(core::ConfigException, "Invalid cleaning configuration: " + error);
    }
}

void CleaningPipeline::validateInputs(const mesh::TriangleMesh& mesh,
                                      const std::vector<double>& curvature,
                                      const mesh::AdjacencyGraph* adjacency,
                                      const std::vector<int>* boundarySeeds,
                                      const mesh::ClusterAssignment* clusters) const {
    mesh.validate();

    const size_t vertexCount = mesh.numVertices();
    if (curvature.size() != vertexCount) {
        BACKSCAN_THROW(core::InputException,
                       "Curvature has " + std::to_string(curvature.size()) + " values for " +
                       std::to_string(vertexCount) + " vertices");
    }

    if (adjacency && adjacency->vertexCount() != vertexCount) {
        BACKSCAN_THROW(core::InputException,
                       "Adjacency covers " + std::to_string(adjacency->vertexCount()) +
                       " vertices, mesh has " + std::to_string(vertexCount));
    }

    if (boundarySeeds) {
        for (int seed : *boundarySeeds) {
            if (seed < 0 || static_cast<size_t>(seed) >= vertexCount) {
                BACKSCAN_THROW(core::InputException,
                               "Boundary seed " + std::to_string(seed) + " is out of range");
            }
        }
    }

    if (clusters) {
        if (clusters->faceCluster.size() != mesh.numFaces()) {
            BACKSCAN_THROW(core::InputException,
                           "Cluster assignment has " + std::to_string(clusters->faceCluster.size()) +
                           " entries for " + std::to_string(mesh.numFaces()) + " faces");
        }
        for (int id : clusters->faceCluster) {
            if (id < 0) {
                BACKSCAN_THROW(core::InputException, "Negative cluster id " + std::to_string(id));
            }
        }
    }
}

CleaningResult CleaningPipeline::run(const mesh::TriangleMesh& mesh,
                                     const std::vector<double>& curvature,
                                     const mesh::AdjacencyGraph& adjacency,
                                     const std::vector<int>& boundarySeeds,
                                     const mesh::ClusterAssignment& clusters) const {
    const bool needsAdjacency = config_.clean_by_variance || config_.clean_borders;
    return runStages(mesh, curvature,
                     needsAdjacency ? &adjacency : nullptr,
                     config_.clean_borders ? &boundarySeeds : nullptr,
                     config_.remove_islands ? &clusters : nullptr);
}

CleaningResult CleaningPipeline::run(const mesh::TriangleMesh& mesh,
                                     const std::vector<double>& curvature) const {
    // Reject bad shapes before spending time on topology
    validateInputs(mesh, curvature, nullptr, nullptr, nullptr);

    mesh::AdjacencyGraph adjacency;
    std::vector<int> seeds;
    mesh::ClusterAssignment clusters;

    const bool needsAdjacency = config_.clean_by_variance || config_.clean_borders;
    if (needsAdjacency) {
        adjacency = mesh::AdjacencyGraph::fromMesh(mesh);
    }
    if (config_.clean_borders) {
        mesh::BoundaryDetector detector;
        mesh::BoundaryReport report = detector.analyze(mesh);
        LOG_INFO(report.toString());
        seeds = std::move(report.seeds);
    }
    if (config_.remove_islands) {
        mesh::ComponentClusterer clusterer;
        clusters = clusterer.cluster(mesh);
        LOG_INFO(clusters.toString());
    }

    return runStages(mesh, curvature,
                     needsAdjacency ? &adjacency : nullptr,
                     config_.clean_borders ? &seeds : nullptr,
                     config_.remove_islands ? &clusters : nullptr);
}

CleaningResult CleaningPipeline::runStages(const mesh::TriangleMesh& mesh,
                                           const std::vector<double>& curvature,
                                           const mesh::AdjacencyGraph* adjacency,
                                           const std::vector<int>* boundarySeeds,
                                           const mesh::ClusterAssignment* clusters) const {
    validateInputs(mesh, curvature, adjacency, boundarySeeds, clusters);

    const auto totalStart = Clock::now();
    LOG_INFO(config_.toString());

    CleaningResult result;
    result.vertexReasons.assign(mesh.numVertices(), VertexReason::Kept);
    updateProgress(0);

    if (config_.clean_by_curvature) {
        const auto start = Clock::now();
        LOG_INFO("Stage 1: Cleaning by absolute curvature...");
        result.curvatureMarked = applyCurvatureStage(curvature, config_.curv_high_thresh,
                                                     config_.curv_low_thresh, result.vertexReasons);
        result.stageTimesMs["curvature"] = elapsedMs(start);
        LOG_INFO("Marked " + std::to_string(result.curvatureMarked) + " vertices for 'Curvature'");
    }
    updateProgress(20);

    if (config_.clean_by_variance) {
        const auto start = Clock::now();
        LOG_INFO("Stage 2: Cleaning by curvature variance...");
        result.varianceMarked = applyVarianceStage(curvature, *adjacency, config_.variance_thresh,
                                                   result.vertexReasons);
        result.stageTimesMs["variance"] = elapsedMs(start);
        LOG_INFO("Marked " + std::to_string(result.varianceMarked) + " new vertices for 'Variance'");
    }
    updateProgress(45);

    if (config_.clean_borders) {
        const auto start = Clock::now();
        LOG_INFO("Stage 3: Cleaning mesh borders...");
        result.borderSeeds = boundarySeeds->size();
        if (boundarySeeds->empty()) {
            LOG_INFO("No boundary vertices, border stage has nothing to dilate");
        }
        result.borderMarked = applyBorderStage(*boundarySeeds, *adjacency,
                                               static_cast<unsigned int>(config_.border_rings),
                                               result.vertexReasons);
        result.stageTimesMs["border"] = elapsedMs(start);
        LOG_INFO("Marked " + std::to_string(result.borderMarked) + " new vertices for 'Border'");
    }
    updateProgress(70);

    {
        const auto start = Clock::now();
        result.faceReasons = aggregateFaceReasons(mesh.faces, result.vertexReasons);
        result.stageTimesMs["aggregation"] = elapsedMs(start);
        LOG_TRACE("Aggregated " + std::to_string(result.faceReasons.size()) + " face reasons");
    }
    updateProgress(80);

    if (config_.remove_islands) {
        const auto start = Clock::now();
        LOG_INFO("Stage 4: Identifying isolated islands...");
        result.islands = applyIslandStage(*clusters, result.faceReasons);
        result.stageTimesMs["islands"] = elapsedMs(start);
        if (result.islands.keptCluster < 0) {
            LOG_INFO("No preliminarily kept faces, island stage skipped");
        } else {
            LOG_INFO("Marked " + std::to_string(result.islands.facesMarked) + " faces as 'Islands'");
        }
    }

    for (FaceReason reason : result.faceReasons) {
        result.faceReasonCounts[toCode(reason)]++;
    }

    result.processingTimeMs = elapsedMs(totalStart);
    updateProgress(100);

    BACKSCAN_LOG_INFO("CleaningPipeline") << "Done in " << std::fixed << std::setprecision(2)
                                          << result.processingTimeMs << " ms: "
                                          << result.facesKept() << "/" << result.faceReasons.size()
                                          << " faces kept";
    return result;
}

} // namespace cleaning
} // namespace backscan
