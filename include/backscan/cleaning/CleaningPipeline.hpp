#pragma once

#include "backscan/cleaning/CleaningConfig.hpp"
#include "backscan/cleaning/CleaningStages.hpp"
#include "backscan/cleaning/RemovalReason.hpp"
#include "backscan/mesh/AdjacencyGraph.hpp"
#include "backscan/mesh/ComponentClusterer.hpp"
#include "backscan/mesh/TriangleMesh.hpp"
#include <array>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace backscan {
namespace cleaning {

/**
 * @brief Per-vertex and per-face classification with statistics
 */
struct CleaningResult {
    VertexReasonBuffer vertexReasons;
    FaceReasonBuffer faceReasons;

    // Elements newly marked by each stage
    size_t curvatureMarked = 0;
    size_t varianceMarked = 0;
    size_t borderMarked = 0;
    size_t borderSeeds = 0;
    IslandSelection islands;

    // Face histogram by FaceReason code
    std::array<size_t, kFaceReasonCount> faceReasonCounts{};

    double processingTimeMs = 0.0;
    std::map<std::string, double> stageTimesMs;

    size_t verticesKept() const;
    size_t facesKept() const { return faceReasonCounts[0]; }

    /**
     * @brief Percentage of faces with a non-Kept reason
     */
    double getRemovedFacePercentage() const {
        if (faceReasons.empty()) return 0.0;
        return 100.0 * static_cast<double>(faceReasons.size() - facesKept()) /
               static_cast<double>(faceReasons.size());
    }

    std::string toString() const;
};

/**
 * @brief Multi-stage classification of scan vertices and faces
 *
 * Stage order is fixed: curvature -> variance -> border on the vertex
 * buffer, then face aggregation, then island removal. A disabled stage
 * leaves the buffers untouched. The pipeline holds no state between
 * runs; identical inputs give identical results.
 */
class CleaningPipeline {
public:
    /**
     * @throws core::ConfigException if config.validate() fails
     */
    explicit CleaningPipeline(const CleaningConfig& config = CleaningConfig());

    /**
     * @brief Run with every collaborator supplied by the caller
     *
     * boundarySeeds is only read when the border stage is enabled and
     * clusters only when the island stage is enabled.
     *
     * @throws core::InputException before any stage runs if the mesh is
     *         empty or invalid, curvature.size() != V, adjacency does not
     *         cover V vertices, a seed is out of range, or
     *         clusters.faceCluster.size() != F
     */
    CleaningResult run(const mesh::TriangleMesh& mesh,
                       const std::vector<double>& curvature,
                       const mesh::AdjacencyGraph& adjacency,
                       const std::vector<int>& boundarySeeds,
                       const mesh::ClusterAssignment& clusters) const;

    /**
     * @brief Run with built-in adjacency, boundary detection and clustering
     *
     * Collaborators for disabled stages are not built.
     */
    CleaningResult run(const mesh::TriangleMesh& mesh,
                       const std::vector<double>& curvature) const;

    const CleaningConfig& getConfig() const { return config_; }

    /**
     * @brief Set cleaning progress callback
     * @param callback Function called with progress percentage (0-100)
     */
    void setProgressCallback(std::function<void(int)> callback) {
        progressCallback_ = std::move(callback);
    }

private:
    void validateInputs(const mesh::TriangleMesh& mesh,
                        const std::vector<double>& curvature,
                        const mesh::AdjacencyGraph* adjacency,
                        const std::vector<int>* boundarySeeds,
                        const mesh::ClusterAssignment* clusters) const;

    CleaningResult runStages(const mesh::TriangleMesh& mesh,
                             const std::vector<double>& curvature,
                             const mesh::AdjacencyGraph* adjacency,
                             const std::vector<int>* boundarySeeds,
                             const mesh::ClusterAssignment* clusters) const;

    void updateProgress(int progress) const {
        if (progressCallback_) {
            progressCallback_(progress);
        }
    }

    CleaningConfig config_;
    std::function<void(int)> progressCallback_;
};

} // namespace cleaning
} // namespace backscan
