#pragma once

#include "backscan/cleaning/RemovalReason.hpp"
#include "backscan/mesh/AdjacencyGraph.hpp"
#include "backscan/mesh/ComponentClusterer.hpp"
#include <cstdint>
#include <vector>

namespace backscan {
namespace cleaning {

/**
 * Individual cleaning stages.
 *
 * Vertex stages write only into vertices that are still Kept, so the
 * first stage that flags a vertex decides its reason. Inputs are never
 * modified. Sizes are assumed consistent; CleaningPipeline validates them.
 */

/**
 * @brief Stage 1: flag vertices with curvature above high or below low
 * @return number of vertices newly marked Curvature
 */
size_t applyCurvatureStage(const std::vector<double>& curvature,
                           double highThreshold,
                           double lowThreshold,
                           VertexReasonBuffer& reasons);

/**
 * @brief Population variance of the curvature of v's direct neighbors
 *
 * v itself is not included. 0 when v has no neighbors.
 */
double neighborCurvatureVariance(const mesh::AdjacencyGraph& adjacency,
                                 const std::vector<double>& curvature,
                                 int v);

/**
 * @brief neighborCurvatureVariance for every vertex (OpenMP-parallel)
 */
std::vector<double> computeNeighborVariances(const mesh::AdjacencyGraph& adjacency,
                                             const std::vector<double>& curvature);

/**
 * @brief Stage 2: flag Kept vertices whose neighbor variance exceeds threshold
 * @return number of vertices newly marked Variance
 */
size_t applyVarianceStage(const std::vector<double>& curvature,
                          const mesh::AdjacencyGraph& adjacency,
                          double varianceThreshold,
                          VertexReasonBuffer& reasons);

/**
 * @brief Vertices within graph distance <= rings of any seed
 *
 * Each ring adds exactly one hop, i.e. ring k expands only from the
 * vertices that were in the region when ring k started. rings == 0
 * returns the seeds themselves.
 *
 * @return mask of size adjacency.vertexCount(), 1 = border region
 */
std::vector<uint8_t> dilateBorderRegion(const mesh::AdjacencyGraph& adjacency,
                                        const std::vector<int>& seeds,
                                        unsigned int rings);

/**
 * @brief Stage 3: dilate the seeds and flag Kept vertices in the region
 * @return number of vertices newly marked Border
 */
size_t applyBorderStage(const std::vector<int>& boundarySeeds,
                        const mesh::AdjacencyGraph& adjacency,
                        unsigned int rings,
                        VertexReasonBuffer& reasons);

/**
 * @brief Face reason = numeric max of its three vertex reasons
 */
FaceReasonBuffer aggregateFaceReasons(const std::vector<cv::Vec3i>& faces,
                                      const VertexReasonBuffer& vertexReasons);

/**
 * @brief Outcome of the island stage
 */
struct IslandSelection {
    int keptCluster = -1;         // cluster holding most preliminarily kept faces, -1 if none
    size_t keptClusterFaces = 0;  // its preliminarily kept face count
    size_t islandClusters = 0;    // other clusters that still had kept faces
    size_t facesMarked = 0;       // faces demoted to Island
};

/**
 * @brief Stage 4: demote kept faces outside the largest kept cluster
 *
 * Only faces whose reason is Kept take part; cluster size counts only
 * those faces. Ties go to the lowest cluster id. No kept faces -> no-op.
 */
IslandSelection applyIslandStage(const mesh::ClusterAssignment& clusters,
                                 FaceReasonBuffer& faceReasons);

} // namespace cleaning
} // namespace backscan
