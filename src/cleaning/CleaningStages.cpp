#include "backscan/cleaning/CleaningStages.hpp"
#include "backscan/core/Logger.hpp"
#include <algorithm>
#include <map>

namespace backscan {
namespace cleaning {

size_t applyCurvatureStage(const std::vector<double>& curvature,
                           double highThreshold,
                           double lowThreshold,
                           VertexReasonBuffer& reasons) {
    size_t marked = 0;
    for (size_t v = 0; v < curvature.size(); ++v) {
        if (curvature[v] > highThreshold || curvature[v] < lowThreshold) {
            if (reasons[v] == VertexReason::Kept) {
                reasons[v] = VertexReason::Curvature;
                marked++;
            }
        }
    }
    return marked;
}

double neighborCurvatureVariance(const mesh::AdjacencyGraph& adjacency,
                                 const std::vector<double>& curvature,
                                 int v) {
    const mesh::AdjacencyGraph::NeighborRange neighbors = adjacency.neighbors(v);
    if (neighbors.empty()) {
        return 0.0;
    }

    const double n = static_cast<double>(neighbors.size());
    double mean = 0.0;
    for (int u : neighbors) {
        mean += curvature[u];
    }
    mean /= n;

    double sumSquares = 0.0;
    for (int u : neighbors) {
        const double d = curvature[u] - mean;
        sumSquares += d * d;
    }
    return sumSquares / n;
}

std::vector<double> computeNeighborVariances(const mesh::AdjacencyGraph& adjacency,
                                             const std::vector<double>& curvature) {
    const int vertexCount = static_cast<int>(adjacency.vertexCount());
    std::vector<double> variances(vertexCount, 0.0);

    // Read-only neighbor lookups, one writer per element
    #pragma omp parallel for schedule(static)
    for (int v = 0; v < vertexCount; ++v) {
        variances[v] = neighborCurvatureVariance(adjacency, curvature, v);
    }
    return variances;
}

size_t applyVarianceStage(const std::vector<double>& curvature,
                          const mesh::AdjacencyGraph& adjacency,
                          double varianceThreshold,
                          VertexReasonBuffer& reasons) {
    const std::vector<double> variances = computeNeighborVariances(adjacency, curvature);

    size_t marked = 0;
    for (size_t v = 0; v < variances.size(); ++v) {
        if (variances[v] > varianceThreshold && reasons[v] == VertexReason::Kept) {
            reasons[v] = VertexReason::Variance;
            marked++;
        }
    }
    return marked;
}

std::vector<uint8_t> dilateBorderRegion(const mesh::AdjacencyGraph& adjacency,
                                        const std::vector<int>& seeds,
                                        unsigned int rings) {
    std::vector<uint8_t> region(adjacency.vertexCount(), 0);
    std::vector<int> frontier;
    frontier.reserve(seeds.size());

    for (int seed : seeds) {
        if (!region[seed]) {
            region[seed] = 1;
            frontier.push_back(seed);
        }
    }

    // Level-by-level BFS: expanding only the newest ring gives the same
    // set as re-expanding the whole region each pass.
    std::vector<int> next;
    for (unsigned int ring = 0; ring < rings && !frontier.empty(); ++ring) {
        next.clear();
        for (int v : frontier) {
            for (int u : adjacency.neighbors(v)) {
                if (!region[u]) {
                    region[u] = 1;
                    next.push_back(u);
                }
            }
        }
        frontier.swap(next);
    }
    return region;
}

size_t applyBorderStage(const std::vector<int>& boundarySeeds,
                        const mesh::AdjacencyGraph& adjacency,
                        unsigned int rings,
                        VertexReasonBuffer& reasons) {
    const std::vector<uint8_t> region = dilateBorderRegion(adjacency, boundarySeeds, rings);

    size_t marked = 0;
    for (size_t v = 0; v < region.size(); ++v) {
        if (region[v] && reasons[v] == VertexReason::Kept) {
            reasons[v] = VertexReason::Border;
            marked++;
        }
    }
    return marked;
}

FaceReasonBuffer aggregateFaceReasons(const std::vector<cv::Vec3i>& faces,
                                      const VertexReasonBuffer& vertexReasons) {
    FaceReasonBuffer faceReasons(faces.size(), FaceReason::Kept);
    for (size_t f = 0; f < faces.size(); ++f) {
        const cv::Vec3i& face = faces[f];
        const uint8_t code = std::max({toCode(vertexReasons[face[0]]),
                                       toCode(vertexReasons[face[1]]),
                                       toCode(vertexReasons[face[2]])});
        faceReasons[f] = static_cast<FaceReason>(code);
    }
    return faceReasons;
}

IslandSelection applyIslandStage(const mesh::ClusterAssignment& clusters,
                                 FaceReasonBuffer& faceReasons) {
    IslandSelection selection;

    // Ordered map: strict '>' below keeps the lowest id on ties
    std::map<int, size_t> keptPerCluster;
    for (size_t f = 0; f < faceReasons.size(); ++f) {
        if (faceReasons[f] == FaceReason::Kept) {
            keptPerCluster[clusters.faceCluster[f]]++;
        }
    }
    if (keptPerCluster.empty()) {
        return selection;
    }

    for (const auto& entry : keptPerCluster) {
        if (entry.second > selection.keptClusterFaces) {
            selection.keptCluster = entry.first;
            selection.keptClusterFaces = entry.second;
        }
    }
    selection.islandClusters = keptPerCluster.size() - 1;

    for (size_t f = 0; f < faceReasons.size(); ++f) {
        if (faceReasons[f] == FaceReason::Kept && clusters.faceCluster[f] != selection.keptCluster) {
            faceReasons[f] = FaceReason::Island;
            selection.facesMarked++;
        }
    }

    BACKSCAN_LOG_DEBUG("IslandStage") << "Kept cluster #" << selection.keptCluster << " ("
                                      << selection.keptClusterFaces << " faces), "
                                      << selection.islandClusters << " island clusters";
    return selection;
}

} // namespace cleaning
} // namespace backscan
