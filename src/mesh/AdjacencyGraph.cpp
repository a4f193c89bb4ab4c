#include "backscan/mesh/AdjacencyGraph.hpp"
#include "backscan/core/exception.h"
#include "backscan/core/Logger.hpp"
#include <algorithm>

namespace backscan {
namespace mesh {

AdjacencyGraph AdjacencyGraph::fromMesh(const TriangleMesh& mesh) {
    const int vertexCount = static_cast<int>(mesh.vertices.size());

    std::vector<std::pair<int, int>> directedEdges;
    directedEdges.reserve(mesh.faces.size() * 6);

    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const cv::Vec3i& face = mesh.faces[f];
        for (int k = 0; k < 3; ++k) {
            if (face[k] < 0 || face[k] >= vertexCount) {
                BACKSCAN_THROW(core::InputException,
                               "Face " + std::to_string(f) + " has out-of-range vertex " +
                               std::to_string(face[k]));
            }
        }
        for (int k = 0; k < 3; ++k) {
            int a = face[k];
            int b = face[(k + 1) % 3];
            directedEdges.emplace_back(a, b);
            directedEdges.emplace_back(b, a);
        }
    }

    AdjacencyGraph graph = fromEdgePairs(mesh.vertices.size(), directedEdges);
    BACKSCAN_LOG_DEBUG("AdjacencyGraph") << "Built adjacency: " << graph.vertexCount()
                                         << " vertices, " << graph.edgeCount() << " edges";
    return graph;
}

AdjacencyGraph AdjacencyGraph::fromNeighborLists(const std::vector<std::vector<int>>& lists) {
    const int vertexCount = static_cast<int>(lists.size());

    std::vector<std::pair<int, int>> directedEdges;
    for (int v = 0; v < vertexCount; ++v) {
        for (int n : lists[v]) {
            if (n < 0 || n >= vertexCount) {
                BACKSCAN_THROW(core::InputException,
                               "Neighbor " + std::to_string(n) + " of vertex " +
                               std::to_string(v) + " is out of range");
            }
            directedEdges.emplace_back(v, n);
        }
    }

    AdjacencyGraph graph = fromEdgePairs(lists.size(), directedEdges);

    for (int v = 0; v < vertexCount; ++v) {
        for (int n : graph.neighbors(v)) {
            if (!graph.areAdjacent(n, v)) {
                BACKSCAN_THROW(core::InputException,
                               "Adjacency is not symmetric: " + std::to_string(v) + " -> " +
                               std::to_string(n) + " has no reverse entry");
            }
        }
    }
    return graph;
}

AdjacencyGraph AdjacencyGraph::fromEdgePairs(size_t vertexCount,
                                             std::vector<std::pair<int, int>>& directedEdges) {
    std::sort(directedEdges.begin(), directedEdges.end());
    directedEdges.erase(std::unique(directedEdges.begin(), directedEdges.end()),
                        directedEdges.end());

    AdjacencyGraph graph;
    graph.offsets_.assign(vertexCount + 1, 0);
    graph.neighbors_.reserve(directedEdges.size());

    for (const auto& edge : directedEdges) {
        if (edge.first == edge.second) {
            continue;
        }
        graph.offsets_[edge.first + 1]++;
        graph.neighbors_.push_back(edge.second);
    }
    for (size_t v = 0; v < vertexCount; ++v) {
        graph.offsets_[v + 1] += graph.offsets_[v];
    }
    return graph;
}

bool AdjacencyGraph::areAdjacent(int a, int b) const {
    NeighborRange range = neighbors(a);
    return std::binary_search(range.begin(), range.end(), b);
}

} // namespace mesh
} // namespace backscan
