#include "backscan/mesh/ComponentClusterer.hpp"
#include "backscan/mesh/DisjointSet.hpp"
#include "backscan/mesh/EdgeFaceIndex.hpp"
#include "backscan/core/Logger.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace backscan {
namespace mesh {

int ClusterAssignment::largestCluster() const {
    int best = -1;
    size_t bestCount = 0;
    for (size_t c = 0; c < clusterFaceCounts.size(); ++c) {
        if (clusterFaceCounts[c] > bestCount) {
            bestCount = clusterFaceCounts[c];
            best = static_cast<int>(c);
        }
    }
    return best;
}

std::string ClusterAssignment::toString() const {
    std::stringstream ss;
    ss << "Components: " << clusterCount() << " clusters over " << faceCluster.size() << " faces";
    const int largest = largestCluster();
    if (largest >= 0) {
        ss << ", largest #" << largest << " with " << clusterFaceCounts[largest] << " faces";
        if (static_cast<size_t>(largest) < clusterAreas.size()) {
            ss << " (" << std::fixed << std::setprecision(3) << clusterAreas[largest] << " mm²)";
        }
    }
    return ss.str();
}

ClusterAssignment ComponentClusterer::cluster(const TriangleMesh& mesh) const {
    mesh.validate();

    DisjointSet faces(mesh.faces.size());
    EdgeFaceIndex edgeIndex(mesh);

    edgeIndex.forEachEdge([&faces](uint64_t, const EdgeFaceIndex::Entry* first,
                                   const EdgeFaceIndex::Entry* last) {
        for (const EdgeFaceIndex::Entry* it = first + 1; it < last; ++it) {
            faces.unite(first->face, it->face);
        }
    });

    // Normalize component IDs (consecutive, first-appearance order)
    ClusterAssignment result;
    result.faceCluster.resize(mesh.faces.size());
    std::unordered_map<int, int> rootToCluster;

    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const int root = faces.find(static_cast<int>(f));
        auto it = rootToCluster.find(root);
        if (it == rootToCluster.end()) {
            it = rootToCluster.emplace(root, static_cast<int>(rootToCluster.size())).first;
            result.clusterFaceCounts.push_back(0);
            result.clusterAreas.push_back(0.0);
        }
        const int clusterId = it->second;
        result.faceCluster[f] = clusterId;
        result.clusterFaceCounts[clusterId]++;
        result.clusterAreas[clusterId] += mesh.faceArea(f);
    }

    LOG_DEBUG(result.toString());
    return result;
}

} // namespace mesh
} // namespace backscan
