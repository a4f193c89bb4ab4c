#pragma once

#include "backscan/mesh/TriangleMesh.hpp"
#include <string>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Face partition into connected components
 *
 * faceCluster[f] is the cluster id of face f. Ids produced by
 * ComponentClusterer are dense and numbered in order of first appearance
 * in face order; caller-supplied assignments may use any non-negative id.
 */
struct ClusterAssignment {
    std::vector<int> faceCluster;
    std::vector<size_t> clusterFaceCounts;   // indexed by cluster id
    std::vector<double> clusterAreas;        // indexed by cluster id, may be empty

    size_t clusterCount() const { return clusterFaceCounts.size(); }

    /**
     * @brief Id of the cluster with the most faces (lowest id on ties), -1 if none
     */
    int largestCluster() const;

    std::string toString() const;
};

/**
 * @brief Connected triangle components via Union-Find
 *
 * Two faces are connected when they share an edge (two vertex indices).
 * Faces touching only at a vertex belong to different clusters.
 */
class ComponentClusterer {
public:
    /**
     * @throws core::InputException if the mesh fails TriangleMesh::validate()
     */
    ClusterAssignment cluster(const TriangleMesh& mesh) const;
};

} // namespace mesh
} // namespace backscan
