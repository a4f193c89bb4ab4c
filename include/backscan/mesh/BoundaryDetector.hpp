#pragma once

#include "backscan/mesh/TriangleMesh.hpp"
#include <string>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Boundary and non-manifold analysis of a scan mesh
 */
struct BoundaryReport {
    size_t boundaryEdges = 0;                 // edges with exactly one face
    size_t nonManifoldEdges = 0;              // edges with three or more faces

    std::vector<int> boundaryEdgeVertices;    // endpoints of boundary edges
    std::vector<int> nonManifoldEdgeVertices; // endpoints of non-manifold edges
    std::vector<int> nonManifoldVertices;     // vertices with more than one face fan

    // Sorted union of the three vertex lists: the border dilation seed set
    std::vector<int> seeds;

    std::string toString() const;
};

/**
 * @brief Finds the vertices the border stage dilates from
 *
 * A vertex is a seed if it lies on an open (single-face) edge, on an
 * edge shared by three or more faces, or if its incident faces split
 * into more than one edge-connected fan (bow-tie vertex).
 */
class BoundaryDetector {
public:
    /**
     * @throws core::InputException if the mesh fails TriangleMesh::validate()
     */
    BoundaryReport analyze(const TriangleMesh& mesh) const;

    /**
     * @brief Seed set only
     */
    std::vector<int> detectSeeds(const TriangleMesh& mesh) const {
        return analyze(mesh).seeds;
    }
};

} // namespace mesh
} // namespace backscan
