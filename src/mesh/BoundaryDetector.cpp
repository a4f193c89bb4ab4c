#include "backscan/mesh/BoundaryDetector.hpp"
#include "backscan/mesh/DisjointSet.hpp"
#include "backscan/mesh/EdgeFaceIndex.hpp"
#include "backscan/core/Logger.hpp"
#include <algorithm>
#include <sstream>

namespace backscan {
namespace mesh {

namespace {

void sortUnique(std::vector<int>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

// Corner slot of vertex v inside face f (3*f + position), -1 if absent
int cornerOf(const TriangleMesh& mesh, int f, int v) {
    const cv::Vec3i& face = mesh.faces[f];
    for (int k = 0; k < 3; ++k) {
        if (face[k] == v) {
            return 3 * f + k;
        }
    }
    return -1;
}

} // namespace

std::string BoundaryReport::toString() const {
    std::stringstream ss;
    ss << "Boundary analysis: " << boundaryEdges << " boundary edges, "
       << nonManifoldEdges << " non-manifold edges, "
       << nonManifoldVertices.size() << " non-manifold vertices, "
       << seeds.size() << " seed vertices";
    return ss.str();
}

BoundaryReport BoundaryDetector::analyze(const TriangleMesh& mesh) const {
    mesh.validate();

    BoundaryReport report;
    EdgeFaceIndex edgeIndex(mesh);

    // Corners of the same vertex are joined when their faces share an
    // edge through that vertex; each resulting class is one fan.
    DisjointSet corners(mesh.faces.size() * 3);

    edgeIndex.forEachEdge([&](uint64_t key, const EdgeFaceIndex::Entry* first,
                              const EdgeFaceIndex::Entry* last) {
        const int a = EdgeFaceIndex::keyFirst(key);
        const int b = EdgeFaceIndex::keySecond(key);
        const size_t faceCount = static_cast<size_t>(last - first);

        if (faceCount == 1) {
            report.boundaryEdges++;
            report.boundaryEdgeVertices.push_back(a);
            report.boundaryEdgeVertices.push_back(b);
        } else if (faceCount > 2) {
            report.nonManifoldEdges++;
            report.nonManifoldEdgeVertices.push_back(a);
            report.nonManifoldEdgeVertices.push_back(b);
        }

        for (const EdgeFaceIndex::Entry* it = first + 1; it < last; ++it) {
            corners.unite(cornerOf(mesh, first->face, a), cornerOf(mesh, it->face, a));
            corners.unite(cornerOf(mesh, first->face, b), cornerOf(mesh, it->face, b));
        }
    });

    // Count distinct fans per vertex
    std::vector<int> firstFan(mesh.vertices.size(), -1);
    std::vector<char> multiFan(mesh.vertices.size(), 0);
    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const cv::Vec3i& face = mesh.faces[f];
        for (int k = 0; k < 3; ++k) {
            const int v = face[k];
            const int fan = corners.find(static_cast<int>(3 * f + k));
            if (firstFan[v] < 0) {
                firstFan[v] = fan;
            } else if (firstFan[v] != fan) {
                multiFan[v] = 1;
            }
        }
    }
    for (size_t v = 0; v < multiFan.size(); ++v) {
        if (multiFan[v]) {
            report.nonManifoldVertices.push_back(static_cast<int>(v));
        }
    }

    sortUnique(report.boundaryEdgeVertices);
    sortUnique(report.nonManifoldEdgeVertices);

    report.seeds = report.boundaryEdgeVertices;
    report.seeds.insert(report.seeds.end(), report.nonManifoldEdgeVertices.begin(),
                        report.nonManifoldEdgeVertices.end());
    report.seeds.insert(report.seeds.end(), report.nonManifoldVertices.begin(),
                        report.nonManifoldVertices.end());
    sortUnique(report.seeds);

    LOG_DEBUG(report.toString());
    return report;
}

} // namespace mesh
} // namespace backscan
