#include "backscan/mesh/EdgeFaceIndex.hpp"
#include <algorithm>

namespace backscan {
namespace mesh {

EdgeFaceIndex::EdgeFaceIndex(const TriangleMesh& mesh) {
    entries_.reserve(mesh.faces.size() * 3);
    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const cv::Vec3i& face = mesh.faces[f];
        for (int k = 0; k < 3; ++k) {
            int a = face[k];
            int b = face[(k + 1) % 3];
            if (a == b) {
                continue; // degenerate edge
            }
            entries_.push_back({makeKey(a, b), static_cast<int>(f)});
        }
    }
    std::sort(entries_.begin(), entries_.end());
    // A face with a repeated vertex pair would list the same edge twice
    entries_.erase(std::unique(entries_.begin(), entries_.end(),
                               [](const Entry& x, const Entry& y) {
                                   return x.edge == y.edge && x.face == y.face;
                               }),
                   entries_.end());
}

} // namespace mesh
} // namespace backscan
