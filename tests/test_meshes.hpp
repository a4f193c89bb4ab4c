/**
 * @file test_meshes.hpp
 * @brief Small synthetic meshes shared by the unit tests
 */

#pragma once

#include <backscan/mesh/TriangleMesh.hpp>
#include <cmath>

namespace backscan {
namespace test {

/**
 * @brief Planar nx-by-ny vertex grid in z = 0, two triangles per cell
 *
 * Vertex (i, j) has index j * nx + i. Cell (i, j) yields faces
 * (v00, v10, v11) and (v00, v11, v01), consistently oriented (+z).
 */
inline mesh::TriangleMesh makeGrid(int nx, int ny, float spacing = 1.0f,
                                   cv::Vec3f origin = cv::Vec3f(0, 0, 0)) {
    mesh::TriangleMesh grid;
    for (int j = 0; j < ny; ++j) {
        for (int i = 0; i < nx; ++i) {
            grid.vertices.push_back(origin + cv::Vec3f(i * spacing, j * spacing, 0.0f));
        }
    }
    for (int j = 0; j + 1 < ny; ++j) {
        for (int i = 0; i + 1 < nx; ++i) {
            const int v00 = j * nx + i;
            const int v10 = v00 + 1;
            const int v01 = v00 + nx;
            const int v11 = v01 + 1;
            grid.faces.emplace_back(v00, v10, v11);
            grid.faces.emplace_back(v00, v11, v01);
        }
    }
    return grid;
}

/**
 * @brief Append b to a, offsetting b's face indices
 */
inline void appendMesh(mesh::TriangleMesh& a, const mesh::TriangleMesh& b) {
    const int offset = static_cast<int>(a.vertices.size());
    a.vertices.insert(a.vertices.end(), b.vertices.begin(), b.vertices.end());
    for (const cv::Vec3i& face : b.faces) {
        a.faces.emplace_back(face[0] + offset, face[1] + offset, face[2] + offset);
    }
}

/**
 * @brief Closed UV sphere with outward-facing triangles
 */
inline mesh::TriangleMesh makeSphere(float radius, int stacks, int slices) {
    mesh::TriangleMesh sphere;
    sphere.vertices.emplace_back(0.0f, 0.0f, radius);   // north pole
    for (int s = 1; s < stacks; ++s) {
        const double phi = M_PI * s / stacks;
        for (int k = 0; k < slices; ++k) {
            const double theta = 2.0 * M_PI * k / slices;
            sphere.vertices.emplace_back(static_cast<float>(radius * std::sin(phi) * std::cos(theta)),
                                         static_cast<float>(radius * std::sin(phi) * std::sin(theta)),
                                         static_cast<float>(radius * std::cos(phi)));
        }
    }
    sphere.vertices.emplace_back(0.0f, 0.0f, -radius);  // south pole
    const int south = static_cast<int>(sphere.vertices.size()) - 1;

    auto ring = [slices](int s, int k) { return 1 + (s - 1) * slices + (k % slices); };

    for (int k = 0; k < slices; ++k) {
        sphere.faces.emplace_back(0, ring(1, k), ring(1, k + 1));
    }
    for (int s = 1; s + 1 < stacks; ++s) {
        for (int k = 0; k < slices; ++k) {
            const int a = ring(s, k);
            const int b = ring(s, k + 1);
            const int c = ring(s + 1, k);
            const int d = ring(s + 1, k + 1);
            sphere.faces.emplace_back(a, c, d);
            sphere.faces.emplace_back(a, d, b);
        }
    }
    for (int k = 0; k < slices; ++k) {
        sphere.faces.emplace_back(south, ring(stacks - 1, k + 1), ring(stacks - 1, k));
    }
    return sphere;
}

} // namespace test
} // namespace backscan
