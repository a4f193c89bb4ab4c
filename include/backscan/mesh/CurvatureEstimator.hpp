#pragma once

#include "backscan/mesh/TriangleMesh.hpp"
#include <string>
#include <vector>

namespace backscan {
namespace mesh {

/**
 * @brief Discrete curvature quantity to compute per vertex
 */
enum class CurvatureType {
    MEAN,       // signed mean curvature H
    GAUSSIAN    // angle-defect Gaussian curvature K
};

/**
 * @brief Parse "mean" / "gaussian" (case-insensitive)
 * @throws core::ConfigException on any other name
 */
CurvatureType curvatureTypeFromString(const std::string& name);
std::string curvatureTypeToString(CurvatureType type);

/**
 * @brief Per-vertex curvature on triangle meshes
 *
 * Follows Meyer et al. 2003, "Discrete Differential-Geometry Operators
 * for Triangulated 2-Manifolds": cotangent Laplace-Beltrami for H, angle
 * defect for K, both normalized by the mixed Voronoi area.
 *
 * H is signed against the area-weighted vertex normal, so a convex bump
 * on an outward-oriented surface is positive and a dent is negative.
 * Vertices without incident area get 0.
 */
class CurvatureEstimator {
public:
    explicit CurvatureEstimator(CurvatureType type = CurvatureType::MEAN)
        : type_(type) {}

    /**
     * @return one value per vertex
     * @throws core::InputException if the mesh fails TriangleMesh::validate()
     */
    std::vector<double> compute(const TriangleMesh& mesh) const;

    std::vector<double> computeMeanCurvature(const TriangleMesh& mesh) const;
    std::vector<double> computeGaussianCurvature(const TriangleMesh& mesh) const;

    /**
     * @brief Mixed Voronoi area per vertex
     */
    std::vector<double> computeMixedAreas(const TriangleMesh& mesh) const;

    CurvatureType getType() const { return type_; }

private:
    CurvatureType type_;
};

/**
 * @brief Use a scalar vertex property read from the mesh file as curvature
 * @throws core::InputException if the property is missing
 */
std::vector<double> curvatureFromProperty(const TriangleMesh& mesh, const std::string& name);

/**
 * @brief Read one curvature value per line ('#' starts a comment)
 * @throws core::FileException if the file is missing or a line does not parse
 * @throws core::InputException if the value count differs from expectedCount
 */
std::vector<double> loadCurvatureFile(const std::string& path, size_t expectedCount);

} // namespace mesh
} // namespace backscan
