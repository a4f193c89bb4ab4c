#include "backscan/mesh/CurvatureEstimator.hpp"
#include "backscan/mesh/EdgeFaceIndex.hpp"
#include "backscan/core/exception.h"
#include "backscan/core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace backscan {
namespace mesh {

namespace {

constexpr double kDegenerateArea = 1e-20;

cv::Vec3d toVec3d(const cv::Vec3f& v) {
    return cv::Vec3d(v[0], v[1], v[2]);
}

// Cotangent of the angle at p in triangle (p, q, r)
double cotAt(const cv::Vec3d& p, const cv::Vec3d& q, const cv::Vec3d& r) {
    cv::Vec3d u = q - p;
    cv::Vec3d v = r - p;
    double crossNorm = cv::norm(u.cross(v));
    if (crossNorm < kDegenerateArea) {
        return 0.0;
    }
    return u.dot(v) / crossNorm;
}

double angleAt(const cv::Vec3d& p, const cv::Vec3d& q, const cv::Vec3d& r) {
    cv::Vec3d u = q - p;
    cv::Vec3d v = r - p;
    return std::atan2(cv::norm(u.cross(v)), u.dot(v));
}

} // namespace

CurvatureType curvatureTypeFromString(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "mean") return CurvatureType::MEAN;
    if (lower == "gaussian") return CurvatureType::GAUSSIAN;
    BACKSCAN_THROW(core::ConfigException, "Unknown curvature type: " + name);
}

std::string curvatureTypeToString(CurvatureType type) {
    switch (type) {
        case CurvatureType::MEAN:     return "mean";
        case CurvatureType::GAUSSIAN: return "gaussian";
        default:                      return "unknown";
    }
}

std::vector<double> CurvatureEstimator::compute(const TriangleMesh& mesh) const {
    mesh.validate();

    std::vector<double> curvature = (type_ == CurvatureType::MEAN)
        ? computeMeanCurvature(mesh)
        : computeGaussianCurvature(mesh);

    auto range = std::minmax_element(curvature.begin(), curvature.end());
    BACKSCAN_LOG_INFO("CurvatureEstimator") << "Computed " << curvatureTypeToString(type_)
                                            << " curvature for " << curvature.size()
                                            << " vertices, range [" << *range.first
                                            << ", " << *range.second << "]";
    return curvature;
}

std::vector<double> CurvatureEstimator::computeMixedAreas(const TriangleMesh& mesh) const {
    std::vector<double> areas(mesh.vertices.size(), 0.0);

    for (const cv::Vec3i& face : mesh.faces) {
        const cv::Vec3d p[3] = {toVec3d(mesh.vertices[face[0]]),
                                toVec3d(mesh.vertices[face[1]]),
                                toVec3d(mesh.vertices[face[2]])};

        const double area = 0.5 * cv::norm((p[1] - p[0]).cross(p[2] - p[0]));
        if (area < kDegenerateArea) {
            continue;
        }

        int obtuseCorner = -1;
        for (int k = 0; k < 3; ++k) {
            if ((p[(k + 1) % 3] - p[k]).dot(p[(k + 2) % 3] - p[k]) < 0.0) {
                obtuseCorner = k;
            }
        }

        for (int k = 0; k < 3; ++k) {
            const int q = (k + 1) % 3;
            const int r = (k + 2) % 3;
            double contribution;
            if (obtuseCorner < 0) {
                // Voronoi region of corner k
                const double pr2 = cv::norm(p[r] - p[k], cv::NORM_L2SQR);
                const double pq2 = cv::norm(p[q] - p[k], cv::NORM_L2SQR);
                contribution = (pr2 * cotAt(p[q], p[r], p[k]) +
                                pq2 * cotAt(p[r], p[k], p[q])) / 8.0;
            } else {
                contribution = (obtuseCorner == k) ? area / 2.0 : area / 4.0;
            }
            areas[face[k]] += contribution;
        }
    }
    return areas;
}

std::vector<double> CurvatureEstimator::computeMeanCurvature(const TriangleMesh& mesh) const {
    const size_t vertexCount = mesh.vertices.size();
    std::vector<cv::Vec3d> laplacian(vertexCount, cv::Vec3d(0.0, 0.0, 0.0));
    std::vector<cv::Vec3d> normals(vertexCount, cv::Vec3d(0.0, 0.0, 0.0));

    for (const cv::Vec3i& face : mesh.faces) {
        const cv::Vec3d p[3] = {toVec3d(mesh.vertices[face[0]]),
                                toVec3d(mesh.vertices[face[1]]),
                                toVec3d(mesh.vertices[face[2]])};

        // Area-weighted face normal (unnormalized cross product)
        const cv::Vec3d faceNormal = (p[1] - p[0]).cross(p[2] - p[0]);
        if (cv::norm(faceNormal) < kDegenerateArea) {
            continue;
        }

        for (int k = 0; k < 3; ++k) {
            normals[face[k]] += faceNormal;

            // Corner k weights its opposite edge (q, r)
            const int q = (k + 1) % 3;
            const int r = (k + 2) % 3;
            const double w = 0.5 * cotAt(p[k], p[q], p[r]);
            laplacian[face[q]] += w * (p[r] - p[q]);
            laplacian[face[r]] += w * (p[q] - p[r]);
        }
    }

    const std::vector<double> areas = computeMixedAreas(mesh);
    std::vector<double> curvature(vertexCount, 0.0);

    for (size_t v = 0; v < vertexCount; ++v) {
        const double normalLength = cv::norm(normals[v]);
        if (areas[v] < kDegenerateArea || normalLength < kDegenerateArea) {
            continue;
        }
        const cv::Vec3d n = normals[v] / normalLength;
        // Delta x = L / A = -2 H n
        curvature[v] = -laplacian[v].dot(n) / (2.0 * areas[v]);
    }
    return curvature;
}

std::vector<double> CurvatureEstimator::computeGaussianCurvature(const TriangleMesh& mesh) const {
    const size_t vertexCount = mesh.vertices.size();
    std::vector<double> angleSum(vertexCount, 0.0);
    std::vector<char> touched(vertexCount, 0);
    std::vector<char> onBoundary(vertexCount, 0);

    EdgeFaceIndex edgeIndex(mesh);
    edgeIndex.forEachEdge([&onBoundary](uint64_t key, const EdgeFaceIndex::Entry* first,
                                        const EdgeFaceIndex::Entry* last) {
        if (last - first == 1) {
            onBoundary[EdgeFaceIndex::keyFirst(key)] = 1;
            onBoundary[EdgeFaceIndex::keySecond(key)] = 1;
        }
    });

    for (const cv::Vec3i& face : mesh.faces) {
        const cv::Vec3d p[3] = {toVec3d(mesh.vertices[face[0]]),
                                toVec3d(mesh.vertices[face[1]]),
                                toVec3d(mesh.vertices[face[2]])};
        for (int k = 0; k < 3; ++k) {
            angleSum[face[k]] += angleAt(p[k], p[(k + 1) % 3], p[(k + 2) % 3]);
            touched[face[k]] = 1;
        }
    }

    const std::vector<double> areas = computeMixedAreas(mesh);
    std::vector<double> curvature(vertexCount, 0.0);

    for (size_t v = 0; v < vertexCount; ++v) {
        if (!touched[v] || areas[v] < kDegenerateArea) {
            continue;
        }
        const double fullAngle = onBoundary[v] ? CV_PI : 2.0 * CV_PI;
        curvature[v] = (fullAngle - angleSum[v]) / areas[v];
    }
    return curvature;
}

std::vector<double> curvatureFromProperty(const TriangleMesh& mesh, const std::string& name) {
    auto it = mesh.vertexProperties.find(name);
    if (it == mesh.vertexProperties.end()) {
        BACKSCAN_THROW(core::InputException, "Mesh has no vertex property '" + name + "'");
    }
    if (it->second.size() != mesh.vertices.size()) {
        BACKSCAN_THROW(core::InputException,
                       "Vertex property '" + name + "' has " + std::to_string(it->second.size()) +
                       " values for " + std::to_string(mesh.vertices.size()) + " vertices");
    }
    LOG_INFO("Using vertex property '" + name + "' as curvature");
    return it->second;
}

std::vector<double> loadCurvatureFile(const std::string& path, size_t expectedCount) {
    std::ifstream file(path);
    if (!file.is_open()) {
        BACKSCAN_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                            "Cannot open curvature file: " + path);
    }

    std::vector<double> values;
    values.reserve(expectedCount);

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        const size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        std::istringstream iss(line);
        double value;
        if (!(iss >> value)) {
            std::string rest;
            if (std::istringstream(line) >> rest) {
                BACKSCAN_THROW_CODE(core::FileException, core::ResultCode::ERROR_INVALID_FORMAT,
                                    path + ":" + std::to_string(lineNumber) +
                                    ": not a number: '" + rest + "'");
            }
            continue; // blank line
        }
        values.push_back(value);
    }

    if (values.size() != expectedCount) {
        BACKSCAN_THROW(core::InputException,
                       "Curvature file " + path + " has " + std::to_string(values.size()) +
                       " values, mesh has " + std::to_string(expectedCount) + " vertices");
    }
    return values;
}

} // namespace mesh
} // namespace backscan
