#pragma once

#include "backscan/mesh/TriangleMesh.hpp"
#include <istream>
#include <string>

namespace backscan {
namespace mesh {

/**
 * @brief PLY loader for triangle scan meshes
 *
 * Supports ascii, binary_little_endian and binary_big_endian bodies.
 * - vertex element: x/y/z required; every other scalar property is kept
 *   in TriangleMesh::vertexProperties under its own name
 * - face element: list property "vertex_indices" (or "vertex_index");
 *   polygons are fan-triangulated
 * - any other element is read and discarded
 *
 * Meshes without faces are rejected; point clouds are not reconstructed.
 */
class PlyReader {
public:
    /**
     * @throws core::FileException ERROR_FILE_NOT_FOUND if the file cannot be opened,
     *         ERROR_INVALID_FORMAT on a malformed or empty mesh
     */
    TriangleMesh read(const std::string& path) const;

    /**
     * @param sourceName used in error messages only
     */
    TriangleMesh read(std::istream& in, const std::string& sourceName) const;
};

} // namespace mesh
} // namespace backscan
