#pragma once

#include "backscan/cleaning/CleaningPipeline.hpp"
#include "backscan/mesh/TriangleMesh.hpp"
#include <ostream>
#include <string>

namespace backscan {
namespace cleaning {

/**
 * @brief Export options for annotated meshes
 */
struct ReasonExportConfig {
    int decimalPlaces = 6;        // Coordinate precision
    bool includeLegend = true;    // Reason legend as header comments
    bool includeSummary = true;   // Per-reason face counts as header comments
};

/**
 * @brief Writes the input mesh with per-vertex and per-face reason colors
 *
 * Output is ASCII PLY. Vertices carry `x y z red green blue reason`,
 * faces carry `vertex_indices red green blue reason`. Geometry is written
 * unchanged; removal is left to the consumer.
 */
class ReasonExporter {
public:
    explicit ReasonExporter(const ReasonExportConfig& config = ReasonExportConfig())
        : config_(config) {}

    /**
     * @throws core::InputException if the result does not match the mesh
     * @throws core::FileException ERROR_FILE_IO if the file cannot be written
     */
    void exportPLY(const mesh::TriangleMesh& mesh,
                   const CleaningResult& result,
                   const std::string& filePath) const;

    /**
     * @throws core::InputException if the result does not match the mesh
     */
    void writePLY(const mesh::TriangleMesh& mesh,
                  const CleaningResult& result,
                  std::ostream& out) const;

private:
    ReasonExportConfig config_;
};

} // namespace cleaning
} // namespace backscan
