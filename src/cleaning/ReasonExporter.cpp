#include "backscan/cleaning/ReasonExporter.hpp"
#include "backscan/core/exception.h"
#include "backscan/core/Logger.hpp"
#include <fstream>
#include <iomanip>

namespace backscan {
namespace cleaning {

namespace {

void writeColor(std::ostream& out, const cv::Vec3b& rgb) {
    out << static_cast<int>(rgb[0]) << " "
        << static_cast<int>(rgb[1]) << " "
        << static_cast<int>(rgb[2]);
}

} // namespace

void ReasonExporter::writePLY(const mesh::TriangleMesh& mesh,
                              const CleaningResult& result,
                              std::ostream& out) const {
    if (result.vertexReasons.size() != mesh.numVertices() ||
        result.faceReasons.size() != mesh.numFaces()) {
        BACKSCAN_THROW(core::InputException,
                       "Cleaning result (" + std::to_string(result.vertexReasons.size()) + " vertices, " +
                       std::to_string(result.faceReasons.size()) + " faces) does not match mesh (" +
                       std::to_string(mesh.numVertices()) + " vertices, " +
                       std::to_string(mesh.numFaces()) + " faces)");
    }

    out << "ply\n";
    out << "format ascii 1.0\n";
    out << "comment Generated by backscan_clean\n";

    if (config_.includeLegend) {
        for (int code = 0; code < kFaceReasonCount; ++code) {
            out << "comment reason " << code << ": "
                << legendLabel(static_cast<FaceReason>(code)) << "\n";
        }
    }
    if (config_.includeSummary) {
        for (int code = 0; code < kFaceReasonCount; ++code) {
            out << "comment faces " << cleaning::toString(static_cast<FaceReason>(code))
                << ": " << result.faceReasonCounts[code] << "\n";
        }
    }

    out << "element vertex " << mesh.numVertices() << "\n";
    out << "property float x\n";
    out << "property float y\n";
    out << "property float z\n";
    out << "property uchar red\n";
    out << "property uchar green\n";
    out << "property uchar blue\n";
    out << "property uchar reason\n";

    out << "element face " << mesh.numFaces() << "\n";
    out << "property list uchar int vertex_indices\n";
    out << "property uchar red\n";
    out << "property uchar green\n";
    out << "property uchar blue\n";
    out << "property uchar reason\n";
    out << "end_header\n";

    out << std::fixed << std::setprecision(config_.decimalPlaces);
    for (size_t i = 0; i < mesh.vertices.size(); ++i) {
        const cv::Vec3f& vertex = mesh.vertices[i];
        const VertexReason reason = result.vertexReasons[i];
        out << vertex[0] << " " << vertex[1] << " " << vertex[2] << " ";
        writeColor(out, reasonColor(reason));
        out << " " << static_cast<int>(toCode(reason)) << "\n";
    }

    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const cv::Vec3i& face = mesh.faces[f];
        const FaceReason reason = result.faceReasons[f];
        out << "3 " << face[0] << " " << face[1] << " " << face[2] << " ";
        writeColor(out, reasonColor(reason));
        out << " " << static_cast<int>(toCode(reason)) << "\n";
    }
}

void ReasonExporter::exportPLY(const mesh::TriangleMesh& mesh,
                               const CleaningResult& result,
                               const std::string& filePath) const {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        BACKSCAN_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                            "Failed to open PLY file for writing: " + filePath);
    }

    writePLY(mesh, result, file);

    file.flush();
    if (!file) {
        BACKSCAN_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                            "Failed while writing PLY file: " + filePath);
    }

    BACKSCAN_LOG_INFO("ReasonExporter") << "Wrote " << mesh.numVertices() << " vertices and "
                                        << mesh.numFaces() << " faces to " << filePath;
}

} // namespace cleaning
} // namespace backscan
