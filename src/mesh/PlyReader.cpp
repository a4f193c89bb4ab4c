#include "backscan/mesh/PlyReader.hpp"
#include "backscan/core/exception.h"
#include "backscan/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace backscan {
namespace mesh {

namespace {

enum class PlyFormat { ASCII, BINARY_LE, BINARY_BE };

enum class PlyType { INT8, UINT8, INT16, UINT16, INT32, UINT32, FLOAT32, FLOAT64 };

struct PlyProperty {
    std::string name;
    PlyType type = PlyType::FLOAT32;
    bool isList = false;
    PlyType countType = PlyType::UINT8;
};

struct PlyElement {
    std::string name;
    size_t count = 0;
    std::vector<PlyProperty> properties;
};

struct PlyHeader {
    PlyFormat format = PlyFormat::ASCII;
    std::vector<PlyElement> elements;
};

[[noreturn]] void formatError(const std::string& source, const std::string& what) {
    BACKSCAN_THROW_CODE(core::FileException, core::ResultCode::ERROR_INVALID_FORMAT,
                        source + ": " + what);
}

bool parseType(const std::string& token, PlyType& type) {
    if (token == "char" || token == "int8") { type = PlyType::INT8; return true; }
    if (token == "uchar" || token == "uint8") { type = PlyType::UINT8; return true; }
    if (token == "short" || token == "int16") { type = PlyType::INT16; return true; }
    if (token == "ushort" || token == "uint16") { type = PlyType::UINT16; return true; }
    if (token == "int" || token == "int32") { type = PlyType::INT32; return true; }
    if (token == "uint" || token == "uint32") { type = PlyType::UINT32; return true; }
    if (token == "float" || token == "float32") { type = PlyType::FLOAT32; return true; }
    if (token == "double" || token == "float64") { type = PlyType::FLOAT64; return true; }
    return false;
}

size_t typeSize(PlyType type) {
    switch (type) {
        case PlyType::INT8:
        case PlyType::UINT8:   return 1;
        case PlyType::INT16:
        case PlyType::UINT16:  return 2;
        case PlyType::INT32:
        case PlyType::UINT32:
        case PlyType::FLOAT32: return 4;
        case PlyType::FLOAT64: return 8;
    }
    return 0;
}

bool hostIsLittleEndian() {
    const uint16_t probe = 1;
    unsigned char first;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

PlyHeader parseHeader(std::istream& in, const std::string& source) {
    PlyHeader header;
    std::string line;

    if (!std::getline(in, line)) {
        formatError(source, "empty file");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line != "ply") {
        formatError(source, "missing 'ply' magic");
    }

    bool sawFormat = false;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::istringstream iss(line);
        std::string keyword;
        if (!(iss >> keyword)) {
            continue;
        }

        if (keyword == "end_header") {
            if (!sawFormat) {
                formatError(source, "header has no format line");
            }
            return header;
        } else if (keyword == "comment" || keyword == "obj_info") {
            continue;
        } else if (keyword == "format") {
            std::string format;
            iss >> format;
            if (format == "ascii") header.format = PlyFormat::ASCII;
            else if (format == "binary_little_endian") header.format = PlyFormat::BINARY_LE;
            else if (format == "binary_big_endian") header.format = PlyFormat::BINARY_BE;
            else formatError(source, "unknown format '" + format + "'");
            sawFormat = true;
        } else if (keyword == "element") {
            PlyElement element;
            long long count = -1;
            if (!(iss >> element.name >> count) || count < 0) {
                formatError(source, "bad element line: " + line);
            }
            element.count = static_cast<size_t>(count);
            header.elements.push_back(element);
        } else if (keyword == "property") {
            if (header.elements.empty()) {
                formatError(source, "property before any element");
            }
            PlyProperty property;
            std::string typeToken;
            iss >> typeToken;
            if (typeToken == "list") {
                std::string countToken, itemToken;
                iss >> countToken >> itemToken;
                if (!parseType(countToken, property.countType) || !parseType(itemToken, property.type)) {
                    formatError(source, "bad list property: " + line);
                }
                property.isList = true;
            } else if (!parseType(typeToken, property.type)) {
                formatError(source, "unknown property type '" + typeToken + "'");
            }
            if (!(iss >> property.name)) {
                formatError(source, "property without name: " + line);
            }
            header.elements.back().properties.push_back(property);
        } else {
            formatError(source, "unexpected header line: " + line);
        }
    }
    formatError(source, "header not terminated by end_header");
}

/**
 * Reads typed values from the body regardless of encoding
 */
class ValueReader {
public:
    ValueReader(std::istream& in, PlyFormat format, const std::string& source)
        : in_(in), format_(format), source_(source),
          swap_((format == PlyFormat::BINARY_LE) != hostIsLittleEndian()) {}

    double next(PlyType type) {
        if (format_ == PlyFormat::ASCII) {
            std::string token;
            if (!(in_ >> token)) {
                formatError(source_, "unexpected end of data");
            }
            char* end = nullptr;
            double value = std::strtod(token.c_str(), &end);
            if (end == token.c_str() || *end != '\0') {
                formatError(source_, "not a number: '" + token + "'");
            }
            return value;
        }

        unsigned char bytes[8];
        const size_t size = typeSize(type);
        if (!in_.read(reinterpret_cast<char*>(bytes), static_cast<std::streamsize>(size))) {
            formatError(source_, "unexpected end of data");
        }
        if (swap_) {
            std::reverse(bytes, bytes + size);
        }
        return decode(type, bytes);
    }

private:
    static double decode(PlyType type, const unsigned char* bytes) {
        switch (type) {
            case PlyType::INT8:    { int8_t v;   std::memcpy(&v, bytes, 1); return v; }
            case PlyType::UINT8:   { uint8_t v;  std::memcpy(&v, bytes, 1); return v; }
            case PlyType::INT16:   { int16_t v;  std::memcpy(&v, bytes, 2); return v; }
            case PlyType::UINT16:  { uint16_t v; std::memcpy(&v, bytes, 2); return v; }
            case PlyType::INT32:   { int32_t v;  std::memcpy(&v, bytes, 4); return v; }
            case PlyType::UINT32:  { uint32_t v; std::memcpy(&v, bytes, 4); return v; }
            case PlyType::FLOAT32: { float v;    std::memcpy(&v, bytes, 4); return v; }
            case PlyType::FLOAT64: { double v;   std::memcpy(&v, bytes, 8); return v; }
        }
        return 0.0;
    }

    std::istream& in_;
    PlyFormat format_;
    std::string source_;
    bool swap_;
};

// List lengths and vertex indices must be integral and fit an int
int toListCount(double value, const std::string& source) {
    if (!(value >= 0.0 && value <= static_cast<double>(std::numeric_limits<int>::max())) ||
        value != std::floor(value)) {
        formatError(source, "invalid list length");
    }
    return static_cast<int>(value);
}

int toVertexIndex(double value, const std::string& source) {
    if (!(value >= static_cast<double>(std::numeric_limits<int>::min()) &&
          value <= static_cast<double>(std::numeric_limits<int>::max())) ||
        value != std::floor(value)) {
        formatError(source, "invalid vertex index");
    }
    return static_cast<int>(value);
}

void readVertices(const PlyElement& element, ValueReader& reader, TriangleMesh& mesh,
                  const std::string& source) {
    int xIndex = -1, yIndex = -1, zIndex = -1;
    for (size_t p = 0; p < element.properties.size(); ++p) {
        const PlyProperty& property = element.properties[p];
        if (property.isList) continue;
        if (property.name == "x") xIndex = static_cast<int>(p);
        else if (property.name == "y") yIndex = static_cast<int>(p);
        else if (property.name == "z") zIndex = static_cast<int>(p);
        else mesh.vertexProperties[property.name];
    }
    if (xIndex < 0 || yIndex < 0 || zIndex < 0) {
        formatError(source, "vertex element lacks x/y/z");
    }

    // Counts come from the file; storage grows only as data is actually read
    for (size_t v = 0; v < element.count; ++v) {
        cv::Vec3f position(0.0f, 0.0f, 0.0f);
        for (size_t p = 0; p < element.properties.size(); ++p) {
            const PlyProperty& property = element.properties[p];
            if (property.isList) {
                const int n = toListCount(reader.next(property.countType), source);
                for (int i = 0; i < n; ++i) reader.next(property.type);
                continue;
            }
            const double value = reader.next(property.type);
            const int index = static_cast<int>(p);
            if (index == xIndex) position[0] = static_cast<float>(value);
            else if (index == yIndex) position[1] = static_cast<float>(value);
            else if (index == zIndex) position[2] = static_cast<float>(value);
            else mesh.vertexProperties[property.name].push_back(value);
        }
        mesh.vertices.push_back(position);
    }
}

void readFaces(const PlyElement& element, ValueReader& reader, TriangleMesh& mesh,
               const std::string& source, size_t& polygonsSplit) {
    int indexProperty = -1;
    for (size_t p = 0; p < element.properties.size(); ++p) {
        const PlyProperty& property = element.properties[p];
        if (property.isList && (property.name == "vertex_indices" || property.name == "vertex_index")) {
            indexProperty = static_cast<int>(p);
        }
    }
    if (indexProperty < 0) {
        formatError(source, "face element lacks vertex_indices list");
    }

    std::vector<int> polygon;
    for (size_t f = 0; f < element.count; ++f) {
        for (size_t p = 0; p < element.properties.size(); ++p) {
            const PlyProperty& property = element.properties[p];
            if (!property.isList) {
                reader.next(property.type);
                continue;
            }
            const int n = toListCount(reader.next(property.countType), source);
            if (static_cast<int>(p) != indexProperty) {
                for (int i = 0; i < n; ++i) reader.next(property.type);
                continue;
            }
            polygon.clear();
            for (int i = 0; i < n; ++i) {
                polygon.push_back(toVertexIndex(reader.next(property.type), source));
            }
            if (n < 3) {
                formatError(source, "face " + std::to_string(f) + " has fewer than 3 vertices");
            }
            if (n > 3) {
                polygonsSplit++;
            }
            for (int i = 1; i + 1 < n; ++i) {
                mesh.faces.emplace_back(polygon[0], polygon[i], polygon[i + 1]);
            }
        }
    }
}

void skipElement(const PlyElement& element, ValueReader& reader, const std::string& source) {
    if (element.properties.empty()) {
        return;
    }
    for (size_t i = 0; i < element.count; ++i) {
        for (const PlyProperty& property : element.properties) {
            if (property.isList) {
                const int n = toListCount(reader.next(property.countType), source);
                for (int k = 0; k < n; ++k) reader.next(property.type);
            } else {
                reader.next(property.type);
            }
        }
    }
}

} // namespace

TriangleMesh PlyReader::read(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        BACKSCAN_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                            "Cannot open mesh file: " + path);
    }
    LOG_INFO("Loading mesh from " + path);
    return read(file, path);
}

TriangleMesh PlyReader::read(std::istream& in, const std::string& sourceName) const {
    const PlyHeader header = parseHeader(in, sourceName);
    ValueReader reader(in, header.format, sourceName);

    TriangleMesh mesh;
    bool sawVertices = false;
    size_t polygonsSplit = 0;

    for (const PlyElement& element : header.elements) {
        if (element.name == "vertex") {
            readVertices(element, reader, mesh, sourceName);
            sawVertices = true;
        } else if (element.name == "face") {
            readFaces(element, reader, mesh, sourceName, polygonsSplit);
        } else {
            skipElement(element, reader, sourceName);
        }
    }

    if (!sawVertices || mesh.vertices.empty()) {
        formatError(sourceName, "no vertices found");
    }
    if (mesh.faces.empty()) {
        formatError(sourceName, "no faces found (point clouds are not supported)");
    }

    const int vertexCount = static_cast<int>(mesh.vertices.size());
    for (size_t f = 0; f < mesh.faces.size(); ++f) {
        const cv::Vec3i& face = mesh.faces[f];
        if (face[0] < 0 || face[1] < 0 || face[2] < 0 ||
            face[0] >= vertexCount || face[1] >= vertexCount || face[2] >= vertexCount) {
            formatError(sourceName, "face " + std::to_string(f) + " has an out-of-range vertex index");
        }
    }

    if (polygonsSplit > 0) {
        BACKSCAN_LOG_WARNING("PlyReader") << "Fan-triangulated " << polygonsSplit << " polygons in "
                                          << sourceName;
    }
    BACKSCAN_LOG_INFO("PlyReader") << "Loaded " << mesh.numVertices() << " vertices, "
                                   << mesh.numFaces() << " triangles from " << sourceName;
    return mesh;
}

} // namespace mesh
} // namespace backscan
