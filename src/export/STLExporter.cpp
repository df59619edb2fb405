/**
 * @file STLExporter.cpp
 * @brief Implementation of binary STL encoding
 */

#include "STLExporter.hpp"
#include <algorithm>
#include <fstream>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace terrain3d {

namespace {

void put_u16(uint8_t* out, uint16_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void put_u32(uint8_t* out, uint32_t value) {
    for (int b = 0; b < 4; ++b) {
        out[b] = static_cast<uint8_t>((value >> (8 * b)) & 0xFF);
    }
}

void put_f32(uint8_t* out, float value) {
    uint32_t bits;
    static_assert(sizeof(bits) == sizeof(value), "float must be 32-bit");
    std::memcpy(&bits, &value, sizeof(bits));
    put_u32(out, bits);
}

uint16_t get_u16(const uint8_t* in) {
    return static_cast<uint16_t>(in[0] | (in[1] << 8));
}

uint32_t get_u32(const uint8_t* in) {
    uint32_t value = 0;
    for (int b = 0; b < 4; ++b) {
        value |= static_cast<uint32_t>(in[b]) << (8 * b);
    }
    return value;
}

float get_f32(const uint8_t* in) {
    uint32_t bits = get_u32(in);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace

STLExporter::STLExporter() : options_(), logger_("STLExporter") {
}

STLExporter::STLExporter(const Options& options) : options_(options), logger_("STLExporter") {
}

std::vector<uint8_t> STLExporter::serialize(const TerrainMesh& mesh) const {
    const auto& faces = mesh.faces();
    const auto& vertices = mesh.vertices();

    if (faces.size() > std::numeric_limits<uint32_t>::max()) {
        throw SerializationError("Mesh has " + std::to_string(faces.size()) +
                                 " triangles, more than a binary STL can count");
    }

    std::vector<uint8_t> bytes(file_size_for(faces.size()), 0);

    size_t header_length = std::min(options_.header_text.size(), HEADER_SIZE);
    std::memcpy(bytes.data(), options_.header_text.data(), header_length);
    put_u32(bytes.data() + HEADER_SIZE, static_cast<uint32_t>(faces.size()));

    uint8_t* cursor = bytes.data() + HEADER_SIZE + COUNT_SIZE;
    for (size_t f = 0; f < faces.size(); ++f) {
        const Face& face = faces[f];
        for (VertexId id : face) {
            if (id >= vertices.size()) {
                throw SerializationError("Face " + std::to_string(f) + " references vertex " +
                                         std::to_string(id) + " but the mesh has " +
                                         std::to_string(vertices.size()) + " vertices");
            }
        }

        Vector3D normal;
        if (options_.compute_normals) {
            normal = mesh.compute_face_normal(static_cast<FaceId>(f));
        }
        put_f32(cursor + 0, static_cast<float>(normal.x()));
        put_f32(cursor + 4, static_cast<float>(normal.y()));
        put_f32(cursor + 8, static_cast<float>(normal.z()));

        for (int k = 0; k < 3; ++k) {
            const Point3D& v = vertices[face[k]];
            uint8_t* slot = cursor + 12 + 12 * k;
            put_f32(slot + 0, static_cast<float>(v.x()));
            put_f32(slot + 4, static_cast<float>(v.y()));
            put_f32(slot + 8, static_cast<float>(v.z()));
        }

        put_u16(cursor + 48, 0);
        cursor += TRIANGLE_RECORD_SIZE;
    }

    if (cursor != bytes.data() + bytes.size()) {
        throw SerializationError("STL buffer size mismatch after encoding");
    }

    logger_.debug("Serialized " + std::to_string(faces.size()) + " triangles into " +
                  std::to_string(bytes.size()) + " bytes");
    return bytes;
}

bool STLExporter::export_stl(const TerrainMesh& mesh, const std::string& filename) const {
    return write_bytes(serialize(mesh), filename);
}

bool STLExporter::write_bytes(const std::vector<uint8_t>& bytes, const std::string& filename) const {
    std::ofstream file(filename, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        logger_.error("Cannot open file for writing: " + filename);
        return false;
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        logger_.error("Failed to write STL file: " + filename);
        return false;
    }

    logger_.info("Wrote " + filename + " (" + std::to_string(bytes.size()) + " bytes)");
    return true;
}

StlContents STLExporter::parse(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < HEADER_SIZE + COUNT_SIZE) {
        throw std::runtime_error("STL buffer too short: " + std::to_string(bytes.size()) + " bytes");
    }

    uint32_t count = get_u32(bytes.data() + HEADER_SIZE);
    if (bytes.size() != file_size_for(count)) {
        throw std::runtime_error("STL buffer holds " + std::to_string(bytes.size()) +
                                 " bytes but declares " + std::to_string(count) + " triangles");
    }

    StlContents contents;
    const char* header = reinterpret_cast<const char*>(bytes.data());
    contents.header.assign(header, strnlen(header, HEADER_SIZE));
    contents.triangles.resize(count);

    const uint8_t* cursor = bytes.data() + HEADER_SIZE + COUNT_SIZE;
    for (auto& triangle : contents.triangles) {
        for (int c = 0; c < 3; ++c) {
            triangle.normal[c] = get_f32(cursor + 4 * c);
        }
        for (int k = 0; k < 3; ++k) {
            for (int c = 0; c < 3; ++c) {
                triangle.vertices[k][c] = get_f32(cursor + 12 + 12 * k + 4 * c);
            }
        }
        triangle.attribute = get_u16(cursor + 48);
        cursor += TRIANGLE_RECORD_SIZE;
    }

    return contents;
}

} // namespace terrain3d
