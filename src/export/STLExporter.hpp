/**
 * @file STLExporter.hpp
 * @brief Binary STL encoding and decoding for terrain meshes
 *
 * Layout: 80-byte header, uint32 little-endian triangle count, then per
 * triangle a float32 normal, three float32 vertices and a uint16 attribute
 * word (always 0). All multi-byte values are little-endian regardless of
 * host byte order.
 */

#pragma once

#include "terrain3d.hpp"
#include "../core/TerrainMesh.hpp"
#include "../core/Logger.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace terrain3d {

/**
 * @brief One facet as stored in the file
 */
struct StlTriangle {
    std::array<float, 3> normal{};
    std::array<std::array<float, 3>, 3> vertices{};
    uint16_t attribute = 0;
};

/**
 * @brief Decoded binary STL file
 */
struct StlContents {
    std::string header;                 ///< Header text up to the first NUL
    std::vector<StlTriangle> triangles;
};

/**
 * @brief Binary STL serializer
 */
class STLExporter {
public:
    static constexpr size_t HEADER_SIZE = 80;
    static constexpr size_t COUNT_SIZE = 4;
    static constexpr size_t TRIANGLE_RECORD_SIZE = 50;

    struct Options {
        std::string header_text;
        bool compute_normals;

        Options()
            : header_text("terrain3d binary STL"),
              compute_normals(true) {}
    };

    STLExporter();
    explicit STLExporter(const Options& options);

    /**
     * @brief Encode a mesh
     * @throws SerializationError when a face references a missing vertex or
     *         the face count does not fit the 32-bit count field
     */
    std::vector<uint8_t> serialize(const TerrainMesh& mesh) const;

    /**
     * @brief Encode a mesh and write it to disk
     * @return true if the file was written completely
     */
    bool export_stl(const TerrainMesh& mesh, const std::string& filename) const;

    /**
     * @brief Write already encoded bytes to disk
     */
    bool write_bytes(const std::vector<uint8_t>& bytes, const std::string& filename) const;

    /**
     * @brief Decode a binary STL buffer
     * @throws std::runtime_error if the buffer is truncated or its size
     *         disagrees with the triangle count
     */
    static StlContents parse(const std::vector<uint8_t>& bytes);

    /**
     * @brief Byte length of a file holding the given number of triangles
     */
    static size_t file_size_for(size_t triangle_count) {
        return HEADER_SIZE + COUNT_SIZE + triangle_count * TRIANGLE_RECORD_SIZE;
    }

private:
    Options options_;
    Logger logger_;
};

} // namespace terrain3d
