/**
 * @file HeightmapJsonExporter.hpp
 * @brief JSON export of a generated terrain record
 *
 * Writes the heightmap as an array of rows (north to south) together with
 * its bounding box and metadata, for viewers and downstream tooling.
 */

#pragma once

#include "terrain3d.hpp"
#include "../core/Logger.hpp"
#include <string>

namespace terrain3d {

class HeightmapJsonExporter {
public:
    struct Options {
        bool pretty_print;
        int indent;
        bool include_heightmap;

        Options()
            : pretty_print(false),
              indent(2),
              include_heightmap(true) {}
    };

    HeightmapJsonExporter();
    explicit HeightmapJsonExporter(const Options& options);

    /**
     * @brief Write the record to a file
     * @return true if the file was written
     */
    bool export_json(const TerrainRecord& record, const std::string& filename) const;

    /**
     * @brief Record as a JSON document: id, bbox, resolution, heightmap, metadata
     */
    std::string to_json_string(const TerrainRecord& record) const;

private:
    Options options_;
    Logger logger_;
};

} // namespace terrain3d
