/**
 * @file HeightmapJsonExporter.cpp
 * @brief Implementation of terrain record JSON export
 */

#include "HeightmapJsonExporter.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

namespace terrain3d {

HeightmapJsonExporter::HeightmapJsonExporter()
    : options_(), logger_("HeightmapJsonExporter") {
}

HeightmapJsonExporter::HeightmapJsonExporter(const Options& options)
    : options_(options), logger_("HeightmapJsonExporter") {
}

std::string HeightmapJsonExporter::to_json_string(const TerrainRecord& record) const {
    json j;
    j["id"] = record.id;
    j["bbox"] = {
        {"lat_min", record.bounds.lat_min},
        {"lat_max", record.bounds.lat_max},
        {"lon_min", record.bounds.lon_min},
        {"lon_max", record.bounds.lon_max}
    };
    j["resolution"] = record.metadata.resolution;

    if (options_.include_heightmap) {
        json rows = json::array();
        const Heightmap& heightmap = record.heightmap;
        for (size_t i = 0; i < heightmap.rows(); ++i) {
            json row = json::array();
            for (size_t j_col = 0; j_col < heightmap.cols(); ++j_col) {
                row.push_back(heightmap(i, j_col));
            }
            rows.push_back(std::move(row));
        }
        j["heightmap"] = std::move(rows);
    }

    json metadata = {
        {"center_lat", record.metadata.center_lat},
        {"center_lon", record.metadata.center_lon},
        {"min_elevation", record.metadata.min_elevation},
        {"max_elevation", record.metadata.max_elevation},
        {"mean_elevation", record.metadata.mean_elevation},
        {"data_source", record.metadata.data_source},
        {"resolution", record.metadata.resolution},
        {"timestamp", record.created_at}
    };
    if (record.metadata.region_id) {
        metadata["region_id"] = *record.metadata.region_id;
    }
    if (record.metadata.region_name) {
        metadata["region_name"] = *record.metadata.region_name;
    }
    j["metadata"] = std::move(metadata);

    return options_.pretty_print ? j.dump(options_.indent) : j.dump();
}

bool HeightmapJsonExporter::export_json(const TerrainRecord& record, const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger_.error("Failed to open output file: " + filename);
        return false;
    }

    file << to_json_string(record);
    file.close();

    if (!file) {
        logger_.error("Failed to write " + filename);
        return false;
    }

    logger_.info("Exported heightmap JSON: " + filename);
    return true;
}

} // namespace terrain3d
