/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "terrain3d.hpp"
#include "../core/Logger.hpp"
#include "../core/RegionCatalog.hpp"
#include "version.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <algorithm>
#include <type_traits>

using json = nlohmann::json;

namespace terrain3d {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("terrain3d",
        "watertight, 3D-printable terrain models as binary STL.\n"
        "Elevations come from an Open-Elevation compatible service or a local DEM\n"
        "raster; without either, a deterministic synthetic terrain is generated.");

    parser.begin_section("AREA SELECTION");
    parser.add_option("region", "r", "Named region id (see --list-regions)");
    parser.add_flag("list-regions", "", "List the built-in regions and exit");
    parser.add_option("bbox", "b", "lat_min,lat_max,lon_min,lon_max in decimal degrees");
    parser.add_option("upper-left", "", "Northwest corner lat,lon");
    parser.add_option("lower-right", "", "Southeast corner lat,lon");

    parser.begin_section("MODEL");
    parser.add_option("resolution", "", "Heightmap grid size, 64-512 (default: 256)");
    parser.add_option("height-exaggeration", "", "Vertical stretch of the elevations, 0.5-5 (default: 1.5)");
    parser.add_option("export-resolution", "", "Mesh grid size when different from --resolution");
    parser.add_option("scale-xy", "", "Horizontal scale, 0.1-10 (default: 1.0)");
    parser.add_option("scale-z", "", "Vertical scale, 0.5-5 (default: 1.5)");
    parser.add_option("model-size", "", "Footprint in mm at scale 1 (default: 100)");
    parser.add_flag("add-base", "", "Close the model with walls and a bottom (default)");
    parser.add_flag("no-base", "", "Top surface only, not printable");
    parser.add_option("base-thickness", "", "Base thickness in mm, 1-20 (default: 5)");
    parser.add_flag("carve-valleys", "", "Deepen valleys in synthetic terrain");

    parser.begin_section("ELEVATION SOURCE");
    parser.add_flag("offline", "", "Skip the elevation service and synthesize terrain");
    parser.add_option("dem-file", "", "Local DEM raster (GeoTIFF, .hgt, .asc)");
    parser.add_option("provider-url", "", "Elevation lookup endpoint");
    parser.add_option("batch-size", "", "Points per request, 1-500 (default: 500)");
    parser.add_option("batch-delay-ms", "", "Pause between requests in ms (default: 100)");
    parser.add_option("timeout", "", "Request timeout in seconds (default: 30)");
    parser.add_option("max-retries", "", "Attempts per request (default: 3)");

    parser.begin_section("OUTPUT");
    parser.add_option("output", "o", "STL filename (default: terrain_<region>_<resolution>.stl)");
    parser.add_option("heightmap-json", "", "Also write the heightmap and metadata as JSON");
    parser.add_flag("estimate", "e", "Print size and print time estimates and exit");
    parser.add_flag("dry-run", "", "Parse and validate without processing");

    parser.begin_section("CONFIGURATION & LOGGING");
    parser.add_option("config", "c", "Load configuration from a JSON file");
    parser.add_option("create-config", "", "Write the default configuration to a JSON file");
    parser.add_option("log-level", "", "1=ERROR 2=WARNING 3=INFO 4=DETAILED 5=DEBUG 6=TRACE, "
                                       "or per component: \"3,HeightmapAcquirer=6\"");
    parser.add_option("log-file", "", "Also append log lines to a file");
    parser.add_flag("silent", "s", "Errors only (same as --log-level 1)");
    parser.add_flag("verbose", "v", "Everything (same as --log-level 6)");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 2;
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "terrain3d v" << TERRAIN3D_VERSION_STRING << std::endl;
        std::cout << "Heightmap to watertight binary STL terrain generator" << std::endl;
        std::cout << "Built with Eigen, GDAL, libcurl, nlohmann::json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (parser.get_flag("list-regions")) {
        list_regions();
        exit_code_ = 0;
        return false;
    }

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    // Load configuration file if specified
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 2;
            return false;
        }
        config_.config_file = config_file.value();
    }

    // Area selection: region, then explicit coordinates on top
    if (auto region = parser.get("region")) {
        if (!apply_region(region.value())) {
            exit_code_ = 2;
            return false;
        }
    }

    auto bbox = parser.get("bbox");
    auto upper_left = parser.get("upper-left");
    auto lower_right = parser.get("lower-right");

    if (bbox.has_value()) {
        auto bounds = parse_bounds(bbox.value());
        if (!bounds) {
            std::cerr << "Invalid bounding box format. Use: lat_min,lat_max,lon_min,lon_max" << std::endl;
            exit_code_ = 2;
            return false;
        }
        config_.bounds = *bounds;
    } else if (upper_left.has_value() && lower_right.has_value()) {
        if (!parse_coordinates(upper_left.value(), lower_right.value())) {
            std::cerr << "Invalid coordinate format. Use: lat,lon" << std::endl;
            exit_code_ = 2;
            return false;
        }
    } else if (upper_left.has_value() || lower_right.has_value()) {
        std::cerr << "--upper-left and --lower-right must be given together" << std::endl;
        exit_code_ = 2;
        return false;
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 2;
        return false;
    }

    return true;
}

std::optional<std::pair<double, double>> CommandLineInterface::parse_coordinate_pair(const std::string& text) {
    size_t comma = text.find(',');
    if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
        return std::nullopt;
    }

    try {
        size_t used = 0;
        std::string lat_str = text.substr(0, comma);
        std::string lon_str = text.substr(comma + 1);
        double lat = std::stod(lat_str, &used);
        if (used != lat_str.size()) return std::nullopt;
        double lon = std::stod(lon_str, &used);
        if (used != lon_str.size()) return std::nullopt;
        return std::make_pair(lat, lon);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool CommandLineInterface::parse_coordinates(const std::string& upper_left_str, const std::string& lower_right_str) {
    auto upper_left = parse_coordinate_pair(upper_left_str);
    auto lower_right = parse_coordinate_pair(lower_right_str);
    if (!upper_left || !lower_right) {
        return false;
    }

    // Ordering is checked by the validator together with everything else
    config_.bounds = BoundingBox(lower_right->first, upper_left->first,
                                 upper_left->second, lower_right->second);
    config_.region_id.reset();
    return true;
}

std::optional<BoundingBox> CommandLineInterface::parse_bounds(const std::string& bounds_str) {
    std::istringstream iss(bounds_str);
    std::string token;
    std::vector<double> coords;

    while (std::getline(iss, token, ',')) {
        try {
            size_t used = 0;
            coords.push_back(std::stod(token, &used));
            if (used != token.size()) {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    if (coords.size() != 4) {
        return std::nullopt;
    }

    return BoundingBox(coords[0], coords[1], coords[2], coords[3]);
}

bool CommandLineInterface::apply_region(const std::string& region_id) {
    auto region = RegionCatalog::find(region_id);
    if (!region) {
        std::cerr << "Region '" << region_id << "' not found. Available regions:";
        for (const auto& id : RegionCatalog::ids()) {
            std::cerr << " " << id;
        }
        std::cerr << std::endl;
        return false;
    }

    config_.bounds = region->bounds;
    config_.region_id = region->id;
    config_.parameters.resolution = region->default_resolution;
    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    bool ok = true;

    auto read_int = [&](const std::string& name, int& target) {
        if (!parser.get(name)) return;
        if (auto value = parser.get_as<int>(name)) {
            target = value.value();
        } else {
            std::cerr << "Option --" << name << " expects an integer, got '" << parser.get(name).value() << "'" << std::endl;
            ok = false;
        }
    };
    auto read_double = [&](const std::string& name, double& target) {
        if (!parser.get(name)) return;
        if (auto value = parser.get_as<double>(name)) {
            target = value.value();
        } else {
            std::cerr << "Option --" << name << " expects a number, got '" << parser.get(name).value() << "'" << std::endl;
            ok = false;
        }
    };

    // Model options
    read_int("resolution", config_.parameters.resolution);
    read_double("height-exaggeration", config_.parameters.height_exaggeration);
    if (parser.get("export-resolution")) {
        int export_resolution = 0;
        read_int("export-resolution", export_resolution);
        config_.export_resolution = export_resolution;
    }
    read_double("scale-xy", config_.parameters.scale_xy);
    read_double("scale-z", config_.parameters.scale_z);
    read_double("model-size", config_.model_size_mm);
    parse_boolean_option(parser, "add-base", "no-base", config_.parameters.add_base);
    read_double("base-thickness", config_.parameters.base_thickness);
    if (parser.get_flag("carve-valleys")) config_.carve_valleys = true;

    // Elevation sources
    if (parser.get_flag("offline")) config_.offline = true;
    if (auto value = parser.get("dem-file")) config_.dem_file = value.value();
    if (auto value = parser.get("provider-url")) config_.provider_url = value.value();
    read_int("batch-size", config_.batch_size);
    read_int("batch-delay-ms", config_.batch_delay_ms);
    read_int("timeout", config_.provider_timeout_seconds);
    read_int("max-retries", config_.max_retries);

    // Output options
    if (auto value = parser.get("output")) config_.output_file = value.value();
    if (auto value = parser.get("heightmap-json")) config_.heightmap_json = value.value();
    if (parser.get_flag("estimate")) config_.estimate_only = true;

    configure_logging(parser);

    // Utility flags
    dry_run_ = parser.get_flag("dry-run");

    return ok;
}

void CommandLineInterface::parse_boolean_option(const SimpleCommandLineParser& parser,
                                                const std::string& positive_flag,
                                                const std::string& negative_flag,
                                                bool& config_value) {
    if (parser.get_flag(positive_flag)) {
        config_value = true;
    } else if (parser.get_flag(negative_flag)) {
        config_value = false;
    }
    // If neither is specified, keep default value
}

void CommandLineInterface::configure_logging(const SimpleCommandLineParser& parser) {
    // Priority: flags > CLI > environment > config file > defaults
    config_.log_level = std::clamp(config_.log_level, 1, 6);
    Logger::setDefaultLevel(static_cast<LogLevel>(config_.log_level));

    const char* env_log_level = std::getenv(LOG_LEVEL_ENV);
    if (env_log_level) {
        if (auto level = Logger::parseLogConfig(env_log_level)) {
            config_.log_level = *level;
        }
    }

    if (auto value = parser.get("log-level")) {
        if (auto level = Logger::parseLogConfig(value.value())) {
            config_.log_level = *level;
        }
    }

    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    const char* env_log_file = std::getenv(LOG_FILE_ENV);
    if (env_log_file) {
        config_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();  // CLI overrides environment
    }
}

void CommandLineInterface::list_regions() {
    std::cout << "Available regions:\n\n";
    for (const auto& region : RegionCatalog::all()) {
        std::cout << "  " << std::left << std::setw(18) << region.id << region.name << "\n";
        std::cout << "  " << std::setw(18) << "" << std::fixed << std::setprecision(2)
                  << region.bounds.lat_min << " to " << region.bounds.lat_max << " N, "
                  << region.bounds.lon_min << " to " << region.bounds.lon_max << " E, "
                  << std::setprecision(0) << region.min_elevation << "-" << region.max_elevation << " m\n";
        std::cout << "  " << std::setw(18) << "" << region.description << "\n\n";
        std::cout.unsetf(std::ios_base::floatfield);
        std::cout << std::right;
    }
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    TerrainConfig defaults;

    json config;
    config["bbox"] = {
        {"lat_min", defaults.bounds.lat_min},
        {"lat_max", defaults.bounds.lat_max},
        {"lon_min", defaults.bounds.lon_min},
        {"lon_max", defaults.bounds.lon_max}
    };
    config["region"] = nullptr;
    config["resolution"] = defaults.parameters.resolution;
    config["height_exaggeration"] = defaults.parameters.height_exaggeration;
    config["export_resolution"] = nullptr;
    config["scale_xy"] = defaults.parameters.scale_xy;
    config["scale_z"] = defaults.parameters.scale_z;
    config["add_base"] = defaults.parameters.add_base;
    config["base_thickness"] = defaults.parameters.base_thickness;
    config["model_size_mm"] = defaults.model_size_mm;
    config["carve_valleys"] = defaults.carve_valleys;
    config["offline"] = defaults.offline;
    config["dem_file"] = nullptr;
    config["provider_url"] = defaults.provider_url;
    config["timeout_seconds"] = defaults.provider_timeout_seconds;
    config["batch_size"] = defaults.batch_size;
    config["batch_delay_ms"] = defaults.batch_delay_ms;
    config["max_retries"] = defaults.max_retries;
    config["retry_backoff_ms"] = defaults.retry_backoff_ms;
    config["cache_capacity"] = defaults.cache_capacity;
    config["output"] = nullptr;
    config["heightmap_json"] = nullptr;
    config["log_level"] = defaults.log_level;

    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config.dump(2) << "\n";
    return static_cast<bool>(file);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json config;
        file >> config;

        auto read = [&config](const std::string& key, auto& target) {
            if (config.contains(key) && !config[key].is_null()) {
                target = config[key].get<std::decay_t<decltype(target)>>();
            }
        };
        auto read_optional = [&config](const std::string& key, auto& target) {
            if (config.contains(key) && !config[key].is_null()) {
                target = config[key].get<typename std::decay_t<decltype(target)>::value_type>();
            }
        };

        if (config.contains("region") && config["region"].is_string()) {
            if (!apply_region(config["region"].get<std::string>())) {
                return false;
            }
        }

        if (config.contains("bbox") && config["bbox"].is_object()) {
            const auto& bbox = config["bbox"];
            config_.bounds = BoundingBox(bbox.at("lat_min").get<double>(), bbox.at("lat_max").get<double>(),
                                         bbox.at("lon_min").get<double>(), bbox.at("lon_max").get<double>());
        }

        read("resolution", config_.parameters.resolution);
        read("height_exaggeration", config_.parameters.height_exaggeration);
        read_optional("export_resolution", config_.export_resolution);
        read("scale_xy", config_.parameters.scale_xy);
        read("scale_z", config_.parameters.scale_z);
        read("add_base", config_.parameters.add_base);
        read("base_thickness", config_.parameters.base_thickness);
        read("model_size_mm", config_.model_size_mm);
        read("carve_valleys", config_.carve_valleys);

        read("offline", config_.offline);
        read_optional("dem_file", config_.dem_file);
        read("provider_url", config_.provider_url);
        read("timeout_seconds", config_.provider_timeout_seconds);
        read("batch_size", config_.batch_size);
        read("batch_delay_ms", config_.batch_delay_ms);
        read("max_retries", config_.max_retries);
        read("retry_backoff_ms", config_.retry_backoff_ms);
        read("cache_capacity", config_.cache_capacity);

        read_optional("output", config_.output_file);
        read_optional("heightmap_json", config_.heightmap_json);
        read("log_level", config_.log_level);
        read_optional("log_file", config_.log_file);

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    }
}

void CommandLineInterface::print_config() const {
    if (config_.log_level < 4) return;  // DETAILED level or higher

    std::cout << "\n=== Configuration ===\n";
    std::cout << "Bounds: " << config_.bounds.lat_min << " to " << config_.bounds.lat_max << " lat, "
              << config_.bounds.lon_min << " to " << config_.bounds.lon_max << " lon\n";
    if (config_.region_id) {
        std::cout << "Region: " << *config_.region_id << "\n";
    }
    std::cout << "Resolution: " << config_.parameters.resolution << "\n";
    std::cout << "Height exaggeration: " << config_.parameters.height_exaggeration << "\n";
    std::cout << "Scale XY/Z: " << config_.parameters.scale_xy << " / " << config_.parameters.scale_z << "\n";
    std::cout << "Base: " << (config_.parameters.add_base
                                  ? std::to_string(config_.parameters.base_thickness) + "mm"
                                  : std::string("none")) << "\n";
    std::cout << "Source: " << (config_.dem_file ? "DEM file " + *config_.dem_file
                                : config_.offline ? std::string("synthetic (offline)")
                                                  : config_.provider_url) << "\n";
    std::cout << "===================\n\n";
}

} // namespace terrain3d
