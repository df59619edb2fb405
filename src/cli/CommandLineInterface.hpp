/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the terrain3d tool
 */

#pragma once

#include "terrain3d.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <utility>

namespace terrain3d {

/**
 * @brief Command line interface for parsing arguments and configuring the generator
 *
 * Configuration sources are layered: built-in defaults, then a JSON
 * config file, then command line options.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the pipeline should run; false after help, version,
     *         --create-config, --list-regions or an error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    const TerrainConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /// Process exit code to use when parse_arguments() returned false
    int exit_code() const { return exit_code_; }

    void print_config() const;

    /**
     * @brief Merge a JSON configuration file into the current configuration
     */
    bool load_config_file(const std::string& filename);

    /**
     * @brief Write the default configuration as JSON
     */
    static bool create_default_config_file(const std::string& filename);

    /**
     * @brief Parse "lat,lon" in decimal degrees
     */
    static std::optional<std::pair<double, double>> parse_coordinate_pair(const std::string& text);

    /**
     * @brief Parse "lat_min,lat_max,lon_min,lon_max"
     */
    static std::optional<BoundingBox> parse_bounds(const std::string& bounds_str);

private:
    TerrainConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    bool parse_coordinates(const std::string& upper_left_str, const std::string& lower_right_str);
    bool apply_region(const std::string& region_id);

    bool parse_all_options(const SimpleCommandLineParser& parser);

    // Boolean option parsing with --no- variants
    void parse_boolean_option(const SimpleCommandLineParser& parser,
                              const std::string& positive_flag,
                              const std::string& negative_flag,
                              bool& config_value);

    void configure_logging(const SimpleCommandLineParser& parser);

    static void list_regions();
};

} // namespace terrain3d
