/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace terrain3d {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::setprecision(6) << value;
    return oss.str();
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid parameters:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nNothing was generated.\n";
    return oss.str();
}

ValidationResult InputValidator::validate(const TerrainConfig& config) const {
    ValidationResult result = validate_bounds(config.bounds);
    result.merge(validate_parameters(config.parameters));

    if (config.export_resolution) {
        result.add(check_resolution("--export-resolution", *config.export_resolution));
    }
    result.add(check_model_size(config));
    result.add(check_acquisition_settings(config));

    return result;
}

ValidationResult InputValidator::validate_bounds(const BoundingBox& bounds) const {
    ValidationResult result;
    result.add(check_bounds_ordering(bounds));
    result.add(check_bounds_range(bounds));
    return result;
}

ValidationResult InputValidator::validate_parameters(const TerrainParameters& params) const {
    ValidationResult result;
    result.add(check_resolution("--resolution", params.resolution));
    result.add(check_range("--height-exaggeration", params.height_exaggeration,
                           ParameterLimits::MIN_EXAGGERATION, ParameterLimits::MAX_EXAGGERATION));
    result.add(check_range("--scale-xy", params.scale_xy,
                           ParameterLimits::MIN_SCALE_XY, ParameterLimits::MAX_SCALE_XY));
    result.add(check_range("--scale-z", params.scale_z,
                           ParameterLimits::MIN_SCALE_Z, ParameterLimits::MAX_SCALE_Z));
    // Thickness only matters when a base is built
    if (params.add_base) {
        result.add(check_range("--base-thickness", params.base_thickness,
                               ParameterLimits::MIN_BASE_THICKNESS, ParameterLimits::MAX_BASE_THICKNESS, "mm"));
    }
    return result;
}

std::optional<ParameterConflict> InputValidator::check_bounds_ordering(const BoundingBox& bounds) const {
    bool lat_ok = bounds.lat_min < bounds.lat_max;
    bool lon_ok = bounds.lon_min < bounds.lon_max;
    if (lat_ok && lon_ok) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Bounding box corners are not ordered";

    if (!lat_ok) {
        conflict.involved_params.push_back("lat_min " + format_number(bounds.lat_min) +
                                           " >= lat_max " + format_number(bounds.lat_max));
    }
    if (!lon_ok) {
        conflict.involved_params.push_back("lon_min " + format_number(bounds.lon_min) +
                                           " >= lon_max " + format_number(bounds.lon_max));
    }

    conflict.suggestions = {
        "Pass --bbox as lat_min,lat_max,lon_min,lon_max with min < max",
        "Use --upper-left for the north-west corner and --lower-right for the south-east corner",
        "Pick a named area with --region (see --list-regions)"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_bounds_range(const BoundingBox& bounds) const {
    std::vector<std::string> problems;

    auto check_lat = [&](const char* name, double value) {
        if (!std::isfinite(value) || value < -90.0 || value > 90.0) {
            problems.push_back(std::string(name) + " " + format_number(value) + " outside [-90, 90]");
        }
    };
    auto check_lon = [&](const char* name, double value) {
        if (!std::isfinite(value) || value < -180.0 || value > 180.0) {
            problems.push_back(std::string(name) + " " + format_number(value) + " outside [-180, 180]");
        }
    };

    check_lat("lat_min", bounds.lat_min);
    check_lat("lat_max", bounds.lat_max);
    check_lon("lon_min", bounds.lon_min);
    check_lon("lon_max", bounds.lon_max);

    if (problems.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Bounding box lies outside valid geographic coordinates";
    conflict.involved_params = problems;
    conflict.suggestions = {
        "Latitudes must lie in [-90, 90] and longitudes in [-180, 180] decimal degrees",
        "Check that latitude and longitude were not swapped"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_resolution(const std::string& option, int resolution) const {
    if (resolution >= ParameterLimits::MIN_RESOLUTION && resolution <= ParameterLimits::MAX_RESOLUTION) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Grid resolution out of range";
    conflict.involved_params = {
        option + " " + std::to_string(resolution),
        "Accepted range: " + std::to_string(ParameterLimits::MIN_RESOLUTION) + " to " +
            std::to_string(ParameterLimits::MAX_RESOLUTION)
    };

    int clamped = resolution < ParameterLimits::MIN_RESOLUTION ? ParameterLimits::MIN_RESOLUTION
                                                                : ParameterLimits::MAX_RESOLUTION;
    conflict.suggestions = {
        "Use " + option + " " + std::to_string(clamped),
        "Use " + option + " 256 (default, about 260k triangles with a base)"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_range(const std::string& option, double value,
                                                             double min_value, double max_value,
                                                             const std::string& unit) const {
    if (std::isfinite(value) && value >= min_value && value <= max_value) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Value of " + option + " out of range";
    conflict.involved_params = {
        option + " " + format_number(value) + unit,
        "Accepted range: " + format_number(min_value) + unit + " to " + format_number(max_value) + unit
    };

    double clamped = (std::isfinite(value) && value > max_value) ? max_value : min_value;
    conflict.suggestions = {
        "Use " + option + " " + format_number(clamped) + unit
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_acquisition_settings(const TerrainConfig& config) const {
    std::vector<std::string> problems;

    if (config.batch_size < 1 || config.batch_size > ParameterLimits::MAX_BATCH_SIZE) {
        problems.push_back("--batch-size " + std::to_string(config.batch_size) + " (must be 1 to " +
                           std::to_string(ParameterLimits::MAX_BATCH_SIZE) + ")");
    }
    if (config.batch_delay_ms < 0) {
        problems.push_back("--batch-delay-ms " + std::to_string(config.batch_delay_ms) + " (must be >= 0)");
    }
    if (config.provider_timeout_seconds < 1) {
        problems.push_back("--timeout " + std::to_string(config.provider_timeout_seconds) + " (must be >= 1)");
    }
    if (config.max_retries < 1) {
        problems.push_back("--max-retries " + std::to_string(config.max_retries) + " (must be >= 1)");
    }
    if (config.retry_backoff_ms < 0) {
        problems.push_back("retry_backoff_ms " + std::to_string(config.retry_backoff_ms) + " (must be >= 0)");
    }
    if (config.cache_capacity < 1) {
        problems.push_back("cache_capacity 0 (must be >= 1)");
    }

    if (problems.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Invalid elevation provider settings";
    conflict.involved_params = problems;
    conflict.suggestions = {
        "Omit these options to use the defaults (500 points per batch, 100 ms delay, 30 s timeout, 3 attempts)",
        "Use --offline to skip the elevation provider entirely"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_model_size(const TerrainConfig& config) const {
    if (std::isfinite(config.model_size_mm) && config.model_size_mm > 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Model size must be positive";
    conflict.involved_params = {"--model-size " + format_number(config.model_size_mm) + "mm"};
    conflict.suggestions = {"Use --model-size 100 (default footprint in mm)"};
    return conflict;
}

} // namespace terrain3d
