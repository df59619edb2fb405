/**
 * @file InputValidator.hpp
 * @brief Boundary validation of generation and export parameters
 *
 * Collects every out-of-range or contradictory input in one pass and
 * reports them together with suggested fixes, before any computation.
 */

#pragma once

#include "terrain3d.hpp"
#include <string>
#include <vector>
#include <optional>

namespace terrain3d {

/**
 * @brief Accepted parameter ranges (inclusive)
 */
struct ParameterLimits {
    static constexpr int MIN_RESOLUTION = 64;
    static constexpr int MAX_RESOLUTION = 512;
    static constexpr double MIN_EXAGGERATION = 0.5;
    static constexpr double MAX_EXAGGERATION = 5.0;
    static constexpr double MIN_SCALE_XY = 0.1;
    static constexpr double MAX_SCALE_XY = 10.0;
    static constexpr double MIN_SCALE_Z = 0.5;
    static constexpr double MAX_SCALE_Z = 5.0;
    static constexpr double MIN_BASE_THICKNESS = 1.0;
    static constexpr double MAX_BASE_THICKNESS = 20.0;
    static constexpr int MAX_BATCH_SIZE = 500;
};

/**
 * @brief One rejected input with the parameters involved and possible fixes
 */
struct ParameterConflict {
    std::string description;
    std::vector<std::string> involved_params;
    std::vector<std::string> suggestions;
};

/**
 * @brief Result of input validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    void add(std::optional<ParameterConflict> conflict) {
        if (conflict) {
            conflicts.push_back(std::move(*conflict));
            is_valid = false;
        }
    }

    void merge(const ValidationResult& other) {
        for (const auto& conflict : other.conflicts) {
            conflicts.push_back(conflict);
        }
        is_valid = is_valid && other.is_valid;
    }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate a complete command line configuration
     */
    ValidationResult validate(const TerrainConfig& config) const;

    ValidationResult validate_bounds(const BoundingBox& bounds) const;

    /**
     * @brief Check resolution, exaggeration, scales and base thickness
     */
    ValidationResult validate_parameters(const TerrainParameters& params) const;

private:
    std::optional<ParameterConflict> check_bounds_ordering(const BoundingBox& bounds) const;
    std::optional<ParameterConflict> check_bounds_range(const BoundingBox& bounds) const;

    std::optional<ParameterConflict> check_resolution(const std::string& option, int resolution) const;

    /**
     * @brief Generic inclusive range check for a floating point option
     */
    std::optional<ParameterConflict> check_range(const std::string& option, double value,
                                                 double min_value, double max_value,
                                                 const std::string& unit = "") const;

    std::optional<ParameterConflict> check_acquisition_settings(const TerrainConfig& config) const;
    std::optional<ParameterConflict> check_model_size(const TerrainConfig& config) const;
};

} // namespace terrain3d
