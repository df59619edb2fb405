/**
 * @file SizeEstimator.hpp
 * @brief Analytic estimates of STL size, triangle count and print duration
 *
 * Pure functions: no I/O, no mesh construction. The counts match what
 * MeshBuilder emits for a square grid of the same resolution.
 */

#pragma once

#include <cstddef>
#include <string>

namespace terrain3d {

/**
 * @brief Estimate returned to the caller before generating a file
 */
struct SizeEstimate {
    size_t file_size_bytes = 0;
    double file_size_mb = 0.0;       ///< Rounded to two decimals
    size_t triangle_count = 0;
    std::string print_time;          ///< e.g. "45 minutes" or "3.5 hours"
};

class SizeEstimator {
public:
    /// Print time of a resolution-128 model at scale 1
    static constexpr double BASE_PRINT_HOURS = 2.0;
    static constexpr int BASE_PRINT_RESOLUTION = 128;

    /**
     * @brief Triangles of a square resolution x resolution model
     *
     * 2(r-1)^2 for the surface; with a base the bottom doubles that and the
     * four walls add 4*2*(r-1).
     */
    static size_t estimate_triangle_count(int resolution, bool add_base);

    /**
     * @brief 84-byte preamble plus 50 bytes per triangle
     */
    static size_t estimate_file_size(int resolution, bool add_base);

    /**
     * @brief Hours scale with (resolution/128)^2 * scale^2 from a 2 hour base
     */
    static double estimate_print_hours(int resolution, double scale);

    /**
     * @brief Human readable print time: minutes under an hour, else hours to one decimal
     */
    static std::string estimate_print_time(int resolution, double scale);

    static SizeEstimate estimate(int resolution, bool add_base, double scale);
};

} // namespace terrain3d
