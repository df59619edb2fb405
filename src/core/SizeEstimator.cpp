/**
 * @file SizeEstimator.cpp
 * @brief Implementation of output estimates
 */

#include "SizeEstimator.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace terrain3d {

size_t SizeEstimator::estimate_triangle_count(int resolution, bool add_base) {
    if (resolution < 2) return 0;
    size_t edge_cells = static_cast<size_t>(resolution - 1);
    size_t triangles = 2 * edge_cells * edge_cells;
    if (add_base) {
        triangles += 2 * edge_cells * edge_cells;
        triangles += 4 * 2 * edge_cells;
    }
    return triangles;
}

size_t SizeEstimator::estimate_file_size(int resolution, bool add_base) {
    return 84 + estimate_triangle_count(resolution, add_base) * 50;
}

double SizeEstimator::estimate_print_hours(int resolution, double scale) {
    double resolution_factor = static_cast<double>(resolution) / BASE_PRINT_RESOLUTION;
    return BASE_PRINT_HOURS * resolution_factor * resolution_factor * scale * scale;
}

std::string SizeEstimator::estimate_print_time(int resolution, double scale) {
    double hours = estimate_print_hours(resolution, scale);

    std::ostringstream oss;
    if (hours < 1.0) {
        oss << static_cast<int>(hours * 60.0) << " minutes";
    } else {
        oss << std::fixed << std::setprecision(1) << hours << " hours";
    }
    return oss.str();
}

SizeEstimate SizeEstimator::estimate(int resolution, bool add_base, double scale) {
    SizeEstimate result;
    result.triangle_count = estimate_triangle_count(resolution, add_base);
    result.file_size_bytes = estimate_file_size(resolution, add_base);
    result.file_size_mb = std::round(static_cast<double>(result.file_size_bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
    result.print_time = estimate_print_time(resolution, scale);
    return result;
}

} // namespace terrain3d
