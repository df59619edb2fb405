#pragma once

/**
 * @file terrain3d.hpp
 * @brief Main header for the terrain3d heightmap-to-STL generator
 *
 * Turns a geographic bounding box into a watertight, 3D-printable terrain
 * solid: elevation acquisition (with deterministic synthetic fallback),
 * spline resampling, mesh construction and binary STL serialization.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <memory>
#include <vector>
#include <string>
#include <array>
#include <optional>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>

// Linear algebra
#include <Eigen/Dense>

namespace terrain3d {

class TerrainMesh;
class TerrainCache;
class ElevationProvider;

// ============================================================================
// Geometry Types
// ============================================================================

/**
 * @brief 3D point with x, y, z coordinates
 */
struct Point3D {
    double x_, y_, z_;

    Point3D() : x_(0), y_(0), z_(0) {}
    Point3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    bool operator==(const Point3D& other) const {
        return x_ == other.x_ && y_ == other.y_ && z_ == other.z_;
    }
};

/**
 * @brief 3D vector for normals and directions
 */
struct Vector3D {
    double x_, y_, z_;

    Vector3D() : x_(0), y_(0), z_(0) {}
    Vector3D(double x, double y, double z) : x_(x), y_(y), z_(z) {}
    Vector3D(const Point3D& from, const Point3D& to)
        : x_(to.x() - from.x()), y_(to.y() - from.y()), z_(to.z() - from.z()) {}

    double x() const { return x_; }
    double y() const { return y_; }
    double z() const { return z_; }

    Vector3D cross(const Vector3D& other) const {
        return Vector3D(
            y_ * other.z_ - z_ * other.y_,
            z_ * other.x_ - x_ * other.z_,
            x_ * other.y_ - y_ * other.x_
        );
    }

    double length() const {
        return std::sqrt(x_ * x_ + y_ * y_ + z_ * z_);
    }

    // Zero vector stays zero
    Vector3D normalized() const {
        double len = length();
        if (len < 1e-15) return Vector3D();
        return Vector3D(x_ / len, y_ / len, z_ / len);
    }
};

using VertexId = uint32_t;
using FaceId = uint32_t;
using EdgeId = uint64_t;

/// Directed edge key: high 32 bits source vertex, low 32 bits target vertex
inline EdgeId make_edge_id(VertexId from, VertexId to) {
    return (static_cast<EdgeId>(from) << 32) | static_cast<EdgeId>(to);
}

/**
 * @brief Triangle as three vertex indices, counter-clockwise seen from outside
 */
using Face = std::array<VertexId, 3>;

// ============================================================================
// Geographic Types
// ============================================================================

/**
 * @brief Geographic bounding box in decimal degrees
 */
struct BoundingBox {
    double lat_min = 0.0;
    double lat_max = 0.0;
    double lon_min = 0.0;
    double lon_max = 0.0;

    BoundingBox() = default;
    BoundingBox(double lat_min, double lat_max, double lon_min, double lon_max)
        : lat_min(lat_min), lat_max(lat_max), lon_min(lon_min), lon_max(lon_max) {}

    double center_lat() const { return (lat_min + lat_max) / 2.0; }
    double center_lon() const { return (lon_min + lon_max) / 2.0; }
    double lat_span() const { return lat_max - lat_min; }
    double lon_span() const { return lon_max - lon_min; }

    bool is_ordered() const { return lat_min < lat_max && lon_min < lon_max; }

    bool operator==(const BoundingBox& other) const {
        return lat_min == other.lat_min && lat_max == other.lat_max &&
               lon_min == other.lon_min && lon_max == other.lon_max;
    }
};

/**
 * @brief Rectangular elevation grid in meters
 *
 * Single contiguous row-major buffer; row 0 is the northernmost sample row,
 * column 0 the westernmost sample column.
 */
class Heightmap {
public:
    using Grid = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

    Heightmap() = default;
    Heightmap(size_t rows, size_t cols, double fill = 0.0)
        : grid_(Grid::Constant(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols), fill)) {}
    explicit Heightmap(Grid grid) : grid_(std::move(grid)) {}

    size_t rows() const { return static_cast<size_t>(grid_.rows()); }
    size_t cols() const { return static_cast<size_t>(grid_.cols()); }
    size_t size() const { return static_cast<size_t>(grid_.size()); }
    bool empty() const { return grid_.size() == 0; }
    bool is_square() const { return grid_.rows() == grid_.cols(); }

    double operator()(size_t row, size_t col) const {
        return grid_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }
    double& operator()(size_t row, size_t col) {
        return grid_(static_cast<Eigen::Index>(row), static_cast<Eigen::Index>(col));
    }

    double at(size_t row, size_t col) const {
        if (row >= rows() || col >= cols()) {
            throw std::out_of_range("Heightmap index (" + std::to_string(row) + ", " +
                                    std::to_string(col) + ") out of range");
        }
        return (*this)(row, col);
    }

    const double* data() const { return grid_.data(); }
    double* data() { return grid_.data(); }

    const Grid& grid() const { return grid_; }
    Grid& grid() { return grid_; }

    double min_value() const { return grid_.minCoeff(); }
    double max_value() const { return grid_.maxCoeff(); }
    double mean_value() const { return grid_.mean(); }
    bool all_finite() const { return grid_.allFinite(); }

    bool operator==(const Heightmap& other) const {
        return grid_.rows() == other.grid_.rows() && grid_.cols() == other.grid_.cols() &&
               grid_ == other.grid_;
    }

private:
    Grid grid_;
};

// ============================================================================
// Parameters and Configuration
// ============================================================================

/**
 * @brief Generation and export parameters, validated once by InputValidator
 */
struct TerrainParameters {
    int resolution = 256;              ///< Output grid size (square)
    double height_exaggeration = 1.5;  ///< Vertical stretch applied to the elevation data
    double scale_xy = 1.0;             ///< Horizontal scale of the printed model
    double scale_z = 1.5;              ///< Vertical scale of the printed model
    bool add_base = true;              ///< Close the model with walls and a bottom
    double base_thickness = 5.0;       ///< Base thickness in mm
};

/**
 * @brief Configuration for the command line tool and the generator
 */
struct TerrainConfig {
    // Area selection
    BoundingBox bounds{45.78, 45.90, 6.80, 6.95};  // Mont Blanc massif
    std::optional<std::string> region_id;

    // Model parameters
    TerrainParameters parameters;
    std::optional<int> export_resolution;   ///< Defaults to parameters.resolution
    double model_size_mm = 100.0;
    bool carve_valleys = false;

    // Elevation sources
    bool offline = false;                   ///< Skip the network provider, synthesize directly
    std::optional<std::string> dem_file;    ///< Local DEM raster instead of the provider
    std::string provider_url = "https://api.open-elevation.com/api/v1/lookup";
    int provider_timeout_seconds = 30;
    int batch_size = 500;
    int batch_delay_ms = 100;
    int max_retries = 3;
    int retry_backoff_ms = 1000;

    // Cache
    size_t cache_capacity = 100;

    // Output
    std::optional<std::string> output_file;     ///< Defaults to terrain_<region>_<res>.stl
    std::optional<std::string> heightmap_json;
    bool estimate_only = false;

    // Config file support
    std::optional<std::string> config_file;

    // Logging options
    int log_level = 3;  // 1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE
    std::optional<std::string> log_file;
};

// ============================================================================
// Results
// ============================================================================

/**
 * @brief Descriptive statistics of a generated terrain
 */
struct TerrainMetadata {
    double min_elevation = 0.0;
    double max_elevation = 0.0;
    double mean_elevation = 0.0;
    std::string data_source;   ///< "srtm", "dem-file" or "synthetic"
    int resolution = 0;
    double center_lat = 0.0;
    double center_lon = 0.0;
    std::optional<std::string> region_id;
    std::optional<std::string> region_name;
};

/**
 * @brief Generated terrain kept between generation and export
 */
struct TerrainRecord {
    std::string id;
    BoundingBox bounds;
    Heightmap heightmap;
    TerrainMetadata metadata;
    std::string created_at;    ///< ISO-8601 UTC
};

/**
 * @brief Results from mesh validation operations
 */
struct MeshValidationResult {
    bool is_manifold = true;
    bool is_watertight = true;
    bool is_consistently_oriented = true;
    size_t boundary_edge_count = 0;
    size_t excess_edge_count = 0;
    size_t inconsistent_edge_count = 0;
    size_t num_degenerate_triangles = 0;
    size_t num_invalid_indices = 0;

    bool is_valid() const {
        return is_manifold && is_watertight && is_consistently_oriented &&
               num_degenerate_triangles == 0 && num_invalid_indices == 0;
    }
};

/**
 * @brief Performance metrics for operations
 */
struct PerformanceMetrics {
    std::chrono::milliseconds acquisition_time{0};
    std::chrono::milliseconds resampling_time{0};
    std::chrono::milliseconds mesh_generation_time{0};
    std::chrono::milliseconds export_time{0};
    std::chrono::milliseconds total_time{0};

    size_t triangles_generated = 0;
    size_t vertices_generated = 0;
    size_t bytes_written = 0;
};

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Parameters rejected at the boundary, before any computation
 */
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Mesh could not be encoded; indicates a construction bug
 */
class SerializationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief Main interface for terrain generation and STL export
 *
 * Coordinates acquisition, synthesis fallback, resampling, meshing and
 * serialization. The elevation provider and the terrain cache are injected;
 * a null provider means every terrain is synthesized.
 */
class TerrainGenerator {
public:
    TerrainGenerator(const TerrainConfig& config,
                     std::shared_ptr<ElevationProvider> provider,
                     TerrainCache& cache);
    ~TerrainGenerator();

    /**
     * @brief Produce a heightmap for the area and store it in the cache
     * @throws ValidationError on out-of-range input
     */
    TerrainRecord generate_terrain(const BoundingBox& bounds,
                                   int resolution,
                                   double height_exaggeration,
                                   const std::optional<std::string>& region_id = std::nullopt);

    /**
     * @brief Raw acquisition stage: real data at the target resolution, or synthesis
     *
     * Does not apply height exaggeration and does not touch the cache.
     */
    Heightmap acquire_heightmap(const BoundingBox& bounds, int resolution, std::string* data_source = nullptr);

    /**
     * @brief Build the printable mesh for a cached terrain
     * @throws std::out_of_range for unknown terrain ids
     * @throws ValidationError on out-of-range parameters
     */
    TerrainMesh build_mesh(const std::string& terrain_id, const TerrainParameters& params);

    /**
     * @brief Build and serialize the binary STL for a cached terrain
     */
    std::vector<uint8_t> export_stl(const std::string& terrain_id, const TerrainParameters& params);

    /**
     * @brief Default download name, e.g. terrain_mont-blanc_256.stl
     */
    static std::string export_filename(const TerrainRecord& record, int resolution);

    const PerformanceMetrics& get_metrics() const;
    const MeshValidationResult& get_validation_result() const;
    const TerrainConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace terrain3d
