/**
 * @file MeshBuilder.hpp
 * @brief Heightmap grid to printable triangle mesh
 *
 * Emits two triangles per grid cell for the terrain surface. With a base,
 * the same XY grid is repeated at z = -base_thickness as the bottom, and
 * four side walls stitch the boundary rows and columns of top and bottom
 * together, reusing their vertices so the result is a closed 2-manifold.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "TerrainMesh.hpp"
#include "Logger.hpp"
#include <chrono>

namespace terrain3d {

/**
 * @brief Configuration for mesh construction
 */
struct MeshBuildConfig {
    double model_size_mm = 100.0;        ///< Horizontal footprint at scale_xy = 1
    double scale_xy = 1.0;               ///< Horizontal scale factor
    double scale_z = 1.5;                ///< Vertical scale factor
    bool add_base = true;                ///< Build a closed solid instead of a bare surface
    double base_thickness_mm = 5.0;      ///< Bottom sits at z = -base_thickness_mm
    double height_fraction = 0.3;        ///< Relief height as a fraction of model_size_mm

    MeshBuildConfig() = default;
    MeshBuildConfig(const TerrainParameters& params, double model_size)
        : model_size_mm(model_size), scale_xy(params.scale_xy), scale_z(params.scale_z),
          add_base(params.add_base), base_thickness_mm(params.base_thickness) {}
};

/**
 * @brief Statistics from the last build
 */
struct MeshBuildStats {
    size_t grid_rows = 0;
    size_t grid_cols = 0;
    size_t surface_triangles = 0;
    size_t base_triangles = 0;
    size_t wall_triangles = 0;
    double x_scale = 0.0;                 ///< mm between columns
    double y_scale = 0.0;                 ///< mm between rows
    double min_elevation = 0.0;
    double max_elevation = 0.0;
    double relief_height_mm = 0.0;        ///< Top of the highest vertex above z = 0
    std::chrono::milliseconds computation_time{0};
};

/**
 * @brief Grid triangulator for terrain solids
 */
class MeshBuilder {
public:
    explicit MeshBuilder(const MeshBuildConfig& config = MeshBuildConfig{});

    /**
     * @brief Triangulate a heightmap
     *
     * @param heightmap Grid of at least 2x2 samples, row 0 north
     * @return Mesh with 2*R*C vertices when a base is requested, R*C otherwise
     * @throws std::invalid_argument for grids smaller than 2x2 or non-finite samples
     */
    TerrainMesh build(const Heightmap& heightmap);

    /**
     * @brief Face count a build of an R x C grid will produce
     */
    static size_t expected_triangle_count(size_t rows, size_t cols, bool add_base);

    const MeshBuildStats& get_stats() const { return stats_; }
    void set_config(const MeshBuildConfig& config) { config_ = config; }
    const MeshBuildConfig& get_config() const { return config_; }

private:
    MeshBuildConfig config_;
    Logger logger_;
    MeshBuildStats stats_;

    /**
     * @brief One vertex per sample at the normalized terrain height
     *
     * Column j maps to x = j * x_scale; row i maps to y = (rows-1-i) * y_scale.
     */
    void add_surface_vertices(TerrainMesh& mesh, const Heightmap& heightmap);

    /**
     * @brief Copy of the XY grid at z = -base_thickness
     */
    void add_bottom_vertices(TerrainMesh& mesh, size_t rows, size_t cols);

    /**
     * @brief Two counter-clockwise triangles per cell (normal +Z)
     *
     * For cell corners v0=(i,j), v1=(i,j+1), v2=(i+1,j), v3=(i+1,j+1):
     * (v0, v2, v1) and (v1, v2, v3).
     */
    void add_top_surface(TerrainMesh& mesh, size_t rows, size_t cols);

    /**
     * @brief Top surface mirrored: (v0, v1, v2) and (v1, v3, v2), normal -Z
     */
    void add_bottom_surface(TerrainMesh& mesh, size_t rows, size_t cols);

    /**
     * @brief Quads between each top boundary edge and the bottom edge below it
     *
     * Each wall takes the reverse direction of the top and bottom boundary
     * edges it closes, which makes its normal point away from the model.
     */
    void add_side_walls(TerrainMesh& mesh, size_t rows, size_t cols);

    /**
     * @brief Quad whose top edge runs first -> second, seen from outside
     */
    void add_wall_quad(TerrainMesh& mesh, VertexId top_first, VertexId top_second,
                       VertexId bottom_first, VertexId bottom_second);

    void calculate_elevation_stats(const Heightmap& heightmap);
};

} // namespace terrain3d
