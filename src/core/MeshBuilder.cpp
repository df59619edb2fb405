/**
 * @file MeshBuilder.cpp
 * @brief Implementation of heightmap triangulation
 */

#include "MeshBuilder.hpp"
#include <algorithm>
#include <stdexcept>

namespace terrain3d {

MeshBuilder::MeshBuilder(const MeshBuildConfig& config)
    : config_(config), logger_("MeshBuilder") {
}

size_t MeshBuilder::expected_triangle_count(size_t rows, size_t cols, bool add_base) {
    if (rows < 2 || cols < 2) return 0;
    size_t surface = 2 * (rows - 1) * (cols - 1);
    if (!add_base) return surface;
    return 2 * surface + 4 * (cols - 1) + 4 * (rows - 1);
}

TerrainMesh MeshBuilder::build(const Heightmap& heightmap) {
    auto start_time = std::chrono::high_resolution_clock::now();

    size_t rows = heightmap.rows();
    size_t cols = heightmap.cols();
    if (rows < 2 || cols < 2) {
        throw std::invalid_argument("MeshBuilder needs at least a 2x2 grid, got " +
                                    std::to_string(rows) + "x" + std::to_string(cols));
    }
    if (!heightmap.all_finite()) {
        throw std::invalid_argument("MeshBuilder received non-finite elevation samples");
    }

    stats_ = MeshBuildStats{};
    stats_.grid_rows = rows;
    stats_.grid_cols = cols;
    stats_.x_scale = config_.model_size_mm * config_.scale_xy / static_cast<double>(cols);
    stats_.y_scale = config_.model_size_mm * config_.scale_xy / static_cast<double>(rows);
    calculate_elevation_stats(heightmap);

    TerrainMesh mesh;
    size_t layers = config_.add_base ? 2 : 1;
    mesh.reserve_vertices(layers * rows * cols);
    mesh.reserve_triangles(expected_triangle_count(rows, cols, config_.add_base));

    logger_.detailed("Triangulating " + std::to_string(rows) + "x" + std::to_string(cols) +
                     " grid (" + (config_.add_base ? "solid" : "surface only") + ")");

    add_surface_vertices(mesh, heightmap);
    if (config_.add_base) {
        add_bottom_vertices(mesh, rows, cols);
    }

    add_top_surface(mesh, rows, cols);

    if (config_.add_base) {
        add_bottom_surface(mesh, rows, cols);
        add_side_walls(mesh, rows, cols);
    } else {
        logger_.debug("No base requested: surface has an open boundary and zero thickness");
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    stats_.computation_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    logger_.info("Mesh built: " + std::to_string(mesh.num_vertices()) + " vertices, " +
                 std::to_string(mesh.num_triangles()) + " triangles");
    logger_.detailed("  Surface triangles: " + std::to_string(stats_.surface_triangles));
    logger_.detailed("  Base triangles: " + std::to_string(stats_.base_triangles));
    logger_.detailed("  Wall triangles: " + std::to_string(stats_.wall_triangles));
    logger_.detailed("  Cell size: " + std::to_string(stats_.x_scale) + " x " +
                     std::to_string(stats_.y_scale) + " mm");
    logger_.detailed("  Relief height: " + std::to_string(stats_.relief_height_mm) + " mm");
    logger_.debug("  Time: " + std::to_string(stats_.computation_time.count()) + " ms");

    return mesh;
}

void MeshBuilder::calculate_elevation_stats(const Heightmap& heightmap) {
    stats_.min_elevation = heightmap.min_value();
    stats_.max_elevation = heightmap.max_value();
}

void MeshBuilder::add_surface_vertices(TerrainMesh& mesh, const Heightmap& heightmap) {
    const size_t rows = heightmap.rows();
    const size_t cols = heightmap.cols();

    double range = stats_.max_elevation - stats_.min_elevation;
    if (range == 0.0) {
        // Flat terrain normalizes to zero height
        range = 1.0;
    }
    const double vertical_extent = config_.scale_z * config_.height_fraction * config_.model_size_mm;

    double highest = 0.0;
    for (size_t i = 0; i < rows; ++i) {
        double y = static_cast<double>(rows - 1 - i) * stats_.y_scale;
        for (size_t j = 0; j < cols; ++j) {
            double normalized = (heightmap(i, j) - stats_.min_elevation) / range;
            double z = normalized * vertical_extent;
            highest = std::max(highest, z);
            mesh.add_vertex(Point3D(static_cast<double>(j) * stats_.x_scale, y, z));
        }
    }
    stats_.relief_height_mm = highest;
}

void MeshBuilder::add_bottom_vertices(TerrainMesh& mesh, size_t rows, size_t cols) {
    const double z = -config_.base_thickness_mm;
    for (size_t i = 0; i < rows; ++i) {
        double y = static_cast<double>(rows - 1 - i) * stats_.y_scale;
        for (size_t j = 0; j < cols; ++j) {
            mesh.add_vertex(Point3D(static_cast<double>(j) * stats_.x_scale, y, z));
        }
    }
}

void MeshBuilder::add_top_surface(TerrainMesh& mesh, size_t rows, size_t cols) {
    for (size_t i = 0; i + 1 < rows; ++i) {
        for (size_t j = 0; j + 1 < cols; ++j) {
            VertexId v0 = static_cast<VertexId>(i * cols + j);
            VertexId v1 = v0 + 1;
            VertexId v2 = static_cast<VertexId>(v0 + cols);
            VertexId v3 = v2 + 1;

            mesh.add_triangle(v0, v2, v1);
            mesh.add_triangle(v1, v2, v3);
            stats_.surface_triangles += 2;
        }
    }
}

void MeshBuilder::add_bottom_surface(TerrainMesh& mesh, size_t rows, size_t cols) {
    const VertexId offset = static_cast<VertexId>(rows * cols);
    for (size_t i = 0; i + 1 < rows; ++i) {
        for (size_t j = 0; j + 1 < cols; ++j) {
            VertexId v0 = offset + static_cast<VertexId>(i * cols + j);
            VertexId v1 = v0 + 1;
            VertexId v2 = static_cast<VertexId>(v0 + cols);
            VertexId v3 = v2 + 1;

            mesh.add_triangle(v0, v1, v2);
            mesh.add_triangle(v1, v3, v2);
            stats_.base_triangles += 2;
        }
    }
}

void MeshBuilder::add_wall_quad(TerrainMesh& mesh, VertexId top_first, VertexId top_second,
                                VertexId bottom_first, VertexId bottom_second) {
    mesh.add_triangle(top_first, top_second, bottom_first);
    mesh.add_triangle(top_second, bottom_second, bottom_first);
    stats_.wall_triangles += 2;
}

void MeshBuilder::add_side_walls(TerrainMesh& mesh, size_t rows, size_t cols) {
    const size_t bottom_offset = rows * cols;
    auto top = [cols](size_t i, size_t j) {
        return static_cast<VertexId>(i * cols + j);
    };
    auto bottom = [cols, bottom_offset](size_t i, size_t j) {
        return static_cast<VertexId>(bottom_offset + i * cols + j);
    };

    // The four walls run clockwise seen from above: west->east along the north
    // edge, north->south along the east edge, and back.
    for (size_t j = 0; j + 1 < cols; ++j) {
        add_wall_quad(mesh, top(0, j), top(0, j + 1), bottom(0, j), bottom(0, j + 1));
    }

    for (size_t i = 0; i + 1 < rows; ++i) {
        add_wall_quad(mesh, top(i, cols - 1), top(i + 1, cols - 1),
                      bottom(i, cols - 1), bottom(i + 1, cols - 1));
    }

    for (size_t j = 0; j + 1 < cols; ++j) {
        add_wall_quad(mesh, top(rows - 1, j + 1), top(rows - 1, j),
                      bottom(rows - 1, j + 1), bottom(rows - 1, j));
    }

    for (size_t i = 0; i + 1 < rows; ++i) {
        add_wall_quad(mesh, top(i + 1, 0), top(i, 0), bottom(i + 1, 0), bottom(i, 0));
    }
}

} // namespace terrain3d
