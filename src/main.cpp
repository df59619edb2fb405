/**
 * @file main.cpp
 * @brief Main entry point for the terrain3d generator
 *
 * Turns a bounding box into a watertight binary STL terrain model.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "terrain3d.hpp"
#include "core/ElevationProvider.hpp"
#include "core/InputValidator.hpp"
#include "core/Logger.hpp"
#include "core/SizeEstimator.hpp"
#include "core/TerrainCache.hpp"
#include "cli/CommandLineInterface.hpp"
#include "export/HeightmapJsonExporter.hpp"
#include "export/STLExporter.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>

using namespace terrain3d;

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Elevation acquisition: " << metrics.acquisition_time.count() << "ms\n";
    std::cout << "Resampling: " << metrics.resampling_time.count() << "ms\n";
    std::cout << "Mesh generation: " << metrics.mesh_generation_time.count() << "ms\n";
    std::cout << "Export time: " << metrics.export_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Triangles generated: " << metrics.triangles_generated << "\n";
    std::cout << "Vertices generated: " << metrics.vertices_generated << "\n";
    std::cout << "Bytes written: " << metrics.bytes_written << "\n";
    std::cout << "============================\n";
}

/**
 * @brief Print mesh validation results
 */
void print_validation_results(const MeshValidationResult& result, bool add_base) {
    std::cout << "\n=== Mesh Validation Results ===\n";
    std::cout << "Manifold: " << (result.is_manifold ? "YES" : "NO") << "\n";
    std::cout << "Watertight: " << (result.is_watertight ? "YES" : "NO") << "\n";
    std::cout << "Consistent orientation: " << (result.is_consistently_oriented ? "YES" : "NO") << "\n";

    if (result.boundary_edge_count > 0) {
        std::cout << "Boundary edges: " << result.boundary_edge_count << "\n";
    }
    if (result.excess_edge_count > 0) {
        std::cout << "Non-manifold edges: " << result.excess_edge_count << "\n";
    }
    if (result.num_degenerate_triangles > 0) {
        std::cout << "Degenerate triangles: " << result.num_degenerate_triangles << "\n";
    }

    if (result.is_valid()) {
        std::cout << "Printable: YES\n";
    } else if (!add_base) {
        std::cout << "Printable: NO (surface only, add a base)\n";
    } else {
        std::cout << "Printable: NO (needs repair)\n";
    }
    std::cout << "===============================\n";
}

/**
 * @brief Print size and print time estimates
 */
void print_estimate(const SizeEstimate& estimate, int resolution, bool add_base, double scale) {
    std::cout << "Resolution: " << resolution << "x" << resolution
              << (add_base ? " with base" : " surface only") << ", scale " << scale << "\n";
    std::cout << "Triangles: " << estimate.triangle_count << "\n";
    std::cout << "File size: " << estimate.file_size_bytes << " bytes ("
              << std::fixed << std::setprecision(2) << estimate.file_size_mb << " MB)\n";
    std::cout.unsetf(std::ios_base::floatfield);
    std::cout << "Estimated print time: " << estimate.print_time << "\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, listing, or a parse error
        }

        const TerrainConfig& config = cli.get_config();
        if (!Logger::setDefaultLogFile(config.log_file)) {
            std::cerr << "Continuing with console logging only" << std::endl;
        }

        InputValidator validator;
        ValidationResult validation = validator.validate(config);
        if (validation.has_errors()) {
            std::cerr << validation.format_error_message();
            return 2;
        }

        TerrainParameters export_params = config.parameters;
        export_params.resolution = config.export_resolution.value_or(config.parameters.resolution);

        if (config.estimate_only) {
            auto estimate = SizeEstimator::estimate(export_params.resolution, export_params.add_base,
                                                    export_params.scale_xy);
            print_estimate(estimate, export_params.resolution, export_params.add_base, export_params.scale_xy);
            return 0;
        }

        if (config.log_level > 1) {
            std::cout << "terrain3d - watertight terrain models for 3D printing\n";
        }

        cli.print_config();

        if (cli.is_dry_run()) {
            if (config.log_level > 1) {
                std::cout << "Dry run mode - configuration validated successfully\n";
            }
            return 0;
        }

        std::shared_ptr<ElevationProvider> provider;
        if (!config.offline) {
            OpenElevationProvider::Options options;
            options.url = config.provider_url;
            options.timeout_seconds = config.provider_timeout_seconds;
            provider = std::make_shared<OpenElevationProvider>(options);
        }

        TerrainCache cache(config.cache_capacity);
        TerrainGenerator generator(config, provider, cache);

        TerrainRecord record = generator.generate_terrain(config.bounds,
                                                          config.parameters.resolution,
                                                          config.parameters.height_exaggeration,
                                                          config.region_id);
        PerformanceMetrics metrics = generator.get_metrics();

        if (config.heightmap_json) {
            HeightmapJsonExporter json_exporter;
            if (!json_exporter.export_json(record, *config.heightmap_json)) {
                std::cerr << "Error: Failed to write " << *config.heightmap_json << "\n";
                return 1;
            }
        }

        std::vector<uint8_t> stl = generator.export_stl(record.id, export_params);

        std::string filename = config.output_file.value_or(
            TerrainGenerator::export_filename(record, export_params.resolution));
        STLExporter stl_writer;
        if (!stl_writer.write_bytes(stl, filename)) {
            std::cerr << "Error: Failed to write " << filename << "\n";
            return 1;
        }

        const PerformanceMetrics& export_metrics = generator.get_metrics();
        metrics.resampling_time += export_metrics.resampling_time;
        metrics.mesh_generation_time = export_metrics.mesh_generation_time;
        metrics.export_time = export_metrics.export_time;
        metrics.triangles_generated = export_metrics.triangles_generated;
        metrics.vertices_generated = export_metrics.vertices_generated;
        metrics.bytes_written = export_metrics.bytes_written;

        auto end_time = std::chrono::high_resolution_clock::now();
        metrics.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        // Only print detailed summaries at DETAILED level (4) or higher
        if (config.log_level >= 4) {
            print_performance_summary(metrics);
            print_validation_results(generator.get_validation_result(), export_params.add_base);
        }

        if (config.log_level > 1) {
            std::cout << "\nWrote " << filename << " (" << stl.size() << " bytes, "
                      << metrics.triangles_generated << " triangles, "
                      << record.metadata.data_source << " elevation) in "
                      << metrics.total_time.count() << "ms\n";
        }

        return 0;

    } catch (const ValidationError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
