/**
 * @file TerrainGenerator.cpp
 * @brief Terrain pipeline: acquisition, fallback synthesis, resampling, meshing, export
 */

#include "terrain3d.hpp"
#include "DemFileReader.hpp"
#include "ElevationProvider.hpp"
#include "HeightmapAcquirer.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "MeshBuilder.hpp"
#include "RegionCatalog.hpp"
#include "TerrainCache.hpp"
#include "TerrainMesh.hpp"
#include "TerrainResampler.hpp"
#include "TerrainSynthesizer.hpp"
#include "../export/STLExporter.hpp"
#include <chrono>
#include <ctime>
#include <sstream>

namespace terrain3d {

namespace {

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buffer;
}

std::chrono::milliseconds elapsed_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start);
}

AcquisitionConfig acquisition_config_from(const TerrainConfig& config) {
    AcquisitionConfig acquisition;
    acquisition.batch_size = config.batch_size;
    acquisition.batch_delay_ms = config.batch_delay_ms;
    acquisition.max_retries = config.max_retries;
    acquisition.retry_backoff_ms = config.retry_backoff_ms;
    return acquisition;
}

} // namespace

// ============================================================================
// TerrainGenerator::Impl
// ============================================================================

class TerrainGenerator::Impl {
public:
    Impl(const TerrainConfig& config, std::shared_ptr<ElevationProvider> provider, TerrainCache& cache)
        : config_(config),
          provider_(config.offline ? nullptr : std::move(provider)),
          cache_(cache),
          acquirer_(provider_, acquisition_config_from(config)),
          synthesizer_(TerrainSynthesisConfig{config.carve_valleys}),
          logger_("TerrainGenerator") {
    }

    TerrainRecord generate_terrain(const BoundingBox& bounds, int resolution, double height_exaggeration,
                                   const std::optional<std::string>& region_id) {
        auto start_time = std::chrono::high_resolution_clock::now();
        metrics_ = {};

        TerrainParameters params;
        params.resolution = resolution;
        params.height_exaggeration = height_exaggeration;

        ValidationResult validation = validator_.validate_bounds(bounds);
        validation.merge(validator_.validate_parameters(params));
        if (validation.has_errors()) {
            throw ValidationError(validation.format_error_message());
        }

        std::optional<Region> region;
        if (region_id) {
            region = RegionCatalog::find(*region_id);
            if (!region) {
                logger_.warning("Unknown region id '" + *region_id + "', keeping it as a label only");
            }
        }

        std::string data_source;
        Heightmap heightmap = acquire_heightmap(bounds, resolution, &data_source);

        if (height_exaggeration != 1.0) {
            double base = heightmap.min_value();
            heightmap.grid() = ((heightmap.grid().array() - base) * height_exaggeration + base).matrix();
        }

        TerrainRecord record;
        record.id = cache_.next_id();
        record.bounds = bounds;
        record.created_at = utc_timestamp();
        record.metadata.min_elevation = heightmap.min_value();
        record.metadata.max_elevation = heightmap.max_value();
        record.metadata.mean_elevation = heightmap.mean_value();
        record.metadata.data_source = data_source;
        record.metadata.resolution = resolution;
        record.metadata.center_lat = bounds.center_lat();
        record.metadata.center_lon = bounds.center_lon();
        record.metadata.region_id = region_id;
        if (region) {
            record.metadata.region_name = region->name;
        }
        record.heightmap = std::move(heightmap);

        cache_.put(record);

        metrics_.total_time = elapsed_since(start_time);
        logger_.info("Generated " + record.id + " (" + data_source + ", " + std::to_string(resolution) + "x" +
                     std::to_string(resolution) + ", " + std::to_string(record.metadata.min_elevation) + " to " +
                     std::to_string(record.metadata.max_elevation) + " m) in " +
                     std::to_string(metrics_.total_time.count()) + "ms");
        return record;
    }

    Heightmap acquire_heightmap(const BoundingBox& bounds, int resolution, std::string* data_source) {
        auto start_time = std::chrono::high_resolution_clock::now();

        std::optional<Heightmap> raw;
        std::string source;

        if (config_.dem_file) {
            DemFileReader reader(*config_.dem_file);
            // Raw grid edge never exceeds the target resolution
            AcquisitionResult result = reader.read(bounds, resolution);
            if (result.ok()) {
                raw = std::move(result.heightmap);
                source = "dem-file";
            } else {
                logger_.warning("DEM file unusable: " + result.failure_reason);
            }
        }

        if (!raw && provider_) {
            AcquisitionResult result = acquirer_.acquire(bounds, resolution);
            if (result.ok()) {
                raw = std::move(result.heightmap);
                source = "srtm";
            } else {
                logger_.warning("Elevation acquisition failed after " + std::to_string(result.batches_completed) +
                                " batch(es): " + result.failure_reason);
            }
        }

        metrics_.acquisition_time = elapsed_since(start_time);

        Heightmap heightmap;
        if (raw) {
            auto resample_start = std::chrono::high_resolution_clock::now();
            heightmap = resampler_.resample(*raw, resolution);
            metrics_.resampling_time = elapsed_since(resample_start);
        } else {
            logger_.info("Using synthetic terrain");
            heightmap = synthesizer_.synthesize(bounds, resolution);
            source = "synthetic";
        }

        if (data_source) {
            *data_source = source;
        }
        return heightmap;
    }

    TerrainMesh build_mesh(const std::string& terrain_id, const TerrainParameters& params) {
        ValidationResult validation = validator_.validate_parameters(params);
        if (validation.has_errors()) {
            throw ValidationError(validation.format_error_message());
        }

        auto record = cache_.get(terrain_id);
        if (!record) {
            throw std::out_of_range("Terrain '" + terrain_id + "' not found; it may have been evicted");
        }

        Heightmap heightmap = record->heightmap;
        if (params.resolution != record->metadata.resolution) {
            auto resample_start = std::chrono::high_resolution_clock::now();
            const size_t target = static_cast<size_t>(params.resolution);
            heightmap = resampler_.spline_rescale(heightmap, target, target);
            metrics_.resampling_time = elapsed_since(resample_start);
        }

        auto start_time = std::chrono::high_resolution_clock::now();
        MeshBuilder builder(MeshBuildConfig(params, config_.model_size_mm));
        TerrainMesh mesh = builder.build(heightmap);
        metrics_.mesh_generation_time = elapsed_since(start_time);
        metrics_.triangles_generated = mesh.num_triangles();
        metrics_.vertices_generated = mesh.num_vertices();

        if (params.add_base) {
            validation_result_ = mesh.require_closed();
            logger_.detailed("Mesh is a closed, consistently oriented 2-manifold");
        } else {
            validation_result_ = mesh.validate_topology();
            logger_.detailed("Surface-only mesh has " + std::to_string(validation_result_.boundary_edge_count) +
                             " open boundary edges (not printable without a base)");
        }

        return mesh;
    }

    std::vector<uint8_t> export_stl(const std::string& terrain_id, const TerrainParameters& params) {
        auto start_time = std::chrono::high_resolution_clock::now();

        TerrainMesh mesh = build_mesh(terrain_id, params);

        auto export_start = std::chrono::high_resolution_clock::now();
        STLExporter exporter;
        std::vector<uint8_t> bytes = exporter.serialize(mesh);
        metrics_.export_time = elapsed_since(export_start);
        metrics_.bytes_written = bytes.size();
        metrics_.total_time = elapsed_since(start_time);

        logger_.info("Encoded " + std::to_string(mesh.num_triangles()) + " triangles (" +
                     std::to_string(bytes.size()) + " bytes) in " +
                     std::to_string(metrics_.total_time.count()) + "ms");
        return bytes;
    }

    const PerformanceMetrics& get_metrics() const { return metrics_; }
    const MeshValidationResult& get_validation_result() const { return validation_result_; }
    const TerrainConfig& get_config() const { return config_; }

private:
    TerrainConfig config_;
    std::shared_ptr<ElevationProvider> provider_;
    TerrainCache& cache_;

    HeightmapAcquirer acquirer_;
    TerrainSynthesizer synthesizer_;
    TerrainResampler resampler_;
    InputValidator validator_;

    PerformanceMetrics metrics_;
    MeshValidationResult validation_result_;
    Logger logger_;
};

// ============================================================================
// TerrainGenerator Public Interface
// ============================================================================

TerrainGenerator::TerrainGenerator(const TerrainConfig& config,
                                   std::shared_ptr<ElevationProvider> provider,
                                   TerrainCache& cache)
    : impl_(std::make_unique<Impl>(config, std::move(provider), cache)) {
}

TerrainGenerator::~TerrainGenerator() = default;

TerrainRecord TerrainGenerator::generate_terrain(const BoundingBox& bounds,
                                                 int resolution,
                                                 double height_exaggeration,
                                                 const std::optional<std::string>& region_id) {
    return impl_->generate_terrain(bounds, resolution, height_exaggeration, region_id);
}

Heightmap TerrainGenerator::acquire_heightmap(const BoundingBox& bounds, int resolution, std::string* data_source) {
    return impl_->acquire_heightmap(bounds, resolution, data_source);
}

TerrainMesh TerrainGenerator::build_mesh(const std::string& terrain_id, const TerrainParameters& params) {
    return impl_->build_mesh(terrain_id, params);
}

std::vector<uint8_t> TerrainGenerator::export_stl(const std::string& terrain_id, const TerrainParameters& params) {
    return impl_->export_stl(terrain_id, params);
}

std::string TerrainGenerator::export_filename(const TerrainRecord& record, int resolution) {
    const std::string& label = record.metadata.region_id ? *record.metadata.region_id : record.id;
    return "terrain_" + label + "_" + std::to_string(resolution) + ".stl";
}

const PerformanceMetrics& TerrainGenerator::get_metrics() const {
    return impl_->get_metrics();
}

const MeshValidationResult& TerrainGenerator::get_validation_result() const {
    return impl_->get_validation_result();
}

const TerrainConfig& TerrainGenerator::get_config() const {
    return impl_->get_config();
}

} // namespace terrain3d
