/**
 * @file HeightmapAcquirer.hpp
 * @brief Batched acquisition of a real elevation grid from a point provider
 *
 * Samples a regular lat/lon grid over the bounding box, queries the provider
 * in sequential batches and reassembles the answers by grid index. Any batch
 * failure aborts the whole acquisition; the caller decides what to do next.
 */

#pragma once

#include "terrain3d.hpp"
#include "ElevationProvider.hpp"
#include "Logger.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace terrain3d {

/**
 * @brief Batching, retry and no-data policy
 */
struct AcquisitionConfig {
    int batch_size = 500;               ///< Points per provider request
    int batch_delay_ms = 100;           ///< Pause between consecutive batches
    int max_retries = 3;                ///< Attempts per batch
    int retry_backoff_ms = 1000;        ///< First retry delay, doubled on each further attempt
    double nodata_threshold = -1000.0;  ///< Values below this are missing data

    static constexpr int OPTIMAL_FETCH_RES = 64;
    static constexpr int MIN_FETCH_RES = 32;
    static constexpr double NATIVE_SPACING_DEG = 0.00028;  ///< ~30 m SRTM posting
};

/**
 * @brief Outcome of an acquisition attempt
 */
struct AcquisitionResult {
    std::optional<Heightmap> heightmap;
    std::string failure_reason;
    size_t batches_completed = 0;

    bool ok() const { return heightmap.has_value(); }

    static AcquisitionResult success(Heightmap grid, size_t batches) {
        AcquisitionResult result;
        result.heightmap = std::move(grid);
        result.batches_completed = batches;
        return result;
    }

    static AcquisitionResult failure(std::string reason, size_t batches = 0) {
        AcquisitionResult result;
        result.failure_reason = std::move(reason);
        result.batches_completed = batches;
        return result;
    }
};

/**
 * @brief Sample location tagged with its flat row-major grid index
 */
struct IndexedPoint {
    size_t index;
    GeoPoint point;
};

class HeightmapAcquirer {
public:
    HeightmapAcquirer(std::shared_ptr<ElevationProvider> provider,
                      const AcquisitionConfig& config = AcquisitionConfig{});

    /**
     * @brief Fetch a real grid at the fetch resolution derived from the target
     *
     * Never synthesizes: on failure the result carries the reason only.
     */
    AcquisitionResult acquire(const BoundingBox& bounds, int target_resolution);

    /**
     * @brief min(target, 64, max(32, floor(min span / native spacing)))
     */
    static int fetch_resolution(const BoundingBox& bounds, int target_resolution);

    /**
     * @brief resolution x resolution sample points, north to south, west to east
     */
    static std::vector<IndexedPoint> sample_points(const BoundingBox& bounds, int resolution);

    /**
     * @brief Replace values below the threshold by the mean of the remaining ones
     * @return Number of replaced cells, or std::nullopt when no cell is valid
     */
    static std::optional<size_t> fill_missing(Heightmap& grid, double nodata_threshold);

    const AcquisitionConfig& get_config() const { return config_; }

private:
    std::shared_ptr<ElevationProvider> provider_;
    AcquisitionConfig config_;
    Logger logger_;

    std::optional<std::vector<double>> fetch_with_retry(const std::vector<GeoPoint>& batch,
                                                        size_t batch_number, size_t batch_count);
};

} // namespace terrain3d
