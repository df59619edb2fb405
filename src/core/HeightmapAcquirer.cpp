/**
 * @file HeightmapAcquirer.cpp
 * @brief Implementation of batched elevation acquisition
 */

#include "HeightmapAcquirer.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace terrain3d {

HeightmapAcquirer::HeightmapAcquirer(std::shared_ptr<ElevationProvider> provider,
                                     const AcquisitionConfig& config)
    : provider_(std::move(provider)), config_(config), logger_("HeightmapAcquirer") {
}

int HeightmapAcquirer::fetch_resolution(const BoundingBox& bounds, int target_resolution) {
    double span = std::min(bounds.lat_span(), bounds.lon_span());
    int native_points = static_cast<int>(std::floor(span / AcquisitionConfig::NATIVE_SPACING_DEG));
    int capped = std::max(AcquisitionConfig::MIN_FETCH_RES, native_points);
    return std::min({target_resolution, AcquisitionConfig::OPTIMAL_FETCH_RES, capped});
}

std::vector<IndexedPoint> HeightmapAcquirer::sample_points(const BoundingBox& bounds, int resolution) {
    std::vector<IndexedPoint> points;
    if (resolution <= 0) {
        return points;
    }

    const size_t n = static_cast<size_t>(resolution);
    const double lat_step = n > 1 ? bounds.lat_span() / static_cast<double>(n - 1) : 0.0;
    const double lon_step = n > 1 ? bounds.lon_span() / static_cast<double>(n - 1) : 0.0;

    points.reserve(n * n);
    for (size_t i = 0; i < n; ++i) {
        double lat = bounds.lat_max - static_cast<double>(i) * lat_step;
        for (size_t j = 0; j < n; ++j) {
            double lon = bounds.lon_min + static_cast<double>(j) * lon_step;
            points.push_back({i * n + j, GeoPoint(lat, lon)});
        }
    }
    return points;
}

std::optional<size_t> HeightmapAcquirer::fill_missing(Heightmap& grid, double nodata_threshold) {
    double sum = 0.0;
    size_t valid = 0;
    for (size_t k = 0; k < grid.size(); ++k) {
        double value = grid.data()[k];
        if (std::isfinite(value) && value >= nodata_threshold) {
            sum += value;
            ++valid;
        }
    }

    if (valid == 0) {
        return std::nullopt;
    }

    const double mean = sum / static_cast<double>(valid);
    size_t replaced = 0;
    for (size_t k = 0; k < grid.size(); ++k) {
        double& value = grid.data()[k];
        if (!std::isfinite(value) || value < nodata_threshold) {
            value = mean;
            ++replaced;
        }
    }
    return replaced;
}

std::optional<std::vector<double>> HeightmapAcquirer::fetch_with_retry(const std::vector<GeoPoint>& batch,
                                                                       size_t batch_number, size_t batch_count) {
    const int attempts = std::max(1, config_.max_retries);
    const std::string label = "batch " + std::to_string(batch_number) + "/" + std::to_string(batch_count);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            logger_.debug("Retry " + std::to_string(attempt) + "/" + std::to_string(attempts) + " for " + label);
        }

        auto values = provider_->fetch_batch(batch);
        if (values) {
            return values;
        }

        if (attempt < attempts && config_.retry_backoff_ms > 0) {
            int delay_ms = config_.retry_backoff_ms * (1 << (attempt - 1));
            logger_.debug("Waiting " + std::to_string(delay_ms) + " ms before retrying " + label);
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }

    logger_.warning("Provider failed " + label + " after " + std::to_string(attempts) + " attempt(s)");
    return std::nullopt;
}

AcquisitionResult HeightmapAcquirer::acquire(const BoundingBox& bounds, int target_resolution) {
    if (!provider_) {
        return AcquisitionResult::failure("no elevation provider configured");
    }
    if (!bounds.is_ordered()) {
        return AcquisitionResult::failure("bounding box is not ordered");
    }
    if (config_.batch_size <= 0) {
        return AcquisitionResult::failure("batch size must be positive");
    }

    const int resolution = fetch_resolution(bounds, target_resolution);
    if (resolution < 2) {
        return AcquisitionResult::failure("fetch resolution " + std::to_string(resolution) + " is too small");
    }

    const auto points = sample_points(bounds, resolution);
    const size_t batch_size = static_cast<size_t>(config_.batch_size);
    const size_t batch_count = (points.size() + batch_size - 1) / batch_size;

    logger_.info("Fetching " + std::to_string(resolution) + "x" + std::to_string(resolution) + " grid (" +
                 std::to_string(points.size()) + " points, " + std::to_string(batch_count) +
                 " batches) from " + provider_->name());

    const size_t n = static_cast<size_t>(resolution);
    Heightmap grid(n, n);

    for (size_t b = 0; b < batch_count; ++b) {
        if (b > 0 && config_.batch_delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.batch_delay_ms));
        }

        const size_t begin = b * batch_size;
        const size_t end = std::min(points.size(), begin + batch_size);

        std::vector<GeoPoint> batch;
        batch.reserve(end - begin);
        for (size_t k = begin; k < end; ++k) {
            batch.push_back(points[k].point);
        }

        auto values = fetch_with_retry(batch, b + 1, batch_count);
        if (!values) {
            return AcquisitionResult::failure("provider request failed on batch " + std::to_string(b + 1) +
                                              " of " + std::to_string(batch_count), b);
        }
        if (values->size() != batch.size()) {
            return AcquisitionResult::failure("provider returned " + std::to_string(values->size()) +
                                              " values for " + std::to_string(batch.size()) +
                                              " points on batch " + std::to_string(b + 1), b);
        }

        for (size_t k = begin; k < end; ++k) {
            grid.data()[points[k].index] = (*values)[k - begin];
        }

        logger_.trace("Batch " + std::to_string(b + 1) + "/" + std::to_string(batch_count) + " complete");
    }

    auto replaced = fill_missing(grid, config_.nodata_threshold);
    if (!replaced) {
        return AcquisitionResult::failure("provider returned no valid elevation", batch_count);
    }
    if (*replaced > 0) {
        logger_.detailed("Replaced " + std::to_string(*replaced) + " no-data samples with the grid mean");
    }

    logger_.info("Acquired elevations " + std::to_string(grid.min_value()) + " to " +
                 std::to_string(grid.max_value()) + " m");
    return AcquisitionResult::success(std::move(grid), batch_count);
}

} // namespace terrain3d
