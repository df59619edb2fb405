/**
 * @file test_support.hpp
 * @brief Scripted elevation provider and configuration helpers for tests
 */

#pragma once

#include "terrain3d.hpp"
#include "ElevationProvider.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace terrain3d::test {

/**
 * @brief Provider answering from a function of the sample location
 *
 * Batches are counted from 1. Any batch listed in failing_batches returns
 * nullopt on each of its first failures_per_batch calls; a failure count of
 * zero or less fails that batch forever.
 */
class FakeElevationProvider : public ElevationProvider {
public:
    using ElevationFunction = std::function<double(const GeoPoint&)>;

    explicit FakeElevationProvider(ElevationFunction elevation);

    std::optional<std::vector<double>> fetch_batch(const std::vector<GeoPoint>& points) override;
    std::string name() const override { return "fake"; }

    void fail_batch(size_t batch_number, int failures = 0);

    /// Answer with one value less than requested
    void set_truncate_responses(bool truncate) { truncate_ = truncate; }

    size_t call_count() const { return calls_; }
    size_t distinct_batches() const { return batch_sizes_.size(); }
    const std::vector<size_t>& batch_sizes() const { return batch_sizes_; }

private:
    struct FailureRule {
        size_t batch_number;
        int remaining;
        bool permanent;
    };

    ElevationFunction elevation_;
    std::vector<FailureRule> failures_;
    std::vector<size_t> batch_sizes_;
    size_t calls_ = 0;
    size_t current_batch_ = 0;
    std::vector<GeoPoint> last_points_;
    bool truncate_ = false;
};

/**
 * @brief Configuration with no network, no sleeps and single attempts
 */
TerrainConfig fast_config();

/**
 * @brief rows x cols grid rising by one meter per column and ten per row
 */
Heightmap ramp_heightmap(size_t rows, size_t cols);

} // namespace terrain3d::test
