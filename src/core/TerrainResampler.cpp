/**
 * @file TerrainResampler.cpp
 * @brief Implementation of grid smoothing and spline resampling
 */

#include "TerrainResampler.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace terrain3d {

namespace {

// Half-sample symmetric reflection into [0, count)
Eigen::Index reflect_index(long index, long count) {
    long period = 2 * count;
    long wrapped = index % period;
    if (wrapped < 0) wrapped += period;
    if (wrapped >= count) wrapped = period - 1 - wrapped;
    return static_cast<Eigen::Index>(wrapped);
}

double sample_position(size_t index, size_t count) {
    if (count < 2) return 0.0;
    return static_cast<double>(index) / static_cast<double>(count - 1);
}

} // namespace

TerrainResampler::TerrainResampler(const ResamplerConfig& config)
    : config_(config), logger_("TerrainResampler") {
}

Eigen::MatrixXd TerrainResampler::gaussian_operator(size_t count, double sigma, double truncate) {
    const Eigen::Index n = static_cast<Eigen::Index>(count);
    if (sigma <= 0.0) {
        return Eigen::MatrixXd::Identity(n, n);
    }

    const long radius = static_cast<long>(truncate * sigma + 0.5);
    std::vector<double> weights(static_cast<size_t>(2 * radius + 1));
    double total = 0.0;
    for (long offset = -radius; offset <= radius; ++offset) {
        double w = std::exp(-0.5 * static_cast<double>(offset * offset) / (sigma * sigma));
        weights[static_cast<size_t>(offset + radius)] = w;
        total += w;
    }
    for (auto& w : weights) {
        w /= total;
    }

    Eigen::MatrixXd kernel = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (long offset = -radius; offset <= radius; ++offset) {
            Eigen::Index source = reflect_index(static_cast<long>(i) + offset, static_cast<long>(n));
            kernel(i, source) += weights[static_cast<size_t>(offset + radius)];
        }
    }
    return kernel;
}

Eigen::MatrixXd TerrainResampler::spline_operator(size_t source_count, size_t target_count) {
    const Eigen::Index n = static_cast<Eigen::Index>(source_count);
    const Eigen::Index m = static_cast<Eigen::Index>(target_count);
    Eigen::MatrixXd op = Eigen::MatrixXd::Zero(m, n);

    if (n == 0 || m == 0) {
        return op;
    }

    if (n == 1) {
        op.setOnes();
        return op;
    }

    if (n == 2) {
        for (Eigen::Index k = 0; k < m; ++k) {
            double t = sample_position(static_cast<size_t>(k), target_count);
            op(k, 0) = 1.0 - t;
            op(k, 1) = t;
        }
        return op;
    }

    if (n == 3) {
        // Not-a-knot through three points is the interpolating parabola
        for (Eigen::Index k = 0; k < m; ++k) {
            double u = sample_position(static_cast<size_t>(k), target_count) * 2.0;
            op(k, 0) = 0.5 * (u - 1.0) * (u - 2.0);
            op(k, 1) = -u * (u - 2.0);
            op(k, 2) = 0.5 * u * (u - 1.0);
        }
        return op;
    }

    // Second derivatives M at the knots from A * M = R * y
    const double h = 1.0 / static_cast<double>(n - 1);
    Eigen::MatrixXd a = Eigen::MatrixXd::Zero(n, n);
    Eigen::MatrixXd r = Eigen::MatrixXd::Zero(n, n);

    // Continuous third derivative across the first and last interior knots
    a(0, 0) = 1.0; a(0, 1) = -2.0; a(0, 2) = 1.0;
    a(n - 1, n - 3) = 1.0; a(n - 1, n - 2) = -2.0; a(n - 1, n - 1) = 1.0;

    const double curvature = 6.0 / (h * h);
    for (Eigen::Index i = 1; i < n - 1; ++i) {
        a(i, i - 1) = 1.0;
        a(i, i) = 4.0;
        a(i, i + 1) = 1.0;
        r(i, i - 1) = curvature;
        r(i, i) = -2.0 * curvature;
        r(i, i + 1) = curvature;
    }

    Eigen::MatrixXd second_derivatives = a.partialPivLu().solve(r);

    for (Eigen::Index k = 0; k < m; ++k) {
        double t = sample_position(static_cast<size_t>(k), target_count);
        Eigen::Index segment = std::min<Eigen::Index>(static_cast<Eigen::Index>(t / h), n - 2);

        double left = t - static_cast<double>(segment) * h;    // t - x_k
        double right = h - left;                               // x_{k+1} - t

        double a_coeff = right * right * right / (6.0 * h) - h * right / 6.0;
        double b_coeff = left * left * left / (6.0 * h) - h * left / 6.0;

        op.row(k) = a_coeff * second_derivatives.row(segment) +
                    b_coeff * second_derivatives.row(segment + 1);
        op(k, segment) += right / h;
        op(k, segment + 1) += left / h;
    }

    return op;
}

Heightmap TerrainResampler::gaussian_smooth(const Heightmap& source, double sigma, double truncate) {
    Eigen::MatrixXd row_kernel = gaussian_operator(source.rows(), sigma, truncate);
    Eigen::MatrixXd col_kernel = gaussian_operator(source.cols(), sigma, truncate);

    Heightmap::Grid smoothed = row_kernel * source.grid() * col_kernel.transpose();
    return Heightmap(std::move(smoothed));
}

Heightmap TerrainResampler::spline_rescale(const Heightmap& source, size_t target_rows, size_t target_cols) const {
    if (source.empty()) {
        throw std::invalid_argument("Cannot rescale an empty heightmap");
    }

    Eigen::MatrixXd row_op = spline_operator(source.rows(), target_rows);
    Eigen::MatrixXd col_op = spline_operator(source.cols(), target_cols);

    logger_.debug("Spline rescale " + std::to_string(source.rows()) + "x" + std::to_string(source.cols()) +
                  " -> " + std::to_string(target_rows) + "x" + std::to_string(target_cols));

    Heightmap::Grid rescaled = row_op * source.grid() * col_op.transpose();
    return Heightmap(std::move(rescaled));
}

Heightmap TerrainResampler::resample(const Heightmap& raw, int target_resolution) const {
    if (raw.empty()) {
        throw std::invalid_argument("Cannot resample an empty heightmap");
    }
    if (target_resolution < 2) {
        throw std::invalid_argument("Target resolution must be at least 2, got " +
                                    std::to_string(target_resolution));
    }

    const size_t target = static_cast<size_t>(target_resolution);

    if (raw.rows() == target && raw.cols() == target) {
        logger_.detailed("Grid already at " + std::to_string(target) + "x" + std::to_string(target) +
                         ", applying light smoothing only");
        return gaussian_smooth(raw, config_.light_sigma, config_.truncate);
    }

    logger_.detailed("Resampling " + std::to_string(raw.rows()) + "x" + std::to_string(raw.cols()) +
                     " -> " + std::to_string(target) + "x" + std::to_string(target));

    Heightmap presmoothed = gaussian_smooth(raw, config_.presmooth_sigma, config_.truncate);
    Heightmap fitted = spline_rescale(presmoothed, target, target);
    return gaussian_smooth(fitted, config_.light_sigma, config_.truncate);
}

} // namespace terrain3d
