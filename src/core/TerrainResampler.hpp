/**
 * @file TerrainResampler.hpp
 * @brief Smoothing and spline resampling of elevation grids
 *
 * Raw grids arrive at whatever resolution the data source could supply.
 * The resampler suppresses sampling noise, fits a bicubic interpolating
 * spline over the unit square and evaluates it at the requested output
 * resolution, then removes interpolation ringing with a light blur.
 *
 * Both the Gaussian blur and the spline are linear in the samples, so each
 * is applied as a pair of dense Eigen operators: rows first, then columns.
 */

#pragma once

#include "terrain3d.hpp"
#include "Logger.hpp"
#include <Eigen/Dense>

namespace terrain3d {

/**
 * @brief Blur strengths, in grid cells
 */
struct ResamplerConfig {
    double presmooth_sigma = 1.0;   ///< Before fitting, to suppress sampling noise
    double light_sigma = 0.5;       ///< After fitting, or the only pass when no resampling is needed
    double truncate = 4.0;          ///< Kernel radius in sigmas
};

class TerrainResampler {
public:
    explicit TerrainResampler(const ResamplerConfig& config = ResamplerConfig{});

    /**
     * @brief Smooth and resample a raw grid to target x target
     *
     * A grid already at the target size only gets the light pass.
     * @throws std::invalid_argument for an empty grid or a target below 2
     */
    Heightmap resample(const Heightmap& raw, int target_resolution) const;

    /**
     * @brief Bicubic spline rescale without any smoothing
     */
    Heightmap spline_rescale(const Heightmap& source, size_t target_rows, size_t target_cols) const;

    /**
     * @brief Separable Gaussian blur with mirrored borders (d c b a | a b c d)
     */
    static Heightmap gaussian_smooth(const Heightmap& source, double sigma, double truncate = 4.0);

    /**
     * @brief Matrix mapping n uniform samples on [0,1] to m uniform spline evaluations
     *
     * Cubic spline with not-a-knot end conditions for n >= 4; lower-order
     * interpolation for fewer samples. Result is m x n.
     */
    static Eigen::MatrixXd spline_operator(size_t source_count, size_t target_count);

    /**
     * @brief n x n matrix applying a 1D Gaussian with reflected borders
     */
    static Eigen::MatrixXd gaussian_operator(size_t count, double sigma, double truncate);

    const ResamplerConfig& get_config() const { return config_; }

private:
    ResamplerConfig config_;
    Logger logger_;
};

} // namespace terrain3d
