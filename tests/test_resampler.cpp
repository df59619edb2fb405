// tests/test_resampler.cpp
#include <doctest/doctest.h>

#include "TerrainResampler.hpp"
#include "TerrainSynthesizer.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>

using namespace terrain3d;

namespace {

double cubic(double t) {
    return t * t * t - 2.0 * t * t + 0.5 * t + 1.0;
}

} // namespace

TEST_CASE("TerrainResampler: spline operator is the identity at the knots") {
    for (size_t n : {2u, 3u, 4u, 9u}) {
        Eigen::MatrixXd op = TerrainResampler::spline_operator(n, n);
        CHECK(op.isApprox(Eigen::MatrixXd::Identity(static_cast<Eigen::Index>(n),
                                                    static_cast<Eigen::Index>(n)), 1e-9));
    }
}

TEST_CASE("TerrainResampler: spline reproduces cubic data exactly") {
    const size_t n = 7;
    const size_t m = 13;
    Eigen::VectorXd samples(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        samples(static_cast<Eigen::Index>(i)) = cubic(static_cast<double>(i) / static_cast<double>(n - 1));
    }

    Eigen::VectorXd evaluated = TerrainResampler::spline_operator(n, m) * samples;
    REQUIRE(evaluated.size() == static_cast<Eigen::Index>(m));
    for (size_t k = 0; k < m; ++k) {
        double t = static_cast<double>(k) / static_cast<double>(m - 1);
        CHECK(evaluated(static_cast<Eigen::Index>(k)) == doctest::Approx(cubic(t)).epsilon(1e-9));
    }
}

TEST_CASE("TerrainResampler: short inputs fall back to lower-order interpolation") {
    Eigen::VectorXd two(2);
    two << 0.0, 10.0;
    Eigen::VectorXd line = TerrainResampler::spline_operator(2, 5) * two;
    CHECK(line(1) == doctest::Approx(2.5));
    CHECK(line(4) == doctest::Approx(10.0));

    Eigen::VectorXd three(3);
    three << 0.0, 1.0, 4.0;  // t^2 scaled onto u in [0, 2]
    Eigen::VectorXd parabola = TerrainResampler::spline_operator(3, 5) * three;
    CHECK(parabola(1) == doctest::Approx(0.25));
    CHECK(parabola(3) == doctest::Approx(2.25));
}

TEST_CASE("TerrainResampler: Gaussian operator rows are normalized") {
    Eigen::MatrixXd op = TerrainResampler::gaussian_operator(12, 1.0, 4.0);
    for (Eigen::Index i = 0; i < op.rows(); ++i) {
        CHECK(op.row(i).sum() == doctest::Approx(1.0));
    }

    // Kernel wider than the grid still sums to one through reflection
    Eigen::MatrixXd wide = TerrainResampler::gaussian_operator(3, 2.0, 4.0);
    for (Eigen::Index i = 0; i < wide.rows(); ++i) {
        CHECK(wide.row(i).sum() == doctest::Approx(1.0));
    }

    CHECK(TerrainResampler::gaussian_operator(5, 0.0, 4.0).isIdentity());
}

TEST_CASE("TerrainResampler: constant terrain stays constant") {
    TerrainResampler resampler;
    Heightmap flat(20, 20, 812.5);

    Heightmap up = resampler.resample(flat, 64);
    CHECK(up.rows() == 64);
    CHECK(up.cols() == 64);
    CHECK(up.min_value() == doctest::Approx(812.5));
    CHECK(up.max_value() == doctest::Approx(812.5));

    Heightmap same = resampler.resample(flat, 20);
    CHECK(same.rows() == 20);
    CHECK(same.max_value() == doctest::Approx(812.5));
}

TEST_CASE("TerrainResampler: same-size resampling only lightly smooths real relief") {
    const BoundingBox alps(45.78, 45.90, 6.80, 6.95);
    Heightmap terrain = TerrainSynthesizer().synthesize(alps, 64);
    const double range = terrain.max_value() - terrain.min_value();
    REQUIRE(range > 100.0);

    Heightmap smoothed = TerrainResampler().resample(terrain, 64);
    REQUIRE(smoothed.rows() == 64);
    REQUIRE(smoothed.cols() == 64);

    double max_diff = 0.0;
    for (size_t i = 0; i < 64; ++i) {
        for (size_t j = 0; j < 64; ++j) {
            max_diff = std::max(max_diff, std::abs(smoothed(i, j) - terrain(i, j)));
        }
    }
    CHECK(max_diff > 0.0);
    CHECK(max_diff < 0.1 * range);
    CHECK(smoothed.mean_value() == doctest::Approx(terrain.mean_value()).epsilon(0.01));
}

TEST_CASE("TerrainResampler: rescale keeps corners and output shape") {
    TerrainResampler resampler;
    Heightmap ramp = test::ramp_heightmap(10, 10);

    Heightmap rescaled = resampler.spline_rescale(ramp, 37, 23);
    CHECK(rescaled.rows() == 37);
    CHECK(rescaled.cols() == 23);
    CHECK(rescaled(0, 0) == doctest::Approx(ramp(0, 0)));
    CHECK(rescaled(36, 22) == doctest::Approx(ramp(9, 9)));

    // The ramp is bilinear, so the spline reproduces it everywhere
    CHECK(rescaled(18, 11) == doctest::Approx(10.0 * 4.5 + 4.5));
}

TEST_CASE("TerrainResampler: smoothing damps noise without shifting the mean") {
    Heightmap checker(16, 16);
    for (size_t i = 0; i < 16; ++i) {
        for (size_t j = 0; j < 16; ++j) {
            checker(i, j) = ((i + j) % 2 == 0) ? 100.0 : -100.0;
        }
    }

    Heightmap smoothed = TerrainResampler::gaussian_smooth(checker, 1.0);
    CHECK(smoothed.mean_value() == doctest::Approx(checker.mean_value()));

    // Away from the mirrored borders the alternating pattern nearly cancels
    CHECK(std::abs(smoothed(8, 8)) < 1.0);
    CHECK(std::abs(smoothed(7, 8)) < 1.0);
}

TEST_CASE("TerrainResampler: rejects empty grids and tiny targets") {
    TerrainResampler resampler;
    CHECK_THROWS_AS(resampler.resample(Heightmap(), 64), std::invalid_argument);
    CHECK_THROWS_AS(resampler.resample(Heightmap(4, 4), 1), std::invalid_argument);
    CHECK_THROWS_AS(resampler.spline_rescale(Heightmap(), 4, 4), std::invalid_argument);
}
