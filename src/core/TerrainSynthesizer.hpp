/**
 * @file TerrainSynthesizer.hpp
 * @brief Deterministic procedural terrain used when no real elevation data is available
 *
 * Sums four octaves of rotated sine-wave noise over a fixed [0,4]x[0,4]
 * domain and maps the result into an elevation band picked from the area's
 * location. Seeds are fixed, so identical inputs always produce identical
 * heightmaps.
 */

#pragma once

#include "terrain3d.hpp"
#include "Logger.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace terrain3d {

/**
 * @brief Location-dependent elevation band: base height and relief range
 */
struct ElevationBand {
    std::string name;
    std::function<bool(double lat, double lon)> matches;
    double base_elevation;
    double elevation_range;
};

struct TerrainSynthesisConfig {
    bool carve_valleys = false;     ///< Lower the cells where a slow noise field dips below -0.3
};

class TerrainSynthesizer {
public:
    /// Octave layout: frequency, amplitude, seed
    static constexpr std::array<double, 4> OCTAVE_FREQUENCIES{1.0, 2.0, 4.0, 8.0};
    static constexpr std::array<double, 4> OCTAVE_AMPLITUDES{0.5, 0.25, 0.15, 0.1};
    static constexpr std::array<uint64_t, 4> OCTAVE_SEEDS{42, 123, 456, 789};
    static constexpr double DOMAIN_EXTENT = 4.0;

    static constexpr uint64_t VALLEY_SEED = 999;
    static constexpr double VALLEY_FREQUENCY = 0.5;
    static constexpr double VALLEY_THRESHOLD = -0.3;
    static constexpr double VALLEY_FACTOR = 0.7;

    explicit TerrainSynthesizer(const TerrainSynthesisConfig& config = TerrainSynthesisConfig{});

    /**
     * @brief Generate a resolution x resolution heightmap for the area
     */
    Heightmap synthesize(const BoundingBox& bounds, int resolution) const;

    /**
     * @brief Ordered band table; the first matching entry wins
     */
    static const std::vector<ElevationBand>& elevation_bands();

    /**
     * @brief Band for a location, falling back to the default plains band
     */
    static const ElevationBand& select_band(double lat, double lon);

    /**
     * @brief One noise octave: average of four seeded, rotated sine waves
     *
     * Values lie in [-1, 1].
     */
    static double wave_noise(double x, double y, const std::array<double, 8>& phases);

    /**
     * @brief Eight phases uniformly drawn from [0, 2*pi) for a seed
     */
    static std::array<double, 8> seeded_phases(uint64_t seed);

private:
    TerrainSynthesisConfig config_;
    Logger logger_;

    static const ElevationBand& default_band();
};

} // namespace terrain3d
