/**
 * @file TerrainSynthesizer.cpp
 * @brief Implementation of procedural terrain synthesis
 */

#include "TerrainSynthesizer.hpp"
#include <cmath>
#include <random>
#include <stdexcept>

namespace terrain3d {

namespace {

constexpr double PI = 3.14159265358979323846;

// 53 random mantissa bits mapped onto [0, 1)
double next_unit_double(std::mt19937_64& rng) {
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

bool within(double value, double low, double high) {
    return low < value && value < high;
}

} // namespace

TerrainSynthesizer::TerrainSynthesizer(const TerrainSynthesisConfig& config)
    : config_(config), logger_("TerrainSynthesizer") {
}

const std::vector<ElevationBand>& TerrainSynthesizer::elevation_bands() {
    // Regions overlap (Alps/Jura, Pyrenees/Mediterranean): order matters
    static const std::vector<ElevationBand> bands = {
        {"alps", [](double lat, double lon) { return within(lat, 44.5, 46.5) && within(lon, 5.5, 8.0); }, 1500.0, 2500.0},
        {"pyrenees", [](double lat, double lon) { return within(lat, 42.5, 43.5) && within(lon, -2.0, 3.0); }, 800.0, 2000.0},
        {"massif-central", [](double lat, double lon) { return within(lat, 44.5, 46.0) && within(lon, 2.0, 4.0); }, 600.0, 1000.0},
        {"corsica", [](double lat, double lon) { return within(lat, 41.3, 43.0) && within(lon, 8.5, 9.6); }, 400.0, 2000.0},
        {"vosges", [](double lat, double lon) { return within(lat, 47.5, 48.5) && within(lon, 6.5, 7.5); }, 400.0, 1000.0},
        {"jura", [](double lat, double lon) { return within(lat, 46.0, 47.5) && within(lon, 5.5, 7.0); }, 500.0, 1200.0},
        {"brittany", [](double lat, double lon) { return within(lat, 47.5, 49.0) && within(lon, -5.0, -1.0); }, 0.0, 100.0},
        {"atlantic-coast", [](double, double lon) { return lon < -1.0; }, 0.0, 150.0},
        {"mediterranean-coast", [](double lat, double lon) { return lat < 44.0 && lon > 3.0; }, 50.0, 500.0},
    };
    return bands;
}

const ElevationBand& TerrainSynthesizer::default_band() {
    static const ElevationBand plains{"plains", [](double, double) { return true; }, 100.0, 300.0};
    return plains;
}

const ElevationBand& TerrainSynthesizer::select_band(double lat, double lon) {
    for (const auto& band : elevation_bands()) {
        if (band.matches(lat, lon)) {
            return band;
        }
    }
    return default_band();
}

std::array<double, 8> TerrainSynthesizer::seeded_phases(uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::array<double, 8> phases{};
    for (auto& phase : phases) {
        phase = next_unit_double(rng) * 2.0 * PI;
    }
    return phases;
}

double TerrainSynthesizer::wave_noise(double x, double y, const std::array<double, 8>& phases) {
    double sum = 0.0;
    for (int i = 0; i < 4; ++i) {
        double angle = i * PI / 4.0 + phases[i];
        double jitter = 1.0 + phases[i + 4] * 0.5;
        sum += std::sin(jitter * (x * std::cos(angle) + y * std::sin(angle)) + phases[i]);
    }
    return sum / 4.0;
}

Heightmap TerrainSynthesizer::synthesize(const BoundingBox& bounds, int resolution) const {
    if (resolution < 2) {
        throw std::invalid_argument("Synthetic terrain needs a resolution of at least 2, got " +
                                    std::to_string(resolution));
    }

    const ElevationBand& band = select_band(bounds.center_lat(), bounds.center_lon());
    logger_.info("Synthesizing " + std::to_string(resolution) + "x" + std::to_string(resolution) +
                 " terrain in band '" + band.name + "' (base " + std::to_string(band.base_elevation) +
                 " m, range " + std::to_string(band.elevation_range) + " m)");

    const size_t n = static_cast<size_t>(resolution);
    const double step = DOMAIN_EXTENT / static_cast<double>(n - 1);

    std::array<std::array<double, 8>, 4> octave_phases;
    for (size_t k = 0; k < OCTAVE_SEEDS.size(); ++k) {
        octave_phases[k] = seeded_phases(OCTAVE_SEEDS[k]);
    }

    Heightmap heightmap(n, n);
    for (size_t i = 0; i < n; ++i) {
        double y = static_cast<double>(i) * step;
        for (size_t j = 0; j < n; ++j) {
            double x = static_cast<double>(j) * step;
            double value = 0.0;
            for (size_t k = 0; k < OCTAVE_FREQUENCIES.size(); ++k) {
                double f = OCTAVE_FREQUENCIES[k];
                value += OCTAVE_AMPLITUDES[k] * wave_noise(x * f, y * f, octave_phases[k]);
            }
            heightmap(i, j) = value;
        }
    }

    double low = heightmap.min_value();
    double range = heightmap.max_value() - low;
    if (range == 0.0) {
        range = 1.0;
    }
    heightmap.grid() = ((heightmap.grid().array() - low) / range) * band.elevation_range + band.base_elevation;

    if (config_.carve_valleys) {
        auto valley_phases = seeded_phases(VALLEY_SEED);
        size_t carved = 0;
        for (size_t i = 0; i < n; ++i) {
            double y = static_cast<double>(i) * step * VALLEY_FREQUENCY;
            for (size_t j = 0; j < n; ++j) {
                double x = static_cast<double>(j) * step * VALLEY_FREQUENCY;
                if (wave_noise(x, y, valley_phases) < VALLEY_THRESHOLD) {
                    heightmap(i, j) *= VALLEY_FACTOR;
                    ++carved;
                }
            }
        }
        logger_.detailed("Carved " + std::to_string(carved) + " valley cells");
    }

    logger_.debug("Synthetic elevation range: " + std::to_string(heightmap.min_value()) + " to " +
                  std::to_string(heightmap.max_value()) + " m");
    return heightmap;
}

} // namespace terrain3d
