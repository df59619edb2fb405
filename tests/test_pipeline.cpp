// tests/test_pipeline.cpp
#include <doctest/doctest.h>

#include "terrain3d.hpp"
#include "InputValidator.hpp"
#include "Logger.hpp"
#include "RegionCatalog.hpp"
#include "TerrainCache.hpp"
#include "TerrainMesh.hpp"
#include "TerrainSynthesizer.hpp"
#include "export/HeightmapJsonExporter.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <memory>

using namespace terrain3d;
using json = nlohmann::json;

namespace {

const BoundingBox kMontBlanc(45.78, 45.90, 6.80, 6.95);

TerrainConfig offline_config() {
    TerrainConfig config = test::fast_config();
    config.offline = true;
    return config;
}

TerrainParameters solid_params(int resolution) {
    TerrainParameters params;
    params.resolution = resolution;
    params.add_base = true;
    params.base_thickness = 5.0;
    return params;
}

} // namespace

TEST_CASE("TerrainGenerator: provider failure mid-fetch falls back to synthesis") {
    auto provider = std::make_shared<test::FakeElevationProvider>([](const GeoPoint&) { return 1000.0; });
    provider->fail_batch(2);

    TerrainCache cache;
    TerrainGenerator generator(test::fast_config(), provider, cache);

    std::string source;
    Heightmap heightmap = generator.acquire_heightmap(kMontBlanc, 64, &source);

    CHECK(source == "synthetic");
    CHECK(heightmap == TerrainSynthesizer().synthesize(kMontBlanc, 64));
    CHECK(provider->distinct_batches() == 2);
}

TEST_CASE("TerrainGenerator: provider data is resampled to the target") {
    auto provider = std::make_shared<test::FakeElevationProvider>([](const GeoPoint& p) {
        return 1000.0 + (p.lat - 45.78) * 10000.0;
    });

    TerrainCache cache;
    TerrainGenerator generator(test::fast_config(), provider, cache);

    std::string source;
    Heightmap heightmap = generator.acquire_heightmap(kMontBlanc, 128, &source);

    CHECK(source == "srtm");
    CHECK(heightmap.rows() == 128);
    CHECK(heightmap.cols() == 128);
    CHECK(heightmap.all_finite());

    // North is row 0, so the northern edge is higher than the southern one
    CHECK(heightmap(0, 64) > heightmap(127, 64));
}

TEST_CASE("TerrainGenerator: offline mode never calls the provider") {
    auto provider = std::make_shared<test::FakeElevationProvider>([](const GeoPoint&) { return 1.0; });
    TerrainCache cache;
    TerrainGenerator generator(offline_config(), provider, cache);

    std::string source;
    generator.acquire_heightmap(kMontBlanc, 64, &source);
    CHECK(source == "synthetic");
    CHECK(provider->call_count() == 0);
}

TEST_CASE("TerrainGenerator: 64x64 terrain with base exports 819084 bytes") {
    TerrainCache cache;
    TerrainGenerator generator(offline_config(), nullptr, cache);

    TerrainRecord record = generator.generate_terrain(kMontBlanc, 64, 1.5, std::string("mont-blanc"));
    CHECK(cache.contains(record.id));
    CHECK(record.metadata.resolution == 64);
    CHECK(record.metadata.data_source == "synthetic");
    CHECK(record.metadata.region_name.value_or("") == "Mont Blanc");
    CHECK(record.metadata.center_lat == doctest::Approx(45.84));
    CHECK(record.created_at.size() == 20);
    CHECK(record.created_at.back() == 'Z');

    std::vector<uint8_t> bytes = generator.export_stl(record.id, solid_params(64));
    CHECK(bytes.size() == 819084);

    const PerformanceMetrics& metrics = generator.get_metrics();
    CHECK(metrics.triangles_generated == 16380);
    CHECK(metrics.vertices_generated == 8192);
    CHECK(metrics.bytes_written == 819084);
    CHECK(generator.get_validation_result().is_valid());
}

TEST_CASE("TerrainGenerator: height exaggeration stretches relief around the minimum") {
    TerrainCache cache;
    TerrainGenerator generator(offline_config(), nullptr, cache);

    TerrainRecord flat = generator.generate_terrain(kMontBlanc, 64, 1.0);
    TerrainRecord tall = generator.generate_terrain(kMontBlanc, 64, 2.0);

    CHECK(tall.metadata.min_elevation == doctest::Approx(flat.metadata.min_elevation));
    double flat_relief = flat.metadata.max_elevation - flat.metadata.min_elevation;
    double tall_relief = tall.metadata.max_elevation - tall.metadata.min_elevation;
    CHECK(tall_relief == doctest::Approx(2.0 * flat_relief));
    CHECK(flat.id != tall.id);
}

TEST_CASE("TerrainGenerator: export resolution may differ from the stored grid") {
    TerrainCache cache;
    TerrainGenerator generator(offline_config(), nullptr, cache);
    TerrainRecord record = generator.generate_terrain(kMontBlanc, 64, 1.5);

    TerrainParameters params = solid_params(96);
    TerrainMesh mesh = generator.build_mesh(record.id, params);
    CHECK(mesh.num_vertices() == 2 * 96 * 96);
    CHECK(mesh.validate_topology().is_valid());

    params.add_base = false;
    TerrainMesh surface = generator.build_mesh(record.id, params);
    CHECK(surface.num_vertices() == 96 * 96);
    CHECK(surface.num_triangles() == 2 * 95 * 95);
}

TEST_CASE("TerrainGenerator: rejects invalid input before doing any work") {
    TerrainCache cache;
    TerrainGenerator generator(offline_config(), nullptr, cache);

    CHECK_THROWS_AS(generator.generate_terrain(BoundingBox(45.9, 45.8, 6.8, 6.95), 64, 1.5), ValidationError);
    CHECK_THROWS_AS(generator.generate_terrain(kMontBlanc, 32, 1.5), ValidationError);
    CHECK_THROWS_AS(generator.generate_terrain(kMontBlanc, 64, 9.0), ValidationError);
    CHECK(cache.size() == 0);

    TerrainRecord record = generator.generate_terrain(kMontBlanc, 64, 1.5);
    TerrainParameters thick = solid_params(64);
    thick.base_thickness = 25.0;
    CHECK_THROWS_AS(generator.export_stl(record.id, thick), ValidationError);

    CHECK_THROWS_AS(generator.export_stl("terrain-missing", solid_params(64)), std::out_of_range);
}

TEST_CASE("TerrainGenerator: evicted terrain can no longer be exported") {
    TerrainConfig config = offline_config();
    TerrainCache cache(1);
    TerrainGenerator generator(config, nullptr, cache);

    TerrainRecord first = generator.generate_terrain(kMontBlanc, 64, 1.5);
    TerrainRecord second = generator.generate_terrain(kMontBlanc, 64, 1.5);

    CHECK_FALSE(cache.contains(first.id));
    CHECK(cache.contains(second.id));
    CHECK_THROWS_AS(generator.export_stl(first.id, solid_params(64)), std::out_of_range);
    CHECK(generator.export_stl(second.id, solid_params(64)).size() == 819084);
}

TEST_CASE("TerrainGenerator: download names use the region when known") {
    TerrainRecord record;
    record.id = "terrain-0000abcd";
    CHECK(TerrainGenerator::export_filename(record, 64) == "terrain_terrain-0000abcd_64.stl");

    record.metadata.region_id = "mont-blanc";
    CHECK(TerrainGenerator::export_filename(record, 256) == "terrain_mont-blanc_256.stl");
}

TEST_CASE("TerrainCache: oldest record is evicted first") {
    TerrainCache cache(2);

    TerrainRecord a;
    a.id = "a";
    TerrainRecord b;
    b.id = "b";
    TerrainRecord c;
    c.id = "c";

    cache.put(a);
    cache.put(b);
    CHECK(cache.size() == 2);
    CHECK(cache.evictions() == 0);

    cache.put(c);
    CHECK(cache.size() == 2);
    CHECK(cache.evictions() == 1);
    CHECK_FALSE(cache.get("a"));
    CHECK(cache.ids() == std::vector<std::string>{"b", "c"});

    // Re-putting an id replaces it in place
    b.metadata.data_source = "dem-file";
    cache.put(b);
    CHECK(cache.size() == 2);
    CHECK(cache.evictions() == 1);
    CHECK(cache.get("b")->metadata.data_source == "dem-file");

    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(TerrainCache(0).capacity() == 1);
}

TEST_CASE("TerrainCache: generated ids are unique and well formed") {
    TerrainCache cache;
    std::string first = cache.next_id();
    std::string second = cache.next_id();

    CHECK(first != second);
    CHECK(first.rfind("terrain-", 0) == 0);
    CHECK(first.size() == 16);
}

TEST_CASE("RegionCatalog: built-in regions are valid areas") {
    InputValidator validator;
    CHECK(RegionCatalog::all().size() == 12);
    CHECK(RegionCatalog::ids().size() == 12);

    for (const auto& region : RegionCatalog::all()) {
        CAPTURE(region.id);
        CHECK(validator.validate_bounds(region.bounds).is_valid);
        CHECK(region.min_elevation < region.max_elevation);
    }

    auto mont_blanc = RegionCatalog::find("mont-blanc");
    REQUIRE(mont_blanc);
    CHECK(mont_blanc->name == "Mont Blanc");
    CHECK(mont_blanc->bounds == kMontBlanc);
    CHECK_FALSE(RegionCatalog::find("atlantis"));
}

TEST_CASE("InputValidator: defaults are accepted") {
    InputValidator validator;
    CHECK(validator.validate(TerrainConfig{}).is_valid);
    CHECK(ValidationResult{}.format_error_message().empty());
}

TEST_CASE("InputValidator: every range is inclusive at both ends") {
    InputValidator validator;
    TerrainParameters params;
    params.resolution = 64;
    params.height_exaggeration = 0.5;
    params.scale_xy = 10.0;
    params.scale_z = 5.0;
    params.base_thickness = 1.0;
    CHECK(validator.validate_parameters(params).is_valid);

    params.resolution = 512;
    params.height_exaggeration = 5.0;
    params.scale_xy = 0.1;
    params.scale_z = 0.5;
    params.base_thickness = 20.0;
    CHECK(validator.validate_parameters(params).is_valid);
}

TEST_CASE("InputValidator: errors name the option and the accepted range") {
    InputValidator validator;
    TerrainConfig config;
    config.parameters.resolution = 600;
    config.parameters.scale_z = 0.1;

    ValidationResult result = validator.validate(config);
    CHECK(result.has_errors());
    CHECK(result.conflicts.size() == 2);

    std::string message = result.format_error_message();
    CHECK(message.find("ERROR: Invalid parameters:") != std::string::npos);
    CHECK(message.find("--resolution 600") != std::string::npos);
    CHECK(message.find("Accepted range: 64 to 512") != std::string::npos);
    CHECK(message.find("--scale-z") != std::string::npos);
    CHECK(message.find("Nothing was generated.") != std::string::npos);
}

TEST_CASE("InputValidator: base thickness only matters with a base") {
    InputValidator validator;
    TerrainParameters params;
    params.base_thickness = 50.0;
    params.add_base = false;
    CHECK(validator.validate_parameters(params).is_valid);

    params.add_base = true;
    CHECK_FALSE(validator.validate_parameters(params).is_valid);
}

TEST_CASE("InputValidator: geographic and acquisition limits") {
    InputValidator validator;
    CHECK_FALSE(validator.validate_bounds(BoundingBox(45.0, 95.0, 6.0, 7.0)).is_valid);
    CHECK_FALSE(validator.validate_bounds(BoundingBox(45.0, 46.0, 179.0, 181.0)).is_valid);
    CHECK_FALSE(validator.validate_bounds(BoundingBox(45.0, 45.0, 6.0, 7.0)).is_valid);
    CHECK(validator.validate_bounds(BoundingBox(-34.0, -33.5, 18.2, 18.6)).is_valid);

    TerrainConfig config;
    config.batch_size = 501;
    CHECK_FALSE(validator.validate(config).is_valid);

    config = TerrainConfig{};
    config.export_resolution = 1024;
    CHECK_FALSE(validator.validate(config).is_valid);
}

TEST_CASE("HeightmapJsonExporter: document carries grid and metadata") {
    TerrainCache cache;
    TerrainGenerator generator(offline_config(), nullptr, cache);
    TerrainRecord record = generator.generate_terrain(kMontBlanc, 64, 1.5, std::string("mont-blanc"));

    json doc = json::parse(HeightmapJsonExporter().to_json_string(record));
    CHECK(doc["id"] == record.id);
    CHECK(doc["resolution"] == 64);
    CHECK(doc["bbox"]["lat_min"].get<double>() == doctest::Approx(45.78));
    REQUIRE(doc["heightmap"].size() == 64);
    CHECK(doc["heightmap"][0].size() == 64);
    CHECK(doc["heightmap"][3][5].get<double>() == doctest::Approx(record.heightmap(3, 5)));
    CHECK(doc["metadata"]["data_source"] == "synthetic");
    CHECK(doc["metadata"]["region_id"] == "mont-blanc");
    CHECK(doc["metadata"]["timestamp"] == record.created_at);

    HeightmapJsonExporter::Options options;
    options.include_heightmap = false;
    json summary = json::parse(HeightmapJsonExporter(options).to_json_string(record));
    CHECK_FALSE(summary.contains("heightmap"));
}

TEST_CASE("Logger: log configuration strings") {
    CHECK(Logger::parseLogConfig("4") == std::optional<int>(4));
    CHECK(Logger::parseLogConfig("MeshBuilder=6") == std::nullopt);
    CHECK(Logger::getFacilityLevel("MeshBuilder") == LogLevel::TRACE);
    CHECK(Logger::parseLogConfig("9,TerrainCache=2") == std::optional<int>(6));
    CHECK(Logger::parseLogConfig("") == std::nullopt);

    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(LogLevel::ERROR);
    CHECK(Logger::getFacilityLevel("MeshBuilder") == LogLevel::ERROR);
}
