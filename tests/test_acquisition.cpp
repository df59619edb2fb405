// tests/test_acquisition.cpp
#include <doctest/doctest.h>

#include "DemFileReader.hpp"
#include "ElevationProvider.hpp"
#include "HeightmapAcquirer.hpp"
#include "TerrainCache.hpp"
#include "test_support.hpp"

#include <gdal_priv.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <memory>
#include <vector>

using namespace terrain3d;
using json = nlohmann::json;

namespace {

AcquisitionConfig quick_acquisition() {
    AcquisitionConfig config;
    config.batch_delay_ms = 0;
    config.max_retries = 1;
    config.retry_backoff_ms = 0;
    return config;
}

// North-up square raster anchored at (46.0 N, 6.0 E), value row * 100 + col
void write_ramp_raster(const std::string& path, int size, double pixel_deg) {
    GDALAllRegister();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    REQUIRE(driver != nullptr);

    GDALDataset* dataset = driver->Create(path.c_str(), size, size, 1, GDT_Float64, nullptr);
    REQUIRE(dataset != nullptr);
    double geotransform[6] = {6.0, pixel_deg, 0.0, 46.0, 0.0, -pixel_deg};
    dataset->SetGeoTransform(geotransform);

    std::vector<double> pixels(static_cast<size_t>(size) * static_cast<size_t>(size));
    for (int row = 0; row < size; ++row) {
        for (int col = 0; col < size; ++col) {
            pixels[static_cast<size_t>(row * size + col)] = row * 100.0 + col;
        }
    }
    CHECK(dataset->GetRasterBand(1)->RasterIO(GF_Write, 0, 0, size, size, pixels.data(),
                                              size, size, GDT_Float64, 0, 0) == CE_None);
    GDALClose(dataset);
}

double lat_lon_surface(const GeoPoint& p) {
    return p.lat * 1000.0 + p.lon;
}

// 0.1 degree box: the fetch grid is capped at 64x64 = 4096 points
const BoundingBox kArea(45.0, 45.1, 6.0, 6.1);

} // namespace

TEST_CASE("HeightmapAcquirer: fetch resolution is capped by target, optimum and native spacing") {
    BoundingBox wide(45.78, 45.90, 6.80, 6.95);
    CHECK(HeightmapAcquirer::fetch_resolution(wide, 256) == 64);
    CHECK(HeightmapAcquirer::fetch_resolution(wide, 48) == 48);

    // 0.005 degrees holds about 17 native samples; the floor is 32
    BoundingBox tiny(45.0, 45.005, 6.0, 6.005);
    CHECK(HeightmapAcquirer::fetch_resolution(tiny, 256) == 32);
    CHECK(HeightmapAcquirer::fetch_resolution(tiny, 16) == 16);
}

TEST_CASE("HeightmapAcquirer: samples run north to south, west to east") {
    auto points = HeightmapAcquirer::sample_points(BoundingBox(10.0, 12.0, 20.0, 24.0), 3);
    REQUIRE(points.size() == 9);

    CHECK(points[0].index == 0);
    CHECK(points[0].point.lat == doctest::Approx(12.0));
    CHECK(points[0].point.lon == doctest::Approx(20.0));

    CHECK(points[2].point.lat == doctest::Approx(12.0));
    CHECK(points[2].point.lon == doctest::Approx(24.0));

    CHECK(points[4].point.lat == doctest::Approx(11.0));
    CHECK(points[4].point.lon == doctest::Approx(22.0));

    CHECK(points[8].index == 8);
    CHECK(points[8].point.lat == doctest::Approx(10.0));
    CHECK(points[8].point.lon == doctest::Approx(24.0));

    CHECK(HeightmapAcquirer::sample_points(BoundingBox(10.0, 12.0, 20.0, 24.0), 0).empty());
}

TEST_CASE("HeightmapAcquirer: missing samples take the mean of the valid ones") {
    Heightmap grid(2, 3);
    grid(0, 0) = 100.0;
    grid(0, 1) = -32768.0;
    grid(0, 2) = 200.0;
    grid(1, 0) = std::nan("");
    grid(1, 1) = 300.0;
    grid(1, 2) = -1000.0;  // at the threshold, still valid

    auto replaced = HeightmapAcquirer::fill_missing(grid, -1000.0);
    REQUIRE(replaced);
    CHECK(*replaced == 2);

    const double mean = (100.0 + 200.0 + 300.0 - 1000.0) / 4.0;
    CHECK(grid(0, 1) == doctest::Approx(mean));
    CHECK(grid(1, 0) == doctest::Approx(mean));
    CHECK(grid(1, 2) == doctest::Approx(-1000.0));

    Heightmap hopeless(2, 2, -9999.0);
    CHECK_FALSE(HeightmapAcquirer::fill_missing(hopeless, -1000.0));
}

TEST_CASE("HeightmapAcquirer: batched fetch places every value at its grid cell") {
    auto provider = std::make_shared<test::FakeElevationProvider>(lat_lon_surface);
    HeightmapAcquirer acquirer(provider, quick_acquisition());

    AcquisitionResult result = acquirer.acquire(kArea, 256);
    REQUIRE(result.ok());
    CHECK(result.batches_completed == 9);
    CHECK(provider->call_count() == 9);
    CHECK(provider->batch_sizes().front() == 500);
    CHECK(provider->batch_sizes().back() == 4096 - 8 * 500);

    const Heightmap& grid = *result.heightmap;
    REQUIRE(grid.rows() == 64);
    REQUIRE(grid.cols() == 64);
    CHECK(grid(0, 0) == doctest::Approx(45.1 * 1000.0 + 6.0));
    CHECK(grid(0, 63) == doctest::Approx(45.1 * 1000.0 + 6.1));
    CHECK(grid(63, 0) == doctest::Approx(45.0 * 1000.0 + 6.0));
    CHECK(grid(63, 63) == doctest::Approx(45.0 * 1000.0 + 6.1));
}

TEST_CASE("HeightmapAcquirer: a batch that keeps failing fails the whole fetch") {
    auto provider = std::make_shared<test::FakeElevationProvider>(lat_lon_surface);
    provider->fail_batch(2);

    AcquisitionConfig config = quick_acquisition();
    config.max_retries = 3;
    HeightmapAcquirer acquirer(provider, config);

    AcquisitionResult result = acquirer.acquire(kArea, 64);
    CHECK_FALSE(result.ok());
    CHECK(result.batches_completed == 1);
    CHECK(result.failure_reason.find("batch 2") != std::string::npos);

    // One call for batch 1, three attempts for batch 2, nothing after
    CHECK(provider->call_count() == 4);
}

TEST_CASE("HeightmapAcquirer: a transient failure is retried") {
    auto provider = std::make_shared<test::FakeElevationProvider>(lat_lon_surface);
    provider->fail_batch(1, 1);

    AcquisitionConfig config = quick_acquisition();
    config.max_retries = 2;
    HeightmapAcquirer acquirer(provider, config);

    AcquisitionResult result = acquirer.acquire(kArea, 64);
    CHECK(result.ok());
    CHECK(provider->call_count() == 10);
    CHECK(provider->distinct_batches() == 9);
}

TEST_CASE("HeightmapAcquirer: short responses are rejected") {
    auto provider = std::make_shared<test::FakeElevationProvider>(lat_lon_surface);
    provider->set_truncate_responses(true);
    HeightmapAcquirer acquirer(provider, quick_acquisition());

    AcquisitionResult result = acquirer.acquire(kArea, 64);
    CHECK_FALSE(result.ok());
    CHECK(result.batches_completed == 0);
    CHECK(result.failure_reason.find("499 values") != std::string::npos);
}

TEST_CASE("HeightmapAcquirer: sentinel values become the grid mean") {
    auto provider = std::make_shared<test::FakeElevationProvider>([](const GeoPoint& p) {
        return p.lon < 6.05 ? -32768.0 : 500.0;
    });
    HeightmapAcquirer acquirer(provider, quick_acquisition());

    AcquisitionResult result = acquirer.acquire(kArea, 64);
    REQUIRE(result.ok());
    CHECK(result.heightmap->min_value() == doctest::Approx(500.0));
    CHECK(result.heightmap->max_value() == doctest::Approx(500.0));
}

TEST_CASE("HeightmapAcquirer: no valid elevation at all is a failure") {
    auto provider = std::make_shared<test::FakeElevationProvider>([](const GeoPoint&) { return -32768.0; });
    HeightmapAcquirer acquirer(provider, quick_acquisition());

    AcquisitionResult result = acquirer.acquire(kArea, 64);
    CHECK_FALSE(result.ok());
    CHECK(result.failure_reason.find("no valid elevation") != std::string::npos);
}

TEST_CASE("HeightmapAcquirer: unusable setups fail without calling the provider") {
    HeightmapAcquirer no_provider(nullptr, quick_acquisition());
    CHECK_FALSE(no_provider.acquire(kArea, 64).ok());

    auto provider = std::make_shared<test::FakeElevationProvider>(lat_lon_surface);
    HeightmapAcquirer acquirer(provider, quick_acquisition());
    CHECK_FALSE(acquirer.acquire(BoundingBox(45.1, 45.0, 6.0, 6.1), 64).ok());
    CHECK_FALSE(acquirer.acquire(kArea, 1).ok());

    AcquisitionConfig zero_batch = quick_acquisition();
    zero_batch.batch_size = 0;
    CHECK_FALSE(HeightmapAcquirer(provider, zero_batch).acquire(kArea, 64).ok());

    CHECK(provider->call_count() == 0);
}

TEST_CASE("OpenElevationProvider: request body lists locations in order") {
    std::string body = OpenElevationProvider::build_request_body({GeoPoint(45.5, 6.25), GeoPoint(-12.0, 130.0)});
    json parsed = json::parse(body);

    REQUIRE(parsed["locations"].size() == 2);
    CHECK(parsed["locations"][0]["latitude"].get<double>() == doctest::Approx(45.5));
    CHECK(parsed["locations"][0]["longitude"].get<double>() == doctest::Approx(6.25));
    CHECK(parsed["locations"][1]["latitude"].get<double>() == doctest::Approx(-12.0));
    CHECK(parsed["locations"][1]["longitude"].get<double>() == doctest::Approx(130.0));
}

TEST_CASE("OpenElevationProvider: response parsing checks count and types") {
    const std::string good =
        R"({"results":[{"latitude":45.5,"longitude":6.25,"elevation":1234.5},{"elevation":-7}]})";
    auto values = OpenElevationProvider::parse_response(good, 2);
    REQUIRE(values);
    CHECK((*values)[0] == doctest::Approx(1234.5));
    CHECK((*values)[1] == doctest::Approx(-7.0));

    CHECK_FALSE(OpenElevationProvider::parse_response(good, 3));
    CHECK_FALSE(OpenElevationProvider::parse_response(R"({"results":[{"elevation":null}]})", 1));
    CHECK_FALSE(OpenElevationProvider::parse_response(R"({"error":"rate limited"})", 1));
    CHECK_FALSE(OpenElevationProvider::parse_response("<html>502</html>", 1));
}

TEST_CASE("OpenElevationProvider: empty request needs no network") {
    OpenElevationProvider provider;
    auto values = provider.fetch_batch({});
    REQUIRE(values);
    CHECK(values->empty());
    CHECK(provider.name() == "open-elevation");
}

TEST_CASE("DemFileReader: reads the window covering the box") {
    GDALAllRegister();
    const std::string path = "terrain3d_test_dem.tif";

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    REQUIRE(driver != nullptr);
    {
        GDALDataset* dataset = driver->Create(path.c_str(), 20, 20, 1, GDT_Float64, nullptr);
        REQUIRE(dataset != nullptr);
        double geotransform[6] = {6.0, 0.01, 0.0, 46.0, 0.0, -0.01};
        dataset->SetGeoTransform(geotransform);

        std::vector<double> pixels(20 * 20);
        for (int row = 0; row < 20; ++row) {
            for (int col = 0; col < 20; ++col) {
                pixels[static_cast<size_t>(row * 20 + col)] = row * 100.0 + col;
            }
        }
        pixels[5 * 20 + 5] = -9999.0;

        GDALRasterBand* band = dataset->GetRasterBand(1);
        band->SetNoDataValue(-9999.0);
        CHECK(band->RasterIO(GF_Write, 0, 0, 20, 20, pixels.data(), 20, 20, GDT_Float64, 0, 0) == CE_None);
        GDALClose(dataset);
    }

    DemFileReader reader(path);
    AcquisitionResult result = reader.read(BoundingBox(45.905, 46.0, 6.0, 6.095));
    std::remove(path.c_str());

    REQUIRE(result.ok());
    const Heightmap& grid = *result.heightmap;
    REQUIRE(grid.rows() == 10);
    REQUIRE(grid.cols() == 10);
    CHECK(grid(0, 0) == doctest::Approx(0.0));
    CHECK(grid(9, 9) == doctest::Approx(909.0));
    CHECK(grid(2, 7) == doctest::Approx(207.0));

    // The no-data pixel took the mean of the other 99
    double valid_sum = 0.0;
    for (int row = 0; row < 10; ++row) {
        for (int col = 0; col < 10; ++col) {
            if (row == 5 && col == 5) continue;
            valid_sum += row * 100.0 + col;
        }
    }
    CHECK(grid(5, 5) == doctest::Approx(valid_sum / 99.0));
}

TEST_CASE("DemFileReader: missing file is a failure, not an exception") {
    DemFileReader reader("/nonexistent/terrain3d.tif");
    AcquisitionResult result = reader.read(kArea);
    CHECK_FALSE(result.ok());
    CHECK(result.failure_reason.find("not found") != std::string::npos);
}

TEST_CASE("DemFileReader: large windows are decimated to the requested edge") {
    const std::string path = "terrain3d_test_dem_large.tif";
    write_ramp_raster(path, 400, 0.001);
    const BoundingBox box(45.6, 46.0, 6.0, 6.4);

    DemFileReader reader(path);
    AcquisitionResult native = reader.read(box);
    AcquisitionResult capped = reader.read(box, 64);
    AcquisitionResult roomy = reader.read(box, 1000);
    std::remove(path.c_str());

    REQUIRE(native.ok());
    CHECK(native.heightmap->rows() == 400);
    CHECK(native.heightmap->cols() == 400);

    REQUIRE(capped.ok());
    const Heightmap& grid = *capped.heightmap;
    CHECK(grid.rows() == 64);
    CHECK(grid.cols() == 64);
    CHECK(grid.min_value() >= 0.0);
    CHECK(grid.max_value() <= 399.0 * 100.0 + 399.0);
    // Still north to south, west to east
    CHECK(grid(63, 0) > grid(0, 0));
    CHECK(grid(0, 63) > grid(0, 0));

    REQUIRE(roomy.ok());
    CHECK(roomy.heightmap->rows() == 400);
}

TEST_CASE("TerrainGenerator: DEM file input never exceeds the target grid") {
    const std::string path = "terrain3d_test_dem_pipeline.tif";
    write_ramp_raster(path, 300, 0.001);

    TerrainConfig config = test::fast_config();
    config.offline = true;
    config.dem_file = path;

    TerrainCache cache;
    TerrainGenerator generator(config, nullptr, cache);

    std::string source;
    Heightmap heightmap = generator.acquire_heightmap(BoundingBox(45.75, 46.0, 6.0, 6.25), 64, &source);
    std::remove(path.c_str());

    CHECK(source == "dem-file");
    CHECK(heightmap.rows() == 64);
    CHECK(heightmap.cols() == 64);
    CHECK(heightmap.all_finite());
}
