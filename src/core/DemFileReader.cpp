/**
 * @file DemFileReader.cpp
 * @brief Implementation of GDAL raster window reading
 */

#include "DemFileReader.hpp"
#include <gdal_priv.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>

namespace terrain3d {

namespace {

struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) {
        if (dataset) {
            GDALClose(dataset);
        }
    }
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

std::once_flag gdal_registered;

} // namespace

DemFileReader::DemFileReader(std::string filename)
    : filename_(std::move(filename)), logger_("DemFileReader") {
    std::call_once(gdal_registered, [] { GDALAllRegister(); });
}

AcquisitionResult DemFileReader::read(const BoundingBox& bounds, int max_edge) {
    if (!std::filesystem::exists(filename_)) {
        return AcquisitionResult::failure("DEM file not found: " + filename_);
    }

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(filename_.c_str(), GA_ReadOnly)));
    if (!dataset) {
        return AcquisitionResult::failure("GDAL could not open " + filename_);
    }

    std::array<double, 6> geotransform{};
    if (dataset->GetGeoTransform(geotransform.data()) != CE_None) {
        return AcquisitionResult::failure("raster has no geotransform: " + filename_);
    }
    if (geotransform[1] == 0.0 || geotransform[5] == 0.0) {
        return AcquisitionResult::failure("raster has a degenerate pixel size");
    }

    // North-up raster: pixel size in y is negative
    double pixel_min_x = (bounds.lon_min - geotransform[0]) / geotransform[1];
    double pixel_max_x = (bounds.lon_max - geotransform[0]) / geotransform[1];
    double pixel_min_y = (bounds.lat_max - geotransform[3]) / geotransform[5];
    double pixel_max_y = (bounds.lat_min - geotransform[3]) / geotransform[5];

    int x_off = std::max(0, static_cast<int>(std::floor(pixel_min_x)));
    int y_off = std::max(0, static_cast<int>(std::floor(pixel_min_y)));
    int x_size = std::min(dataset->GetRasterXSize() - x_off,
                          static_cast<int>(std::ceil(pixel_max_x)) - x_off);
    int y_size = std::min(dataset->GetRasterYSize() - y_off,
                          static_cast<int>(std::ceil(pixel_max_y)) - y_off);

    if (x_size < 2 || y_size < 2) {
        std::ostringstream msg;
        msg << "bounding box covers a " << x_size << "x" << y_size << " pixel window of " << filename_;
        return AcquisitionResult::failure(msg.str());
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        return AcquisitionResult::failure("raster has no band 1");
    }

    int has_nodata = 0;
    double nodata = band->GetNoDataValue(&has_nodata);

    // GDAL decimates the window when the buffer is smaller than it
    int buf_x = x_size;
    int buf_y = y_size;
    if (max_edge >= 2) {
        buf_x = std::min(x_size, max_edge);
        buf_y = std::min(y_size, max_edge);
        if (buf_x != x_size || buf_y != y_size) {
            logger_.detailed("Decimating " + std::to_string(x_size) + "x" + std::to_string(y_size) +
                             " pixel window to " + std::to_string(buf_x) + "x" + std::to_string(buf_y));
        }
    }

    Heightmap grid(static_cast<size_t>(buf_y), static_cast<size_t>(buf_x));
    CPLErr err = band->RasterIO(GF_Read, x_off, y_off, x_size, y_size,
                                grid.data(), buf_x, buf_y, GDT_Float64, 0, 0);
    if (err != CE_None) {
        return AcquisitionResult::failure("RasterIO failed on " + filename_);
    }

    if (has_nodata) {
        for (size_t k = 0; k < grid.size(); ++k) {
            if (grid.data()[k] == nodata) {
                grid.data()[k] = std::numeric_limits<double>::quiet_NaN();
            }
        }
    }

    auto replaced = HeightmapAcquirer::fill_missing(grid, -std::numeric_limits<double>::infinity());
    if (!replaced) {
        return AcquisitionResult::failure("raster window holds no valid elevation");
    }
    if (*replaced > 0) {
        logger_.detailed("Replaced " + std::to_string(*replaced) + " no-data pixels with the window mean");
    }

    logger_.info("Read " + std::to_string(buf_x) + "x" + std::to_string(buf_y) + " grid from " +
                 filename_ + " (" + std::to_string(grid.min_value()) + " to " +
                 std::to_string(grid.max_value()) + " m)");
    return AcquisitionResult::success(std::move(grid), 1);
}

} // namespace terrain3d
