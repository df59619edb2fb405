/**
 * @file DemFileReader.hpp
 * @brief Reads a raw elevation grid from a local DEM raster through GDAL
 *
 * Any GDAL-readable raster in geographic coordinates works: GeoTIFF,
 * ESRI ASCII grid, SRTM .hgt, VRT mosaics. Band 1 is read over the pixel
 * window covering the bounding box.
 */

#pragma once

#include "terrain3d.hpp"
#include "HeightmapAcquirer.hpp"
#include "Logger.hpp"
#include <string>

namespace terrain3d {

class DemFileReader {
public:
    explicit DemFileReader(std::string filename);

    /**
     * @brief Read the bounding box window
     *
     * The window is read at the raster's native resolution unless it is
     * wider or taller than max_edge pixels; then GDAL decimates it to at
     * most max_edge per side. max_edge below 2 means no cap. No-data cells
     * are replaced by the mean of the valid cells.
     */
    AcquisitionResult read(const BoundingBox& bounds, int max_edge = 0);

    const std::string& filename() const { return filename_; }

private:
    std::string filename_;
    Logger logger_;
};

} // namespace terrain3d
