/**
 * @file RegionCatalog.hpp
 * @brief Built-in table of named French terrain regions
 */

#pragma once

#include "terrain3d.hpp"
#include <optional>
#include <string>
#include <vector>

namespace terrain3d {

struct Region {
    std::string id;
    std::string name;
    BoundingBox bounds;
    int default_resolution = 256;
    double min_elevation = 0.0;     ///< Known elevation range, meters
    double max_elevation = 0.0;
    std::string description;
};

class RegionCatalog {
public:
    /// All regions in catalog order
    static const std::vector<Region>& all();

    static std::optional<Region> find(const std::string& id);

    static std::vector<std::string> ids();
};

} // namespace terrain3d
