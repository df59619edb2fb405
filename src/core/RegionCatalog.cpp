/**
 * @file RegionCatalog.cpp
 * @brief Region table
 */

#include "RegionCatalog.hpp"

namespace terrain3d {

const std::vector<Region>& RegionCatalog::all() {
    static const std::vector<Region> regions = {
        {"mont-blanc", "Mont Blanc", {45.78, 45.90, 6.80, 6.95}, 256, 1200.0, 4808.0,
         "Highest summit of the Alps and of Western Europe"},
        {"chamonix", "Vallée de Chamonix", {45.88, 46.02, 6.82, 7.02}, 256, 1035.0, 3842.0,
         "Alpine valley at the foot of Mont Blanc"},
        {"massif-central", "Puy de Dôme", {45.70, 45.82, 2.90, 3.05}, 256, 800.0, 1465.0,
         "Chaîne des Puys, the dormant volcanoes of the Massif Central"},
        {"pyrenees", "Pic du Midi", {42.88, 43.02, -0.20, 0.05}, 256, 500.0, 2872.0,
         "Pic du Midi de Bigorre area in the Pyrenees"},
        {"provence", "Sainte-Victoire", {43.48, 43.58, 5.52, 5.72}, 256, 200.0, 1011.0,
         "Limestone ridge painted by Cézanne"},
        {"ventoux", "Mont Ventoux", {44.10, 44.22, 5.20, 5.35}, 256, 400.0, 1909.0,
         "The Giant of Provence, a Tour de France classic"},
        {"corsica", "Monte Cinto (Corse)", {42.30, 42.42, 8.90, 9.05}, 256, 500.0, 2706.0,
         "Highest point of Corsica"},
        {"brittany-coast", "Côte de Granit Rose", {48.78, 48.88, -3.55, -3.38}, 256, 0.0, 80.0,
         "Pink granite coastline of northern Brittany"},
        {"vercors", "Massif du Vercors", {44.95, 45.12, 5.40, 5.60}, 256, 200.0, 2341.0,
         "Natural fortress of the Vercors plateau"},
        {"gorges-verdon", "Gorges du Verdon", {43.72, 43.82, 6.30, 6.50}, 256, 400.0, 1500.0,
         "The Grand Canyon of Europe"},
        {"dune-pilat", "Dune du Pilat", {44.55, 44.62, -1.22, -1.12}, 256, 0.0, 110.0,
         "Tallest sand dune in Europe, on the Atlantic coast"},
        {"cirque-gavarnie", "Cirque de Gavarnie", {42.68, 42.78, -0.05, 0.08}, 256, 1300.0, 3248.0,
         "UNESCO-listed glacial amphitheatre"},
    };
    return regions;
}

std::optional<Region> RegionCatalog::find(const std::string& id) {
    for (const auto& region : all()) {
        if (region.id == id) {
            return region;
        }
    }
    return std::nullopt;
}

std::vector<std::string> RegionCatalog::ids() {
    std::vector<std::string> result;
    result.reserve(all().size());
    for (const auto& region : all()) {
        result.push_back(region.id);
    }
    return result;
}

} // namespace terrain3d
