/**
 * @file CodeMapping.cpp
 * @brief Two-stage code mapping with explicit defaults
 */

#include "CodeMapping.hpp"
#include <cmath>
#include <limits>

namespace rxgis {

int map_category(int raw_class, const std::map<int, int>& class_to_category, int default_category) {
    const auto it = class_to_category.find(raw_class);
    return it != class_to_category.end() ? it->second : default_category;
}

double map_resistance(int category, const std::map<int, double>& category_to_resistance,
                      double default_resistance) {
    const auto it = category_to_resistance.find(category);
    return it != category_to_resistance.end() ? it->second : default_resistance;
}

std::optional<int> to_class_code(double sample) {
    if (!std::isfinite(sample) ||
        sample < static_cast<double>(std::numeric_limits<int>::min()) ||
        sample > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(sample));
}

std::vector<int> map_categories(const std::vector<double>& samples, const CodeMappingTable& table) {
    std::vector<int> categories;
    categories.reserve(samples.size());

    for (double sample : samples) {
        const std::optional<int> raw_class = to_class_code(sample);
        categories.push_back(raw_class ? map_category(*raw_class, table.class_to_category, table.default_category)
                                       : table.default_category);
    }

    return categories;
}

std::vector<double> map_resistances(const std::vector<int>& categories, const CodeMappingTable& table) {
    std::vector<double> resistances;
    resistances.reserve(categories.size());

    for (int category : categories) {
        resistances.push_back(map_resistance(category, table.category_to_resistance, table.default_resistance));
    }

    return resistances;
}

CodeMappingTable default_worldcover_mapping() {
    CodeMappingTable table;

    // WorldCover class -> P.1812 clutter category
    table.class_to_category = {
        {100, 1},                                                 // moss and lichen
        {80, 2}, {30, 2}, {40, 2}, {70, 2}, {110, 2}, {254, 2},   // water, grass, crops, snow
        {20, 3}, {50, 3},                                         // shrubland, built-up
        {10, 4}, {60, 4}, {90, 4}                                 // trees, bare, wetland
    };
    table.default_category = 2;

    table.category_to_resistance = {
        {1, 0.0}, {2, 0.0}, {3, 10.0}, {4, 15.0}, {5, 20.0}
    };
    table.default_resistance = 0.0;

    return table;
}

} // namespace rxgis
