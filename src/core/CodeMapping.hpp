#pragma once

/**
 * @file CodeMapping.hpp
 * @brief Land-cover class -> surface category -> resistance chain
 */

#include "rx_point_enricher.hpp"
#include <map>
#include <optional>
#include <vector>

namespace rxgis {

/**
 * @brief Category for a raw land-cover class, default when unmapped
 */
int map_category(int raw_class, const std::map<int, int>& class_to_category, int default_category);

/**
 * @brief Resistance for a category, default when unmapped
 */
double map_resistance(int category, const std::map<int, double>& category_to_resistance,
                      double default_resistance);

/**
 * @brief Nearest integer class for a raster sample
 * @return nullopt for NaN, infinities and values outside the int range
 */
std::optional<int> to_class_code(double sample);

/**
 * @brief Map a whole vector of land-cover samples to categories
 *
 * Samples are rounded to the nearest integer class first. Sentinel samples
 * are ordinary keys and fall through to the default unless the table maps
 * them explicitly.
 */
std::vector<int> map_categories(const std::vector<double>& samples, const CodeMappingTable& table);

std::vector<double> map_resistances(const std::vector<int>& categories, const CodeMappingTable& table);

/**
 * @brief Built-in table for ESA WorldCover 10 m classes
 */
CodeMappingTable default_worldcover_mapping();

} // namespace rxgis
