#pragma once

#include <stdexcept>
#include <string>

namespace rxgis {

/**
 * @brief Raster resource cannot be opened, read or lacks georeferencing
 */
class RasterUnavailable : public std::runtime_error {
public:
    explicit RasterUnavailable(const std::string& message)
        : std::runtime_error("Raster unavailable: " + message) {}
};

/**
 * @brief Zone polygon layer is missing, unreadable or lacks the id field
 */
class ZoneLayerUnavailable : public std::runtime_error {
public:
    explicit ZoneLayerUnavailable(const std::string& message)
        : std::runtime_error("Zone layer unavailable: " + message) {}
};

/**
 * @brief A layer's coordinate reference system cannot be reconciled
 */
class CoordinateReferenceMismatch : public std::runtime_error {
public:
    explicit CoordinateReferenceMismatch(const std::string& message)
        : std::runtime_error("Coordinate reference mismatch: " + message) {}
};

/**
 * @brief Configuration value is missing or malformed
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace rxgis
