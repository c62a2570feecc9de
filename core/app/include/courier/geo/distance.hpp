#pragma once

#include "courier/domain/geo_point.hpp"

namespace courier {
namespace geo {

// Mean Earth radius used by the haversine formula.
constexpr double kEarthRadiusKm = 6371.0;

// -----------------------------------------------------------------------------
// haversineKm(a, b)
// -----------------------------------------------------------------------------
//
// @brief  Great-circle distance between two WGS84 points, in kilometers.
//
// @param  a, b  Latitude/longitude in degrees.
// @return Unrounded distance; haversineKm(a, b) == haversineKm(b, a).
//
// @details
// Plain haversine on a spherical Earth. Offers are always city-scale, so no
// special handling of antipodal points is needed.
// -----------------------------------------------------------------------------
double haversineKm(const domain::GeoPoint& a, const domain::GeoPoint& b);

// Rounds a distance to 3 decimal places (meters), the precision stored on a
// suggestion.
double roundKm(double km);

// True when lat is in [-90, 90] and lng in [-180, 180]. NaN is out of range.
bool isValidCoordinate(const domain::GeoPoint& point);

}  // namespace geo
}  // namespace courier
