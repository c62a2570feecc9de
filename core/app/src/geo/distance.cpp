#include "courier/geo/distance.hpp"

#include <cmath>

namespace courier {
namespace geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double toRadians(double degrees) { return degrees * kPi / 180.0; }

}  // namespace

double haversineKm(const domain::GeoPoint& a, const domain::GeoPoint& b) {
  const double phi1 = toRadians(a.lat);
  const double phi2 = toRadians(b.lat);
  const double d_phi = toRadians(b.lat - a.lat);
  const double d_lambda = toRadians(b.lng - a.lng);

  const double sin_phi = std::sin(d_phi / 2.0);
  const double sin_lambda = std::sin(d_lambda / 2.0);
  const double h = sin_phi * sin_phi +
                   std::cos(phi1) * std::cos(phi2) * sin_lambda * sin_lambda;

  return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double roundKm(double km) { return std::round(km * 1000.0) / 1000.0; }

bool isValidCoordinate(const domain::GeoPoint& point) {
  return point.lat >= -90.0 && point.lat <= 90.0 && point.lng >= -180.0 &&
         point.lng <= 180.0;
}

}  // namespace geo
}  // namespace courier
