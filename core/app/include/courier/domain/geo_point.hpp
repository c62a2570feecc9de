#pragma once

namespace courier {
namespace domain {

// -----------------------------------------------------------------------------
// GeoPoint
// -----------------------------------------------------------------------------
// A WGS84 coordinate in decimal degrees. Plain value type; pickup/dropoff
// points on orders and driver locations both use it.
// -----------------------------------------------------------------------------
struct GeoPoint {
  double lat{0.0};
  double lng{0.0};
};

}  // namespace domain
}  // namespace courier
