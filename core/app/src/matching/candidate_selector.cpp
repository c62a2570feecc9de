#include "courier/matching/candidate_selector.hpp"

#include "courier/geo/distance.hpp"
#include "courier/matching/eligibility.hpp"

#include <algorithm>

namespace courier {
namespace matching {

CandidateSelector::CandidateSelector(const ICandidatePool& pool,
                                     const ITimeProvider& clock,
                                     const domain::DispatchConfig& config)
    : pool_(pool),
      clock_(clock),
      staleness_ms_(config.locationStalenessMs()) {}

// -----------------------------------------------------------------------------
// selectCandidates()
// -----------------------------------------------------------------------------
std::vector<DriverCandidate> CandidateSelector::selectCandidates(
    const domain::Order& order,
    const std::unordered_set<domain::DriverId>& excluded) const {
  const std::int64_t cutoff = clock_.now_ms() - staleness_ms_;

  std::vector<DriverCandidate> ranked;
  for (const auto& driver : pool_.availableDrivers(cutoff)) {
    if (driver.id == order.customer_id || excluded.count(driver.id) > 0) {
      continue;
    }
    if (!driver.location || !isEligible(driver, order)) {
      continue;
    }
    const double km = geo::haversineKm(driver.location->point, order.pickup);
    ranked.push_back(DriverCandidate{driver.id, geo::roundKm(km)});
  }

  std::sort(ranked.begin(), ranked.end(),
            [](const DriverCandidate& a, const DriverCandidate& b) {
              if (a.distance_km != b.distance_km) {
                return a.distance_km < b.distance_km;
              }
              return a.driver_id < b.driver_id;
            });
  return ranked;
}

}  // namespace matching
}  // namespace courier
