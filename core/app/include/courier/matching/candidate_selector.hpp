#pragma once

#include "courier/domain/dispatch_config.hpp"
#include "courier/domain/order.hpp"
#include "courier/matching/i_candidate_pool.hpp"
#include "courier/time/i_time_provider.hpp"

#include <unordered_set>
#include <vector>

namespace courier {
namespace matching {

// A ranked candidate: driver and rounded distance to the order's pickup.
struct DriverCandidate {
  domain::DriverId driver_id{};
  double distance_km{0.0};
};

// -----------------------------------------------------------------------------
// CandidateSelector
// -----------------------------------------------------------------------------
//
// @brief  Ranks the drivers who may be offered an order, nearest first.
//
// @details
// selectCandidates(order, excluded):
//   1. Pool query: approved, online, location fresher than
//      now - location_staleness_seconds.
//   2. Drop the order's own customer and every id in excluded (drivers
//      offered this order in any earlier cycle, whatever the outcome).
//   3. Drop drivers failing isEligible().
//   4. Distance from the driver's location to the pickup, rounded to 3
//      decimals. Sort ascending; ties go to the lower driver id so ranking
//      is deterministic.
//
// The full list is returned. Truncation to suggestion_limit happens in the
// Dispatch Loop.
//
// Thread model:
//   Stateless apart from its references; selectCandidates() is const and
//   safe to call concurrently.
//
// Ownership:
//   Holds non-owning references to the pool and the clock; both outlive it.
// -----------------------------------------------------------------------------
class CandidateSelector {
 public:
  CandidateSelector(const ICandidatePool& pool, const ITimeProvider& clock,
                    const domain::DispatchConfig& config);

  std::vector<DriverCandidate> selectCandidates(
      const domain::Order& order,
      const std::unordered_set<domain::DriverId>& excluded) const;

 private:
  const ICandidatePool& pool_;
  const ITimeProvider& clock_;
  const std::int64_t staleness_ms_;
};

}  // namespace matching
}  // namespace courier
