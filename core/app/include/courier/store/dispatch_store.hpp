#pragma once

#include "courier/concurrent/id_generator.hpp"
#include "courier/domain/dispatch_state.hpp"
#include "courier/domain/order.hpp"
#include "courier/domain/suggestion.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace courier {

// -----------------------------------------------------------------------------
// OrderRecord: the unit of serialization
// -----------------------------------------------------------------------------
// One order with everything the matching protocol reads and writes for it:
// its dispatch state, its suggestion ledger and its status history. The
// mutex guards all four together. Records are created by insertOrder() and
// never destroyed while the store lives, so a pointer to one stays valid
// after the store's map lock is released.
// -----------------------------------------------------------------------------
struct OrderRecord {
  std::mutex mutex;
  domain::Order order;
  std::optional<domain::DispatchState> dispatch_state;
  std::vector<domain::Suggestion> suggestions;
  std::vector<domain::StatusHistoryEntry> history;
};

// Read-only copy of an OrderRecord taken under its lock.
struct OrderSnapshot {
  domain::Order order;
  std::optional<domain::DispatchState> dispatch_state;
  std::vector<domain::Suggestion> suggestions;
  std::vector<domain::StatusHistoryEntry> history;
};

// -----------------------------------------------------------------------------
// OrderTransaction
// -----------------------------------------------------------------------------
//
// @brief  Exclusive ownership of one order's aggregate for the duration of a
//         critical section (loop pass, expiry, accept, reject, trip step).
//
// @details
// Holds the record's mutex from DispatchStore::begin() until destruction.
// Every read-then-write of order status, driver, dispatch state and
// suggestions happens through this object, so the decision and the write
// are atomic with respect to every other actor on the same order.
//
// There is no rollback: callers validate first and mutate after, the same
// order a database transaction commits in.
//
// Do not call DispatchStore read methods for the same order while holding a
// transaction on it; the record mutex is not recursive.
// -----------------------------------------------------------------------------
class OrderTransaction {
 public:
  OrderTransaction(OrderTransaction&&) = default;
  OrderTransaction& operator=(OrderTransaction&&) = default;
  OrderTransaction(const OrderTransaction&) = delete;
  OrderTransaction& operator=(const OrderTransaction&) = delete;

  domain::Order& order() { return record_->order; }
  const domain::Order& order() const { return record_->order; }

  // Returns the dispatch state, creating it (cycle 0, active) on first use.
  domain::DispatchState& dispatchState();

  // Returns the dispatch state if one was ever created, else nullptr.
  domain::DispatchState* existingDispatchState();

  std::vector<domain::Suggestion>& suggestions() {
    return record_->suggestions;
  }

  // True if any suggestion of the order is Sent and not past its expiry.
  bool hasLiveSuggestion(std::int64_t now_ms) const;

  // Every driver offered this order, in any cycle and with any outcome.
  std::unordered_set<domain::DriverId> offeredDrivers() const;

  // Appends a suggestion to the ledger with a fresh id and returns it.
  domain::Suggestion& addSuggestion(domain::Suggestion suggestion);

  // Sets the order's status and appends the matching history row.
  void recordStatus(domain::OrderStatus status, std::int64_t now_ms);

 private:
  friend class DispatchStore;

  OrderTransaction(std::unique_lock<std::mutex> lock, OrderRecord& record,
                   IdGenerator& suggestion_ids);

  std::unique_lock<std::mutex> lock_;
  OrderRecord* record_;
  IdGenerator* suggestion_ids_;
};

// -----------------------------------------------------------------------------
// DispatchStore
// -----------------------------------------------------------------------------
//
// @brief  In-memory Dispatch State Store, Suggestion Ledger and status
//         history, with per-order exclusive locking.
//
// @details
// Locking is two-level:
//   - map_mutex_ (shared_mutex) guards the id → record map. Lookups take a
//     shared lock; insertOrder() takes a unique lock.
//   - Each OrderRecord's own mutex guards that order's aggregate. Orders do
//     not contend with each other, so loop ticks, expiry firings and driver
//     requests for different orders run fully in parallel.
//
// The map lock is never held while waiting on a record lock.
//
// Lock modes:
//   LockMode::Wait     Driver handlers and expiry: block until the order is
//                      free.
//   LockMode::TryOnly  Dispatch Loop: if another actor holds the order, skip
//                      it this tick and retry on the next.
//
// Thread model:
//   Every public method is safe from any thread.
//
// Ownership:
//   Owned by DispatchEngine. Every dispatch component holds a reference.
// -----------------------------------------------------------------------------
class DispatchStore {
 public:
  enum class LockMode { Wait, TryOnly };

  DispatchStore() = default;

  DispatchStore(const DispatchStore&) = delete;
  DispatchStore& operator=(const DispatchStore&) = delete;

  // -------------------------------------------------------------------------
  // insertOrder(order, now_ms)
  // -------------------------------------------------------------------------
  // Stores a new order and its first status history row.
  // @return false if an order with the same id already exists.
  // -------------------------------------------------------------------------
  bool insertOrder(const domain::Order& order, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // begin(order_id, mode)
  // -------------------------------------------------------------------------
  // Opens a transaction on one order.
  // @return std::nullopt if the order does not exist, or if mode is TryOnly
  //         and the order is currently locked by someone else.
  // -------------------------------------------------------------------------
  std::optional<OrderTransaction> begin(domain::OrderId order_id,
                                        LockMode mode = LockMode::Wait);

  bool contains(domain::OrderId order_id) const;

  // -------------------------------------------------------------------------
  // dispatchableOrderIds()
  // -------------------------------------------------------------------------
  // Ids of unassigned orders in SearchingForDriver or DriverNotificationSent,
  // in ascending id order. Orders locked at the time of the scan are
  // included without inspection; the loop re-checks under its own lock.
  // -------------------------------------------------------------------------
  std::vector<domain::OrderId> dispatchableOrderIds() const;

  std::optional<domain::Order> findOrder(domain::OrderId order_id) const;
  std::optional<OrderSnapshot> snapshot(domain::OrderId order_id) const;

  // -------------------------------------------------------------------------
  // liveOffersForDriver(driver_id, now_ms)
  // -------------------------------------------------------------------------
  // Every (order, suggestion) pair where the driver holds a live Sent offer.
  // Used by listSuggestedOrders(); callers apply their own filters.
  // -------------------------------------------------------------------------
  std::vector<std::pair<domain::Order, domain::Suggestion>> liveOffersForDriver(
      domain::DriverId driver_id, std::int64_t now_ms) const;

  std::map<domain::OrderStatus, std::size_t> countByStatus() const;
  std::size_t size() const;

 private:
  OrderRecord* findRecord(domain::OrderId order_id) const;
  std::vector<OrderRecord*> allRecords() const;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<domain::OrderId, std::unique_ptr<OrderRecord>> records_;
  IdGenerator suggestion_ids_;
};

}  // namespace courier
