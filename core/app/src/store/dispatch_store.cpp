#include "courier/store/dispatch_store.hpp"

#include <algorithm>
#include <utility>

namespace courier {

// =============================================================================
// OrderTransaction
// =============================================================================

OrderTransaction::OrderTransaction(std::unique_lock<std::mutex> lock,
                                   OrderRecord& record,
                                   IdGenerator& suggestion_ids)
    : lock_(std::move(lock)),
      record_(&record),
      suggestion_ids_(&suggestion_ids) {}

domain::DispatchState& OrderTransaction::dispatchState() {
  if (!record_->dispatch_state) {
    domain::DispatchState state;
    state.order_id = record_->order.id;
    record_->dispatch_state = state;
  }
  return *record_->dispatch_state;
}

domain::DispatchState* OrderTransaction::existingDispatchState() {
  return record_->dispatch_state ? &*record_->dispatch_state : nullptr;
}

bool OrderTransaction::hasLiveSuggestion(std::int64_t now_ms) const {
  return std::any_of(
      record_->suggestions.begin(), record_->suggestions.end(),
      [now_ms](const domain::Suggestion& s) { return s.isLive(now_ms); });
}

std::unordered_set<domain::DriverId> OrderTransaction::offeredDrivers() const {
  std::unordered_set<domain::DriverId> drivers;
  for (const auto& s : record_->suggestions) {
    drivers.insert(s.driver_id);
  }
  return drivers;
}

domain::Suggestion& OrderTransaction::addSuggestion(
    domain::Suggestion suggestion) {
  suggestion.id = suggestion_ids_->next_id();
  suggestion.order_id = record_->order.id;
  record_->suggestions.push_back(suggestion);
  return record_->suggestions.back();
}

void OrderTransaction::recordStatus(domain::OrderStatus status,
                                    std::int64_t now_ms) {
  record_->order.status = status;
  record_->history.push_back(
      domain::StatusHistoryEntry{record_->order.id, status, now_ms});
}

// =============================================================================
// DispatchStore
// =============================================================================

// -----------------------------------------------------------------------------
// insertOrder()
// -----------------------------------------------------------------------------
bool DispatchStore::insertOrder(const domain::Order& order,
                                std::int64_t now_ms) {
  auto record = std::make_unique<OrderRecord>();
  record->order = order;
  record->history.push_back(
      domain::StatusHistoryEntry{order.id, order.status, now_ms});

  std::unique_lock lock(map_mutex_);
  return records_.emplace(order.id, std::move(record)).second;
}

// -----------------------------------------------------------------------------
// begin(): map lookup under the shared lock, record lock after releasing it
// -----------------------------------------------------------------------------
std::optional<OrderTransaction> DispatchStore::begin(domain::OrderId order_id,
                                                     LockMode mode) {
  OrderRecord* record = findRecord(order_id);
  if (record == nullptr) {
    return std::nullopt;
  }

  std::unique_lock<std::mutex> lock(record->mutex, std::defer_lock);
  if (mode == LockMode::TryOnly) {
    if (!lock.try_lock()) {
      return std::nullopt;
    }
  } else {
    lock.lock();
  }
  return OrderTransaction(std::move(lock), *record, suggestion_ids_);
}

bool DispatchStore::contains(domain::OrderId order_id) const {
  return findRecord(order_id) != nullptr;
}

// -----------------------------------------------------------------------------
// dispatchableOrderIds()
// -----------------------------------------------------------------------------
std::vector<domain::OrderId> DispatchStore::dispatchableOrderIds() const {
  std::vector<domain::OrderId> ids;
  for (OrderRecord* record : allRecords()) {
    std::unique_lock<std::mutex> lock(record->mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
      ids.push_back(record->order.id);  // id is immutable after insert
      continue;
    }
    if (domain::isDispatchable(record->order.status) &&
        !record->order.driver_id) {
      ids.push_back(record->order.id);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::optional<domain::Order> DispatchStore::findOrder(
    domain::OrderId order_id) const {
  OrderRecord* record = findRecord(order_id);
  if (record == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(record->mutex);
  return record->order;
}

std::optional<OrderSnapshot> DispatchStore::snapshot(
    domain::OrderId order_id) const {
  OrderRecord* record = findRecord(order_id);
  if (record == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(record->mutex);
  return OrderSnapshot{record->order, record->dispatch_state,
                       record->suggestions, record->history};
}

// -----------------------------------------------------------------------------
// liveOffersForDriver()
// -----------------------------------------------------------------------------
std::vector<std::pair<domain::Order, domain::Suggestion>>
DispatchStore::liveOffersForDriver(domain::DriverId driver_id,
                                   std::int64_t now_ms) const {
  std::vector<std::pair<domain::Order, domain::Suggestion>> offers;
  for (OrderRecord* record : allRecords()) {
    std::lock_guard lock(record->mutex);
    for (const auto& s : record->suggestions) {
      if (s.driver_id == driver_id && s.isLive(now_ms)) {
        offers.emplace_back(record->order, s);
      }
    }
  }
  return offers;
}

std::map<domain::OrderStatus, std::size_t> DispatchStore::countByStatus()
    const {
  std::map<domain::OrderStatus, std::size_t> counts;
  for (OrderRecord* record : allRecords()) {
    std::lock_guard lock(record->mutex);
    ++counts[record->order.status];
  }
  return counts;
}

std::size_t DispatchStore::size() const {
  std::shared_lock lock(map_mutex_);
  return records_.size();
}

OrderRecord* DispatchStore::findRecord(domain::OrderId order_id) const {
  std::shared_lock lock(map_mutex_);
  auto it = records_.find(order_id);
  return it != records_.end() ? it->second.get() : nullptr;
}

std::vector<OrderRecord*> DispatchStore::allRecords() const {
  std::shared_lock lock(map_mutex_);
  std::vector<OrderRecord*> records;
  records.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    records.push_back(record.get());
  }
  return records;
}

}  // namespace courier
