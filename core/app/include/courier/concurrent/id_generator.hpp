#pragma once

#include <atomic>
#include <cstdint>

namespace courier {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out suggestion ledger ids. Values start at 1; 0 is reserved
//         as the "unset" sentinel in domain structs.
//
// @details
// Offers for different orders are written concurrently by loop ticks running
// on separate scheduler workers, so the counter is atomic. Only uniqueness is
// required, hence memory_order_relaxed.
//
// Ownership:
//   Owned by DispatchStore as a value member.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace courier
