#pragma once

#include <optional>
#include <string>
#include <utility>

namespace courier {
namespace domain {

// -----------------------------------------------------------------------------
// DispatchError: expected failure outcomes of driver-facing operations
// -----------------------------------------------------------------------------
//
//   NotFound      The entity is absent, or the caller cannot see it.
//   Conflict      Another actor already resolved the order (lost a race).
//   Forbidden     The caller is not allowed to act on this order.
//   InvalidState  The action does not apply to the order's current status.
//
// These are returned to the caller, never thrown and never retried by the
// core. Scheduling oddities (stale expiry timers, empty candidate lists) are
// not errors at all; they are ordinary branches of the loop.
// -----------------------------------------------------------------------------
enum class DispatchError {
  NotFound,
  Conflict,
  Forbidden,
  InvalidState,
};

inline const char* toString(DispatchError error) {
  switch (error) {
    case DispatchError::NotFound:     return "NotFound";
    case DispatchError::Conflict:     return "Conflict";
    case DispatchError::Forbidden:    return "Forbidden";
    case DispatchError::InvalidState: return "InvalidState";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// DispatchResult
// -----------------------------------------------------------------------------
// Success, or one DispatchError plus a human-readable detail for the client.
// -----------------------------------------------------------------------------
struct DispatchResult {
  std::optional<DispatchError> error;
  std::string detail;

  bool ok() const { return !error.has_value(); }

  static DispatchResult success(std::string detail = {}) {
    return DispatchResult{std::nullopt, std::move(detail)};
  }

  static DispatchResult failure(DispatchError error, std::string detail) {
    return DispatchResult{error, std::move(detail)};
  }
};

}  // namespace domain
}  // namespace courier
