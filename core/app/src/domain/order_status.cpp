#include "courier/domain/order_status.hpp"

#include <array>
#include <utility>

namespace courier {
namespace domain {

namespace {

constexpr std::array<std::pair<OrderStatus, const char*>, 9> kStatusNames{{
    {OrderStatus::Pending, "Pending"},
    {OrderStatus::SearchingForDriver, "SearchingForDriver"},
    {OrderStatus::DriverNotificationSent, "DriverNotificationSent"},
    {OrderStatus::Accepted, "Accepted"},
    {OrderStatus::OnTheWay, "OnTheWay"},
    {OrderStatus::Delivered, "Delivered"},
    {OrderStatus::Completed, "Completed"},
    {OrderStatus::Rejected, "Rejected"},
    {OrderStatus::Cancelled, "Cancelled"},
}};

}  // namespace

bool isDispatchable(OrderStatus status) {
  return status == OrderStatus::SearchingForDriver ||
         status == OrderStatus::DriverNotificationSent;
}

std::optional<OrderStatus> nextTripStatus(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Accepted:
      return S::OnTheWay;
    case S::OnTheWay:
      return S::Delivered;
    case S::Delivered:
      return S::Completed;
    case S::Pending:
    case S::SearchingForDriver:
    case S::DriverNotificationSent:
    case S::Completed:
    case S::Rejected:
    case S::Cancelled:
      return std::nullopt;
  }
  return std::nullopt;
}

const char* toString(OrderStatus status) {
  for (const auto& [value, name] : kStatusNames) {
    if (value == status) {
      return name;
    }
  }
  return "Unknown";
}

std::optional<OrderStatus> orderStatusFromString(const std::string& text) {
  for (const auto& [value, name] : kStatusNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace courier
