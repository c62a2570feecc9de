#include "courier/domain/driver.hpp"

namespace courier {
namespace domain {

const char* toString(ApprovalStatus status) {
  switch (status) {
    case ApprovalStatus::Pending:  return "Pending";
    case ApprovalStatus::Approved: return "Approved";
    case ApprovalStatus::Rejected: return "Rejected";
  }
  return "Unknown";
}

std::optional<ApprovalStatus> approvalStatusFromString(
    const std::string& text) {
  if (text == "Pending") {
    return ApprovalStatus::Pending;
  }
  if (text == "Approved") {
    return ApprovalStatus::Approved;
  }
  if (text == "Rejected") {
    return ApprovalStatus::Rejected;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace courier
