#include "courier/domain/order.hpp"

namespace courier {
namespace domain {

const char* toString(ServiceType type) {
  switch (type) {
    case ServiceType::Food:    return "Food";
    case ServiceType::Parcel:  return "Parcel";
    case ServiceType::Ride:    return "Ride";
    case ServiceType::Unknown: return "Unknown";
  }
  return "Unknown";
}

std::optional<ServiceType> serviceTypeFromString(const std::string& text) {
  if (text == "Food") {
    return ServiceType::Food;
  }
  if (text == "Parcel") {
    return ServiceType::Parcel;
  }
  if (text == "Ride") {
    return ServiceType::Ride;
  }
  return std::nullopt;
}

const char* toString(VehicleType type) {
  switch (type) {
    case VehicleType::Bike:       return "Bike";
    case VehicleType::Motorcycle: return "Motorcycle";
    case VehicleType::Car:        return "Car";
    case VehicleType::Van:        return "Van";
  }
  return "Unknown";
}

std::optional<VehicleType> vehicleTypeFromString(const std::string& text) {
  if (text == "Bike") {
    return VehicleType::Bike;
  }
  if (text == "Motorcycle") {
    return VehicleType::Motorcycle;
  }
  if (text == "Car") {
    return VehicleType::Car;
  }
  if (text == "Van") {
    return VehicleType::Van;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace courier
