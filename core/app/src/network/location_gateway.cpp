#include "courier/network/location_gateway.hpp"

#include "courier/geo/distance.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace courier {

// -----------------------------------------------------------------------------
// parseLocationUpdate()
// -----------------------------------------------------------------------------
LocationUpdate parseLocationUpdate(const std::string& payload) {
  const auto json = nlohmann::json::parse(payload);

  LocationUpdate update;
  update.driver_id = json.at("driver_id").get<domain::DriverId>();
  update.point.lat = json.at("lat").get<double>();
  update.point.lng = json.at("lng").get<double>();
  update.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();

  if (!geo::isValidCoordinate(update.point)) {
    throw std::invalid_argument("coordinates out of range");
  }
  return update;
}

// -----------------------------------------------------------------------------
// Constructor: subscribe to everything and connect
// -----------------------------------------------------------------------------
LocationGateway::LocationGateway(LocationSink sink, const std::string& endpoint)
    : sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking receive loop
// -----------------------------------------------------------------------------
void LocationGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;  // timeout; re-check running_
    }

    std::string payload = msg.to_string();
    try {
      sink_(parseLocationUpdate(payload));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[LocationGateway] JSON parse error: " << e.what()
                << " payload: " << payload << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[LocationGateway] rejected update: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

void LocationGateway::stop() { running_.store(false); }

}  // namespace courier
