#pragma once

#include "courier/domain/geo_point.hpp"
#include "courier/domain/order.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace courier {

// One position report from a driver's device.
struct LocationUpdate {
  domain::DriverId driver_id{};
  domain::GeoPoint point;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// parseLocationUpdate(payload)
// -----------------------------------------------------------------------------
// Decodes {"driver_id": 7, "lat": 52.52, "lng": 13.40, "timestamp_ms": ...}.
// Throws nlohmann::json::exception for malformed JSON or missing/mistyped
// fields, and std::invalid_argument for coordinates outside WGS84 range.
// -----------------------------------------------------------------------------
LocationUpdate parseLocationUpdate(const std::string& payload);

// -----------------------------------------------------------------------------
// LocationGateway: ZeroMQ SUB socket for the driver location feed
// -----------------------------------------------------------------------------
//
// @brief  Receives location reports published by the mobile API tier and
//         forwards each decoded report to a sink.
//
// @details
// run() blocks in a receive loop until stop() is called. ZMQ_RCVTIMEO makes
// recv() return periodically so the loop can observe the stop flag.
// Malformed messages are logged to stderr and skipped; the feed never stops
// on bad input.
//
// Thread model:
//   Constructed and run() on the LocationFeedThread. stop() may be called
//   from any thread. The socket is touched only by the run() thread.
// -----------------------------------------------------------------------------
class LocationGateway {
 public:
  using LocationSink = std::function<void(const LocationUpdate&)>;

  LocationGateway(LocationSink sink, const std::string& endpoint);

  ~LocationGateway() = default;

  LocationGateway(const LocationGateway&) = delete;
  LocationGateway& operator=(const LocationGateway&) = delete;
  LocationGateway(LocationGateway&&) = delete;
  LocationGateway& operator=(LocationGateway&&) = delete;

  void run();
  void stop();

 private:
  static constexpr int kRecvTimeoutMs = 100;

  LocationSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // Starts true so a stop() issued before run() is not lost.
  std::atomic<bool> running_{true};
};

}  // namespace courier
