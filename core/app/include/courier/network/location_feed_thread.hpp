#pragma once

#include "courier/network/location_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace courier {

// -----------------------------------------------------------------------------
// LocationFeedThread
// -----------------------------------------------------------------------------
// Owns the thread that runs LocationGateway::run(). The gateway (and its ZMQ
// socket) is created in start() and destroyed in stop(), so each run gets a
// fresh connection. The sink is invoked on the feed thread.
// -----------------------------------------------------------------------------
class LocationFeedThread {
 public:
  LocationFeedThread(LocationGateway::LocationSink sink, std::string endpoint);

  ~LocationFeedThread();

  LocationFeedThread(const LocationFeedThread&) = delete;
  LocationFeedThread& operator=(const LocationFeedThread&) = delete;
  LocationFeedThread(LocationFeedThread&&) = delete;
  LocationFeedThread& operator=(LocationFeedThread&&) = delete;

  void start();
  void stop();

 private:
  LocationGateway::LocationSink sink_;
  std::string endpoint_;

  std::unique_ptr<LocationGateway> gateway_;
  std::thread thread_;
};

}  // namespace courier
