#include "courier/network/location_feed_thread.hpp"

#include <iostream>
#include <utility>

namespace courier {

LocationFeedThread::LocationFeedThread(LocationGateway::LocationSink sink,
                                       std::string endpoint)
    : sink_(std::move(sink)), endpoint_(std::move(endpoint)) {}

LocationFeedThread::~LocationFeedThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): gateway is built here so a stopped feed can be restarted
// -----------------------------------------------------------------------------
void LocationFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<LocationGateway>(sink_, endpoint_);

  thread_ = std::thread([this] {
    std::cout << "[LocationFeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[LocationFeedThread] recv loop exited.\n";
  });
}

void LocationFeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace courier
