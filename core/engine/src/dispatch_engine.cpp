#include "courier/engine/dispatch_engine.hpp"

#include "courier/geo/distance.hpp"
#include "courier/network/telemetry_format.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace courier {

using json = nlohmann::json;

namespace {

// Malformed request, unknown command or unknown enum value.
class BadRequest : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

json okReply() { return json{{"status", "ok"}}; }

json errorReply(const std::string& kind, const std::string& detail) {
  return json{{"status", "error"}, {"error", kind}, {"detail", detail}};
}

json resultReply(const domain::DispatchResult& result) {
  if (!result.ok()) {
    return errorReply(domain::toString(*result.error), result.detail);
  }
  json reply = okReply();
  reply["detail"] = result.detail;
  return reply;
}

template <typename T>
T require(const json& j, const char* key) {
  if (!j.contains(key)) {
    throw BadRequest(std::string("missing field: ") + key);
  }
  return j.at(key).get<T>();
}

domain::GeoPoint pointFromJson(const json& j) {
  domain::GeoPoint point{require<double>(j, "lat"), require<double>(j, "lng")};
  if (!geo::isValidCoordinate(point)) {
    throw BadRequest("coordinates out of range");
  }
  return point;
}

domain::VehicleType vehicleFromJson(const json& j, const char* key) {
  auto vehicle = domain::vehicleTypeFromString(require<std::string>(j, key));
  if (!vehicle) {
    throw BadRequest(std::string("unknown vehicle type in ") + key);
  }
  return *vehicle;
}

// -----------------------------------------------------------------------------
// orderFromJson(): REGISTER_ORDER payload
// -----------------------------------------------------------------------------
domain::Order orderFromJson(const json& j) {
  domain::Order order;
  order.id = require<domain::OrderId>(j, "order_id");
  order.customer_id = require<domain::UserId>(j, "customer_id");

  auto type = domain::serviceTypeFromString(
      require<std::string>(j, "service_type"));
  if (!type) {
    throw BadRequest("unknown service_type");
  }
  order.service_type = *type;

  order.pickup = pointFromJson(require<json>(j, "pickup"));
  order.dropoff = pointFromJson(require<json>(j, "dropoff"));
  if (j.contains("requested_vehicle_type") &&
      !j.at("requested_vehicle_type").is_null()) {
    order.requested_vehicle_type = vehicleFromJson(j, "requested_vehicle_type");
  }
  if (j.contains("status")) {
    auto status =
        domain::orderStatusFromString(require<std::string>(j, "status"));
    if (!status) {
      throw BadRequest("unknown status");
    }
    order.status = *status;
  }
  order.created_at_ms = j.value("created_at_ms", std::int64_t{0});
  return order;
}

// -----------------------------------------------------------------------------
// driverFromJson(): UPSERT_DRIVER payload
// -----------------------------------------------------------------------------
domain::DriverProfile driverFromJson(const json& j) {
  domain::DriverProfile driver;
  driver.id = require<domain::DriverId>(j, "driver_id");

  auto approval =
      domain::approvalStatusFromString(j.value("approval", "Pending"));
  if (!approval) {
    throw BadRequest("unknown approval status");
  }
  driver.approval = *approval;

  if (j.contains("vehicle_type")) {
    driver.vehicle_type = vehicleFromJson(j, "vehicle_type");
  }
  driver.accepts_food = j.value("accepts_food", false);
  driver.accepts_parcel = j.value("accepts_parcel", false);
  driver.accepts_ride = j.value("accepts_ride", false);
  driver.is_online = j.value("is_online", false);
  return driver;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: passive components only; no threads yet
// -----------------------------------------------------------------------------
DispatchEngine::DispatchEngine(const ITimeProvider& clock, EngineConfig config)
    : clock_(clock),
      config_(std::move(config)),
      telemetry_loop_("Telemetry"),
      scheduler_(config_.worker_threads),
      selector_(registry_, clock_, config_.dispatch),
      expiry_worker_(store_, clock_, telemetry_loop_.sink()),
      notifier_(telemetry_loop_.sink()),
      loop_(store_, selector_, expiry_worker_, scheduler_, notifier_, clock_,
            config_.dispatch, telemetry_loop_.sink()),
      responses_(store_, registry_, clock_, telemetry_loop_.sink()) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
DispatchEngine::~DispatchEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void DispatchEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Telemetry loop ---------------------------------------------------
  telemetry_loop_.start();

  // ---  2) IPC server, bridged to the telemetry bus -------------------------
  if (!config_.command_endpoint.empty() ||
      !config_.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.command_endpoint, config_.telemetry_endpoint);
    ipc_server_->start();

    ipc_bridge_ = telemetry_loop_.eventBus().subscribe(
        [this](const Event& event) { ipc_server_->pushTelemetry(event); },
        "ipc");
  }

  // ---  3) Driver location feed ---------------------------------------------
  if (!config_.location_endpoint.empty()) {
    location_feed_ = std::make_unique<LocationFeedThread>(
        [this](const LocationUpdate& update) { onLocationUpdate(update); },
        config_.location_endpoint);
    location_feed_->start();
  }

  // ---  4) Scheduler: Dispatch Loop ticks begin ----------------------------
  scheduler_.scheduleEvery(std::chrono::milliseconds(config_.loop_interval_ms),
                           [this] { loop_.runOnce(); });
  scheduler_.start();

  running_ = true;

  std::cout << "[DispatchEngine] started. Loop every "
            << config_.loop_interval_ms << " ms on "
            << config_.worker_threads << " worker(s)"
            << (location_feed_ ? ", location feed" : "")
            << (ipc_server_ ? ", IPC" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void DispatchEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No more loop ticks or expiry firings -----------------------------
  scheduler_.stop();

  // ---  2) No more location updates -----------------------------------------
  location_feed_.reset();

  // ---  3) Drain telemetry into the IPC server, then stop IPC ---------------
  telemetry_loop_.stop();
  if (ipc_bridge_) {
    telemetry_loop_.eventBus().unsubscribe(*ipc_bridge_);
    ipc_bridge_.reset();
  }
  ipc_server_.reset();

  running_ = false;

  std::cout << "[DispatchEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// registerOrder()
// -----------------------------------------------------------------------------
domain::DispatchResult DispatchEngine::registerOrder(domain::Order order) {
  const std::int64_t now = clock_.now_ms();
  if (order.status == domain::OrderStatus::Pending) {
    order.status = domain::OrderStatus::SearchingForDriver;
  }
  if (order.created_at_ms == 0) {
    order.created_at_ms = now;
  }

  if (!store_.insertOrder(order, now)) {
    return domain::DispatchResult::failure(domain::DispatchError::Conflict,
                                           "order already registered");
  }

  std::cout << "[DispatchEngine] order " << order.id << " registered ("
            << domain::toString(order.service_type) << ", "
            << domain::toString(order.status) << ")\n";
  return domain::DispatchResult::success("order registered");
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string DispatchEngine::executeCommand(const std::string& request) {
  json reply;

  try {
    const json req = (!request.empty() && request.front() == '{')
                         ? json::parse(request)
                         : json{{"cmd", request}};
    const std::string cmd = require<std::string>(req, "cmd");

    if (cmd == "PING") {
      reply = okReply();
      reply["response"] = "PONG";
    } else if (cmd == "STATUS") {
      reply = okReply();
      reply["running"] = running_;
      json orders = json::object();
      for (const auto& [status, count] : store_.countByStatus()) {
        orders[domain::toString(status)] = count;
      }
      reply["orders"] = std::move(orders);
      reply["drivers"] = registry_.size();
      const auto& d = config_.dispatch;
      reply["config"] = {
          {"suggestion_limit", d.suggestion_limit},
          {"acceptance_window_seconds", d.acceptance_window_seconds},
          {"max_cycles", d.max_cycles},
          {"retry_delay_seconds", d.retry_delay_seconds},
          {"location_staleness_seconds", d.location_staleness_seconds},
          {"loop_interval_ms", config_.loop_interval_ms}};
    } else if (cmd == "ACCEPT") {
      reply = resultReply(
          responses_.acceptOrder(require<domain::OrderId>(req, "order_id"),
                                 require<domain::DriverId>(req, "driver_id")));
    } else if (cmd == "REJECT") {
      reply = resultReply(
          responses_.rejectOrder(require<domain::OrderId>(req, "order_id"),
                                 require<domain::DriverId>(req, "driver_id")));
    } else if (cmd == "UPDATE_STATUS") {
      auto status =
          domain::orderStatusFromString(require<std::string>(req, "status"));
      if (!status) {
        throw BadRequest("unknown status");
      }
      reply = resultReply(responses_.updateOrderStatus(
          require<domain::OrderId>(req, "order_id"),
          require<domain::DriverId>(req, "driver_id"), *status));
    } else if (cmd == "SUGGESTED") {
      json orders = json::array();
      for (const auto& entry : responses_.listSuggestedOrders(
               require<domain::DriverId>(req, "driver_id"))) {
        orders.push_back({{"order", wire::orderToJson(entry.order)},
                          {"suggestion",
                           wire::suggestionToJson(entry.suggestion)}});
      }
      reply = okReply();
      reply["orders"] = std::move(orders);
    } else if (cmd == "REGISTER_ORDER") {
      reply = resultReply(registerOrder(orderFromJson(req)));
    } else if (cmd == "UPSERT_DRIVER") {
      const domain::DriverProfile driver = driverFromJson(req);
      registry_.upsertProfile(driver);
      reply = okReply();
      reply["driver"] = wire::driverToJson(*registry_.profile(driver.id));
    } else if (cmd == "DRIVER_LOCATION") {
      LocationUpdate update;
      update.driver_id = require<domain::DriverId>(req, "driver_id");
      update.point = pointFromJson(req);
      const std::int64_t now = clock_.now_ms();
      update.timestamp_ms = req.value("timestamp_ms", now);
      if (!registry_.profile(update.driver_id)) {
        reply = errorReply("NotFound", "unknown driver");
      } else {
        reply = okReply();
        reply["applied"] = registry_.updateLocation(
            update.driver_id, update.point, update.timestamp_ms, now);
      }
    } else if (cmd == "DRIVER_ONLINE") {
      if (registry_.setOnline(require<domain::DriverId>(req, "driver_id"),
                              require<bool>(req, "online"))) {
        reply = okReply();
      } else {
        reply = errorReply("NotFound", "unknown driver");
      }
    } else if (cmd == "DISPATCH_STATE") {
      auto snap = store_.snapshot(require<domain::OrderId>(req, "order_id"));
      if (!snap) {
        reply = errorReply("NotFound", "order not found");
      } else {
        reply = okReply();
        reply["order"] = wire::orderToJson(snap->order);
        reply["dispatch_state"] =
            snap->dispatch_state
                ? wire::dispatchStateToJson(*snap->dispatch_state)
                : json(nullptr);
        json suggestions = json::array();
        for (const auto& s : snap->suggestions) {
          suggestions.push_back(wire::suggestionToJson(s));
        }
        reply["suggestions"] = std::move(suggestions);
        json history = json::array();
        for (const auto& h : snap->history) {
          history.push_back(wire::historyEntryToJson(h));
        }
        reply["history"] = std::move(history);
      }
    } else {
      throw BadRequest("unknown command: " + cmd);
    }
  } catch (const BadRequest& e) {
    reply = errorReply("BadRequest", e.what());
  } catch (const json::exception& e) {
    reply = errorReply("BadRequest", e.what());
  } catch (const std::exception& e) {
    std::cerr << "[DispatchEngine] command failed: " << e.what() << "\n";
    reply = errorReply("Internal", e.what());
  }

  return reply.dump();
}

// -----------------------------------------------------------------------------
// onLocationUpdate(): location feed sink, runs on the feed thread
// -----------------------------------------------------------------------------
void DispatchEngine::onLocationUpdate(const LocationUpdate& update) {
  if (!registry_.updateLocation(update.driver_id, update.point,
                                update.timestamp_ms, clock_.now_ms()) &&
      !registry_.profile(update.driver_id)) {
    std::cerr << "[DispatchEngine] location for unknown driver "
              << update.driver_id << " ignored\n";
  }
}

}  // namespace courier
