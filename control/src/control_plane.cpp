#include "gsc_control/control_plane.h"

#include "gsc/events.h"
#include "gsc/log.h"
#include "gsc_bridge/bridge_locator.h"

#include <chrono>

namespace gsc::control {

namespace {
rcon::Endpoint endpoint_from(const ServerConfig& server) {
  rcon::Endpoint endpoint;
  endpoint.host = server.host;
  endpoint.port = server.rcon_port;
  endpoint.password = server.rcon_password;
  return endpoint;
}

std::string optional_text(const std::optional<std::string>& value) {
  return value ? *value : std::string("?");
}
} // namespace

ControlPlane::ControlPlane(EventLoop& loop, EventBus& bus, ControlConfig config,
                           std::unique_ptr<platform::ProcessController> process,
                           rcon::ConnectionFactory factory)
    : loop_(loop), bus_(bus), config_(std::move(config)), process_(std::move(process)) {
  if (!process_) {
    platform::LaunchSpec spec;
    spec.command = config_.server.launch_command;
    spec.cwd = config_.server.launch_cwd;
    spec.match = config_.server.process_match;
    process_ = std::make_unique<platform::PosixProcessController>(std::move(spec));
  }
  if (!factory) {
    EventLoop* loop_ptr = &loop_;
    const auto quiet = std::chrono::milliseconds(config_.rcon.multi_packet_quiet_ms);
    factory = [loop_ptr, quiet]() -> std::shared_ptr<rcon::RconConnection> {
      return std::make_shared<rcon::TcpRconConnection>(*loop_ptr, quiet);
    };
  }

  session_ = std::make_unique<rcon::SessionManager>(loop_, bus_, std::move(factory),
                                                    endpoint_from(config_.server), config_.rcon);
  session_->set_process_controller(process_.get());
  bridge_ = std::make_unique<bridge::CommandBridge>(loop_, bus_, config_.bridge);
  restarts_ = std::make_unique<RestartOrchestrator>(loop_, bus_, *session_, *process_, config_.restart);
}

ControlPlane::~ControlPlane() {
  stop();
}

bool ControlPlane::start(std::string& error) {
  if (started_) {
    return true;
  }
  if (!configure_bridge(error)) {
    return false;
  }
  subscribe_logging();
  subscriptions_.push_back(bus_.subscribe<RconConnected>([this](const RconConnected&) { start_bridge(); }));

  session_->start();
  started_ = true;
  log::info("control plane started for server '" + config_.server.name + "'");

  session_->connect().then([this](const Outcome<bool>& outcome) {
    if (outcome.ok() && *outcome.value) {
      return;
    }
    // The bridge works without RCON; the mod still reads commands.json.
    if (outcome.ok()) {
      log::info("server is not running; RCON will connect once it is up");
    } else {
      log::warn("initial RCON connection failed: " + user_message(outcome.error));
    }
    start_bridge();
  });
  return true;
}

void ControlPlane::stop() {
  if (!started_) {
    return;
  }
  started_ = false;
  for (const auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
  subscriptions_.clear();
  if (restarts_->busy()) {
    restarts_->cancel_restart();
  }
  bridge_->stop();
  session_->stop();
  log::info("control plane stopped");
}

bool ControlPlane::configure_bridge(std::string& error) {
  if (!config_.server.bridge_path.empty()) {
    return bridge_->configure(config_.server.bridge_path, true, error);
  }
  if (config_.server.data_path.empty() && config_.server.install_path.empty()) {
    error = "no bridge_path, data_path or install_path configured";
    return false;
  }
  const auto location = bridge::locate_bridge_dir(config_.server.name, config_.server.data_path,
                                                  config_.server.install_path);
  if (location.path.empty()) {
    error = "could not determine bridge directory";
    return false;
  }
  if (!location.exists) {
    log::info("bridge directory does not exist yet, creating " + location.path.string());
  }
  return bridge_->configure(location.path, true, error);
}

void ControlPlane::start_bridge() {
  if (!started_ || bridge_->running()) {
    return;
  }
  std::string error;
  if (!bridge_->start(error)) {
    log::error("bridge start failed: " + error);
  }
}

void ControlPlane::subscribe_logging() {
  subscriptions_.push_back(bus_.subscribe<RconDisconnected>([](const RconDisconnected& ev) {
    log::debug("event: rcon disconnected (" + ev.reason + ")");
  }));
  subscriptions_.push_back(bus_.subscribe<ModStatusChanged>([](const ModStatusChanged& ev) {
    if (ev.alive) {
      log::info("mod status: connected (version " + optional_text(ev.version) + ", server " +
                optional_text(ev.server_name) + ", " +
                (ev.player_count ? std::to_string(*ev.player_count) : std::string("?")) + " players)");
    } else {
      log::info("mod status: disconnected");
    }
  }));
  subscriptions_.push_back(bus_.subscribe<BridgeResultReceived>([](const BridgeResultReceived& ev) {
    log::debug("bridge result " + ev.id + (ev.success ? " ok" : " failed: " + ev.error));
  }));
  subscriptions_.push_back(bus_.subscribe<RestartPhaseChanged>([](const RestartPhaseChanged& ev) {
    log::debug("event: restart phase " + ev.phase);
  }));
}

} // namespace gsc::control
