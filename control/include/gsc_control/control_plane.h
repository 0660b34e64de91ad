#pragma once

#include "gsc/config.h"
#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc_bridge/command_bridge.h"
#include "gsc_control/restart_orchestrator.h"
#include "gsc_platform/process_controller.h"
#include "gsc_rcon/session_manager.h"

#include <memory>
#include <string>
#include <vector>

namespace gsc::control {

// Wires the services for one game server and owns them. The caller owns the
// loop and the bus; the control plane must be destroyed before either.
class ControlPlane {
 public:
  // A null process controller means one is built from the launch settings.
  ControlPlane(EventLoop& loop, EventBus& bus, ControlConfig config,
               std::unique_ptr<platform::ProcessController> process = nullptr,
               rcon::ConnectionFactory factory = nullptr);
  ~ControlPlane();

  ControlPlane(const ControlPlane&) = delete;
  ControlPlane& operator=(const ControlPlane&) = delete;

  // Starts the RCON timers, resolves the bridge directory and kicks off the
  // first connection. The bridge follows the RCON connection.
  bool start(std::string& error);
  void stop();

  // Resolves and configures the bridge directory without starting anything.
  bool configure_bridge(std::string& error);

  rcon::SessionManager& session() { return *session_; }
  bridge::CommandBridge& bridge() { return *bridge_; }
  RestartOrchestrator& restarts() { return *restarts_; }
  platform::ProcessController& process() { return *process_; }
  const ControlConfig& config() const { return config_; }

 private:
  void subscribe_logging();
  void start_bridge();

  EventLoop& loop_;
  EventBus& bus_;
  ControlConfig config_;
  std::unique_ptr<platform::ProcessController> process_;
  std::unique_ptr<rcon::SessionManager> session_;
  std::unique_ptr<bridge::CommandBridge> bridge_;
  std::unique_ptr<RestartOrchestrator> restarts_;
  std::vector<SubscriptionId> subscriptions_;
  bool started_ = false;
};

} // namespace gsc::control
