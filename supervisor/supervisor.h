// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "common/event.h"
#include "common/log.h"
#include "proto/log.pb.h"
#include "supervisor/config.h"
#include "supervisor/health_monitor.h"
#include "supervisor/log_store.h"
#include "supervisor/readiness.h"
#include "supervisor/service_process.h"
#include "supervisor/service_registry.h"
#include "toolbelt/logging.h"
#include "toolbelt/sockets.h"
#include "toolbelt/triggerfd.h"

#include <atomic>
#include <list>
#include <memory>
#include <string>

#include "coroutine.h"

namespace overseer::supervisor {

// Values sent to notification pipe.
constexpr int64_t kReady = 1;
constexpr int64_t kStopped = 2;

// How long startup waits for each service to become healthy before
// launching the services that depend on it.
constexpr std::chrono::seconds kStartupHealthWait = 30s;

class ClientHandler;

// The supervisor.  Launches the configured services, accepts connections
// from services and operators, tracks health and decides when the system
// is ready.  Everything runs as coroutines on one scheduler.
class Supervisor {
public:
  Supervisor(co::CoroutineScheduler &scheduler, SupervisorConfig config,
             toolbelt::InetAddress addr, bool log_to_output,
             std::string log_file_name = "", std::string log_level = "",
             int notify_fd = -1);
  ~Supervisor();

  // Runs until Stop is called and shutdown has finished.
  absl::Status Run();

  // Begins an orderly shutdown: every service is stopped, then the
  // scheduler.  Safe to call from any thread.
  void Stop();

  // Must be called before Run or on the scheduler's thread.
  void AddSystemReadyCallback(ReadinessManager::Callback callback);

  const SupervisorConfig &Config() const { return config_; }
  ServiceRegistry &Registry() { return registry_; }
  HealthMonitor &Monitor() { return monitor_; }
  ReadinessManager &Readiness() { return readiness_; }
  LogStore &Logs() { return log_store_; }

  // Log a message on behalf of the supervisor itself.
  void Log(const std::string &source, toolbelt::LogLevel level,
           const char *fmt, ...);

private:
  friend class ClientHandler;

  absl::Status HandleIncomingConnection(toolbelt::TCPSocket &listen_socket,
                                        co::Coroutine *c);

  void AddCoroutine(std::unique_ptr<co::Coroutine> c) {
    coroutines_.insert(std::move(c));
  }

  void CloseHandler(std::shared_ptr<ClientHandler> handler);
  void ListenerCoroutine(toolbelt::TCPSocket &listen_socket, co::Coroutine *c);
  void LoggerFlushCoroutine(co::Coroutine *c);
  void FlushLogs();
  void SweepCoroutine(co::Coroutine *c);
  void StartupCoroutine(co::Coroutine *c);
  void ShutdownCoroutine(co::Coroutine *c);

  void CreateProcesses();
  bool WaitForHealthy(const std::string &name, std::chrono::seconds timeout,
                      co::Coroutine *c);
  void HandleProcessExit(std::shared_ptr<ServiceProcess> process,
                         const ExitInfo &info);
  void HandleHealthUpdate(const HealthUpdate &update);
  void SendSystemReadyEvent();

  // Sleep that is cut short by shutdown.  Returns false if shutting down.
  bool Sleep(std::chrono::nanoseconds duration, co::Coroutine *c);

  co::CoroutineScheduler &co_scheduler_;
  SupervisorConfig config_;
  toolbelt::InetAddress addr_;
  toolbelt::FileDescriptor notify_fd_;

  // All coroutines are owned by this set.
  absl::flat_hash_set<std::unique_ptr<co::Coroutine>> coroutines_;

  std::list<std::shared_ptr<ClientHandler>> client_handlers_;
  uint32_t next_client_id_ = 0;

  toolbelt::Logger logger_;
  HealthMonitor monitor_;
  ServiceRegistry registry_;
  ReadinessManager readiness_;
  LogStore log_store_;
  std::string log_file_name_;

  // Triggered by Stop.
  toolbelt::TriggerFd shutdown_trigger_;
  // Triggered when shutdown has run out of time.  Cuts short any wait for
  // a process to exit.
  toolbelt::TriggerFd cancel_trigger_;
  std::atomic<bool> shutting_down_ = false;

  // Problems found while constructing, reported by Run.
  absl::Status init_status_;
};

} // namespace overseer::supervisor
