// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "common/health.h"
#include "common/service.h"
#include "supervisor/config.h"
#include "supervisor/health_monitor.h"
#include "supervisor/service_process.h"
#include "toolbelt/logging.h"

#include "coroutine.h"

namespace overseer::supervisor {

// How StartService waits for a launched process to call home.
constexpr std::chrono::milliseconds kRegistrationInitialPoll = 1s;
constexpr std::chrono::milliseconds kRegistrationMaxPoll = 5s;

// How long StopAllServices waits for workers to unregister.
constexpr std::chrono::seconds kUnregisterTimeout = 15s;

struct ServiceRecord {
  std::string id;
  ServiceInfo info;
  ServiceCapabilities capabilities;
  ServiceState state = ServiceState::kStarting;
  uint64_t started_at = 0;
  uint64_t last_heartbeat = 0;
  ServiceMetrics metrics;
};

struct Registration {
  std::string service_id;
  ServiceConfiguration initial_config;
  bool existing = false; // The service was already registered.
};

// The set of services that have called home, together with the processes
// the supervisor launched for its configured services.  Health lives in the
// HealthMonitor; the registry seeds it on registration and removes it on
// unregistration.
//
// The registry never calls into the HealthMonitor with its own lock held
// except to read, because monitor listeners may call back into the
// registry.
class ServiceRegistry {
public:
  ServiceRegistry(co::CoroutineScheduler &scheduler, toolbelt::Logger &logger,
                  const SupervisorConfig &config, HealthMonitor &monitor,
                  ServiceProcess::CoroutineAdder add_coroutine);

  // Processes are added once, at startup, one per enabled descriptor.  The
  // registry installs the process's exit hook: when a process exits, any
  // registration under its name is removed and then the exit listener is
  // called.
  void AddProcess(std::shared_ptr<ServiceProcess> process);
  void SetExitListener(ServiceProcess::ExitHook listener) {
    exit_listener_ = std::move(listener);
  }
  std::shared_ptr<ServiceProcess> FindProcess(const std::string &name) const;
  std::vector<std::shared_ptr<ServiceProcess>> Processes() const;

  absl::StatusOr<Registration>
  RegisterService(const ServiceInfo &info,
                  const ServiceCapabilities &capabilities,
                  uint64_t now = NowNs());

  absl::Status UnregisterService(const std::string &service_id,
                                 const std::string &reason = "");

  absl::StatusOr<ServiceStatus>
  GetServiceStatus(const std::string &service_id) const;

  // Both filters must match.  kUnspecified matches every state and an empty
  // pattern matches every name.  The pattern is a shell glob.
  std::vector<ServiceStatus>
  ListServices(ServiceState state_filter,
               const std::string &name_pattern) const;

  absl::Status UpdateHeartbeat(const std::string &service_id,
                               HealthStatus health,
                               const ServiceMetrics &metrics,
                               uint64_t now = NowNs());

  // Launches the named configured service and waits for it to register.
  // A process that doesn't register in time is stopped again and
  // DeadlineExceeded is returned.
  absl::Status StartService(const std::string &name, co::Coroutine *c,
                            std::chrono::seconds timeout = 60s);

  // A zero grace period uses the service's configured one.
  absl::Status StopService(const std::string &service_id, bool force,
                           std::chrono::seconds grace_period,
                           co::Coroutine *c);

  // Stops every process the supervisor owns, each with its configured
  // grace period, and waits for registered workers to go away.
  void StopAllServices(
      co::Coroutine *c,
      std::chrono::seconds unregister_timeout = kUnregisterTimeout);

  // True when every enabled required service is registered, running and
  // operational, and every other enabled service that is registered is
  // too.
  bool AreAllConfiguredServicesHealthy() const;

  // Human readable status for each configured service, in configuration
  // order.
  std::vector<std::pair<std::string, std::string>>
  GetConfiguredServiceStatus() const;

  std::optional<std::string> FindServiceId(const std::string &name) const;
  bool IsRegistered(const std::string &name) const;
  size_t NumServices() const;

private:
  std::string GenerateId() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  ServiceStatus MakeStatus(const ServiceRecord &record) const
      ABSL_SHARED_LOCKS_REQUIRED(mutex_);
  ServiceConfiguration InitialConfig(const std::string &name) const;
  void OnProcessExit(std::shared_ptr<ServiceProcess> process,
                     const ExitInfo &info);

  // Finds the registered record for a service name.
  const ServiceRecord *FindByName(const std::string &name) const
      ABSL_SHARED_LOCKS_REQUIRED(mutex_);

  co::CoroutineScheduler &scheduler_;
  toolbelt::Logger &logger_;
  const SupervisorConfig &config_;
  HealthMonitor &monitor_;
  ServiceProcess::CoroutineAdder add_coroutine_;
  ServiceProcess::ExitHook exit_listener_;

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, ServiceRecord>
      services_ ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<std::string, std::shared_ptr<ServiceProcess>>
      processes_ ABSL_GUARDED_BY(mutex_);
  absl::BitGen bitgen_ ABSL_GUARDED_BY(mutex_);
};

} // namespace overseer::supervisor
