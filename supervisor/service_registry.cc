// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/service_registry.h"

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include <algorithm>
#include <fnmatch.h>

namespace overseer::supervisor {

ServiceRegistry::ServiceRegistry(co::CoroutineScheduler &scheduler,
                                 toolbelt::Logger &logger,
                                 const SupervisorConfig &config,
                                 HealthMonitor &monitor,
                                 ServiceProcess::CoroutineAdder add_coroutine)
    : scheduler_(scheduler), logger_(logger), config_(config),
      monitor_(monitor), add_coroutine_(std::move(add_coroutine)) {}

void ServiceRegistry::AddProcess(std::shared_ptr<ServiceProcess> process) {
  process->SetExitHook(
      [this](std::shared_ptr<ServiceProcess> proc, const ExitInfo &info) {
        OnProcessExit(std::move(proc), info);
      });
  absl::MutexLock lock(&mutex_);
  processes_[process->Name()] = std::move(process);
}

std::shared_ptr<ServiceProcess>
ServiceRegistry::FindProcess(const std::string &name) const {
  absl::ReaderMutexLock lock(&mutex_);
  auto it = processes_.find(name);
  if (it == processes_.end()) {
    return nullptr;
  }
  return it->second;
}

std::vector<std::shared_ptr<ServiceProcess>>
ServiceRegistry::Processes() const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<std::shared_ptr<ServiceProcess>> result;
  result.reserve(processes_.size());
  for (auto & [ name, proc ] : processes_) {
    result.push_back(proc);
  }
  return result;
}

void ServiceRegistry::OnProcessExit(std::shared_ptr<ServiceProcess> process,
                                    const ExitInfo &info) {
  // A worker that is killed never unregisters itself.
  if (std::optional<std::string> id = FindServiceId(process->Name());
      id.has_value()) {
    if (absl::Status status = UnregisterService(*id, "process exited");
        !status.ok()) {
      logger_.Log(toolbelt::LogLevel::kDebug, "%s",
                  status.ToString().c_str());
    }
  }
  if (exit_listener_ != nullptr) {
    exit_listener_(std::move(process), info);
  }
}

std::string ServiceRegistry::GenerateId() {
  // Version 4 (random) UUID.
  uint64_t hi = absl::Uniform<uint64_t>(bitgen_);
  uint64_t lo = absl::Uniform<uint64_t>(bitgen_);
  hi = (hi & ~0xf000ULL) | 0x4000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  return absl::StrFormat("%08x-%04x-%04x-%04x-%012x", hi >> 32,
                         (hi >> 16) & 0xffff, hi & 0xffff, lo >> 48,
                         lo & 0xffffffffffffULL);
}

ServiceConfiguration
ServiceRegistry::InitialConfig(const std::string &name) const {
  ServiceConfiguration result;
  const ServiceDescriptor *desc = config_.FindService(name);
  if (desc == nullptr) {
    return result;
  }
  result.config = desc->config;
  result.config["instance_group.group_id"] = config_.instance_group_id;
  result.config["instance_group.port_offset"] =
      absl::StrFormat("%d", config_.port_offset);
  result.config["keyring.service_name"] = config_.KeyringServiceName(name);
  if (std::string address = config_.ServiceAddress(name); !address.empty()) {
    result.config["service.address"] = address;
  }
  result.environment = desc->environment;
  return result;
}

absl::StatusOr<Registration>
ServiceRegistry::RegisterService(const ServiceInfo &info,
                                 const ServiceCapabilities &capabilities,
                                 uint64_t now) {
  if (info.name.empty()) {
    return absl::InvalidArgumentError("Service name is required");
  }
  Registration reg;
  reg.initial_config = InitialConfig(info.name);
  {
    absl::MutexLock lock(&mutex_);
    for (auto & [ id, record ] : services_) {
      if (record.info.name == info.name &&
          record.info.instance_id == info.instance_id) {
        logger_.Log(toolbelt::LogLevel::kWarning,
                    "Service %s with instance id %s is already registered as "
                    "%s",
                    info.name.c_str(), info.instance_id.c_str(), id.c_str());
        reg.service_id = id;
        reg.existing = true;
        return reg;
      }
    }
    reg.service_id = GenerateId();
    services_.emplace(reg.service_id,
                      ServiceRecord{.id = reg.service_id,
                                    .info = info,
                                    .capabilities = capabilities,
                                    .state = ServiceState::kStarting,
                                    .started_at = now,
                                    .last_heartbeat = now});
  }
  monitor_.AddService(reg.service_id, info.name, now);
  if (config_.FindService(info.name) == nullptr) {
    logger_.Log(toolbelt::LogLevel::kInfo,
                "Registered service %s with id %s (not configured)",
                info.name.c_str(), reg.service_id.c_str());
  } else {
    logger_.Log(toolbelt::LogLevel::kInfo, "Registered service %s with id %s",
                info.name.c_str(), reg.service_id.c_str());
  }
  return reg;
}

absl::Status ServiceRegistry::UnregisterService(const std::string &service_id,
                                                const std::string &reason) {
  std::string name;
  {
    absl::MutexLock lock(&mutex_);
    auto it = services_.find(service_id);
    if (it == services_.end()) {
      return absl::NotFoundError(
          absl::StrFormat("Service %s not found", service_id));
    }
    name = it->second.info.name;
    services_.erase(it);
  }
  monitor_.RemoveService(service_id);
  logger_.Log(toolbelt::LogLevel::kInfo, "Unregistered service %s (id %s)%s",
              name.c_str(), service_id.c_str(),
              reason.empty() ? "" : absl::StrFormat(": %s", reason).c_str());
  return absl::OkStatus();
}

ServiceStatus ServiceRegistry::MakeStatus(const ServiceRecord &record) const {
  ServiceStatus status = {.service_id = record.id,
                          .info = record.info,
                          .capabilities = record.capabilities,
                          .state = record.state,
                          .started_at = record.started_at,
                          .last_heartbeat = record.last_heartbeat,
                          .metrics = record.metrics};
  if (absl::StatusOr<ServiceHealth> health = monitor_.GetHealth(record.id);
      health.ok()) {
    status.health = health->status;
    status.last_healthy = health->last_healthy;
  }
  return status;
}

absl::StatusOr<ServiceStatus>
ServiceRegistry::GetServiceStatus(const std::string &service_id) const {
  absl::ReaderMutexLock lock(&mutex_);
  auto it = services_.find(service_id);
  if (it == services_.end()) {
    return absl::NotFoundError(
        absl::StrFormat("Service %s not found", service_id));
  }
  return MakeStatus(it->second);
}

std::vector<ServiceStatus>
ServiceRegistry::ListServices(ServiceState state_filter,
                              const std::string &name_pattern) const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<ServiceStatus> result;
  for (auto & [ id, record ] : services_) {
    if (state_filter != ServiceState::kUnspecified &&
        record.state != state_filter) {
      continue;
    }
    if (!name_pattern.empty() &&
        fnmatch(name_pattern.c_str(), record.info.name.c_str(), 0) != 0) {
      continue;
    }
    result.push_back(MakeStatus(record));
  }
  std::sort(result.begin(), result.end(),
            [](const ServiceStatus &a, const ServiceStatus &b) {
              return a.info.name < b.info.name;
            });
  return result;
}

absl::Status ServiceRegistry::UpdateHeartbeat(const std::string &service_id,
                                              HealthStatus health,
                                              const ServiceMetrics &metrics,
                                              uint64_t now) {
  {
    absl::MutexLock lock(&mutex_);
    auto it = services_.find(service_id);
    if (it == services_.end()) {
      return absl::NotFoundError(
          absl::StrFormat("Service %s not found", service_id));
    }
    ServiceRecord &record = it->second;
    record.last_heartbeat = now;
    record.metrics = metrics;
    if (health == HealthStatus::kHealthy &&
        record.state == ServiceState::kStarting) {
      record.state = ServiceState::kRunning;
      logger_.Log(toolbelt::LogLevel::kInfo, "Service %s is now running",
                  record.info.name.c_str());
    }
  }
  // Listeners may call back into the registry.
  monitor_.UpdateHealth(service_id, health, now);
  return absl::OkStatus();
}

const ServiceRecord *
ServiceRegistry::FindByName(const std::string &name) const {
  for (auto & [ id, record ] : services_) {
    if (record.info.name == name) {
      return &record;
    }
  }
  return nullptr;
}

std::optional<std::string>
ServiceRegistry::FindServiceId(const std::string &name) const {
  absl::ReaderMutexLock lock(&mutex_);
  const ServiceRecord *record = FindByName(name);
  if (record == nullptr) {
    return std::nullopt;
  }
  return record->id;
}

bool ServiceRegistry::IsRegistered(const std::string &name) const {
  absl::ReaderMutexLock lock(&mutex_);
  return FindByName(name) != nullptr;
}

size_t ServiceRegistry::NumServices() const {
  absl::ReaderMutexLock lock(&mutex_);
  return services_.size();
}

absl::Status ServiceRegistry::StartService(const std::string &name,
                                           co::Coroutine *c,
                                           std::chrono::seconds timeout) {
  std::shared_ptr<ServiceProcess> process = FindProcess(name);
  if (process == nullptr) {
    return absl::NotFoundError(
        absl::StrFormat("No enabled service named %s is configured", name));
  }
  {
    absl::ReaderMutexLock lock(&mutex_);
    if (const ServiceRecord *record = FindByName(name);
        record != nullptr && (record->state == ServiceState::kRunning ||
                              record->state == ServiceState::kStarting)) {
      return absl::FailedPreconditionError(
          absl::StrFormat("Service %s is already running or starting", name));
    }
  }
  if (absl::Status status = process->Start(c); !status.ok()) {
    return status;
  }

  // Wait for the worker to call home.
  std::chrono::milliseconds interval = kRegistrationInitialPoll;
  std::chrono::milliseconds waited(0);
  while (waited < timeout) {
    c->Millisleep(interval.count());
    waited += interval;
    if (IsRegistered(name)) {
      logger_.Log(toolbelt::LogLevel::kInfo,
                  "Service %s started and registered", name.c_str());
      return absl::OkStatus();
    }
    if (!process->IsRunning()) {
      return absl::InternalError(
          absl::StrFormat("Service %s exited before registering", name));
    }
    interval = std::min(
        std::chrono::duration_cast<std::chrono::milliseconds>(interval * 1.5),
        kRegistrationMaxPoll);
  }

  logger_.Log(toolbelt::LogLevel::kError,
              "Service %s did not register within %d seconds, stopping it",
              name.c_str(), int(timeout.count()));
  if (absl::Status status = process->Stop(c); !status.ok()) {
    logger_.Log(toolbelt::LogLevel::kError, "%s", status.ToString().c_str());
  }
  return absl::DeadlineExceededError(absl::StrFormat(
      "Service %s failed to register within %d seconds", name,
      timeout.count()));
}

absl::Status ServiceRegistry::StopService(const std::string &service_id,
                                          bool force,
                                          std::chrono::seconds grace_period,
                                          co::Coroutine *c) {
  std::string name;
  {
    absl::ReaderMutexLock lock(&mutex_);
    auto it = services_.find(service_id);
    if (it == services_.end()) {
      return absl::NotFoundError(
          absl::StrFormat("Service %s not found", service_id));
    }
    name = it->second.info.name;
  }
  std::shared_ptr<ServiceProcess> process = FindProcess(name);
  if (process == nullptr || !process->IsRunning()) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Service %s has no process owned by the supervisor", name));
  }
  {
    absl::MutexLock lock(&mutex_);
    if (auto it = services_.find(service_id); it != services_.end()) {
      it->second.state = ServiceState::kStopping;
    }
  }
  logger_.Log(toolbelt::LogLevel::kInfo, "Stopping service %s%s", name.c_str(),
              force ? " (forced)" : "");
  return process->Stop(c, force, grace_period);
}

void ServiceRegistry::StopAllServices(co::Coroutine *c,
                                      std::chrono::seconds unregister_timeout) {
  std::vector<std::shared_ptr<ServiceProcess>> running;
  for (auto &proc : Processes()) {
    if (proc->IsRunning()) {
      running.push_back(proc);
    }
  }
  {
    absl::MutexLock lock(&mutex_);
    for (auto & [ id, record ] : services_) {
      record.state = ServiceState::kStopping;
    }
  }

  if (!running.empty()) {
    logger_.Log(toolbelt::LogLevel::kInfo, "Stopping %d services",
                int(running.size()));
    // Stop them all at once, each on its own coroutine.
    auto pending = std::make_shared<int>(int(running.size()));
    for (auto &proc : running) {
      add_coroutine_(std::make_unique<co::Coroutine>(
          scheduler_,
          [this, proc, pending](co::Coroutine *c2) {
            if (absl::Status status = proc->Stop(c2); !status.ok()) {
              logger_.Log(toolbelt::LogLevel::kError, "Failed to stop %s: %s",
                          proc->Name().c_str(), status.ToString().c_str());
            }
            (*pending)--;
          },
          absl::StrFormat("Stop.%s", proc->Name())));
    }
    while (*pending > 0) {
      c->Millisleep(100);
    }
  }

  // Workers we didn't launch unregister themselves when they stop.
  std::chrono::milliseconds waited(0);
  constexpr std::chrono::milliseconds kPoll = 500ms;
  while (NumServices() > 0) {
    if (waited >= unregister_timeout) {
      std::vector<std::string> names;
      {
        absl::ReaderMutexLock lock(&mutex_);
        for (auto & [ id, record ] : services_) {
          names.push_back(record.info.name);
        }
      }
      logger_.Log(toolbelt::LogLevel::kWarning,
                  "Timed out waiting for services to unregister, %d still "
                  "registered: %s",
                  int(names.size()), absl::StrJoin(names, ", ").c_str());
      return;
    }
    c->Millisleep(kPoll.count());
    waited += kPoll;
  }
  logger_.Log(toolbelt::LogLevel::kInfo, "All services have unregistered");
}

bool ServiceRegistry::AreAllConfiguredServicesHealthy() const {
  absl::ReaderMutexLock lock(&mutex_);
  for (auto &desc : config_.services) {
    if (!desc.enabled) {
      continue;
    }
    const ServiceRecord *record = FindByName(desc.name);
    if (record == nullptr) {
      if (desc.required) {
        return false;
      }
      continue;
    }
    absl::StatusOr<ServiceHealth> health = monitor_.GetHealth(record->id);
    bool operational = health.ok() && IsOperational(health->status) &&
                       record->state == ServiceState::kRunning;
    if (!operational) {
      return false;
    }
  }
  return true;
}

std::vector<std::pair<std::string, std::string>>
ServiceRegistry::GetConfiguredServiceStatus() const {
  absl::ReaderMutexLock lock(&mutex_);
  std::vector<std::pair<std::string, std::string>> result;
  for (auto &desc : config_.services) {
    if (!desc.enabled) {
      result.emplace_back(desc.name, "disabled");
      continue;
    }
    const ServiceRecord *record = FindByName(desc.name);
    if (record == nullptr) {
      result.emplace_back(desc.name, desc.required ? "not started (required)"
                                                   : "not started (optional)");
      continue;
    }
    absl::StatusOr<ServiceHealth> health = monitor_.GetHealth(record->id);
    HealthStatus status = health.ok() ? health->status : HealthStatus::kUnknown;
    if (IsOperational(status) && record->state == ServiceState::kRunning) {
      result.emplace_back(desc.name, status == HealthStatus::kHealthy
                                         ? "healthy"
                                         : "degraded but operational");
    } else {
      result.emplace_back(
          desc.name,
          absl::StrFormat("unhealthy (state: %s, health: %s)",
                          ServiceStateName(record->state),
                          HealthStatusName(status)));
    }
  }
  return result;
}

} // namespace overseer::supervisor
