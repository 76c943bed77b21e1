// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/supervisor.h"
#include "supervisor/client_handler.h"

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include <cstdarg>
#include <cstdio>
#include <poll.h>
#include <unistd.h>

namespace overseer::supervisor {

Supervisor::Supervisor(co::CoroutineScheduler &scheduler,
                       SupervisorConfig config, toolbelt::InetAddress addr,
                       bool log_to_output, std::string log_file_name,
                       std::string log_level, int notify_fd)
    : co_scheduler_(scheduler), config_(std::move(config)),
      addr_(std::move(addr)), notify_fd_(notify_fd),
      logger_("overseer", log_to_output),
      monitor_(logger_, config_.heartbeat_timeout),
      registry_(scheduler, logger_, config_, monitor_,
                [this](std::unique_ptr<co::Coroutine> c) {
                  AddCoroutine(std::move(c));
                }),
      readiness_(
          logger_,
          [this]() { return registry_.AreAllConfiguredServicesHealthy(); },
          [this]() { return registry_.GetConfiguredServiceStatus(); },
          [this](ReadinessManager::Callback callback) {
            AddCoroutine(std::make_unique<co::Coroutine>(
                co_scheduler_,
                [callback = std::move(callback)](co::Coroutine *) {
                  callback();
                },
                "SystemReadyCallback"));
          }),
      log_store_(logger_, size_t(config_.log_retention)) {
  logger_.SetLogLevel(log_level.empty() ? config_.log_level : log_level);

  if (log_file_name.empty()) {
    log_file_name = config_.log_file;
  }
  if (absl::Status status = log_store_.OpenFile(log_file_name); !status.ok()) {
    // Carry on without a log file.
    logger_.Log(toolbelt::LogLevel::kError, "%s", status.ToString().c_str());
  }

  if (absl::Status status = shutdown_trigger_.Open(); !status.ok()) {
    init_status_ = absl::InternalError(absl::StrFormat(
        "Failed to open shutdown trigger: %s", status.ToString()));
  }
  if (absl::Status status = cancel_trigger_.Open(); !status.ok()) {
    init_status_ = absl::InternalError(absl::StrFormat(
        "Failed to open cancel trigger: %s", status.ToString()));
  }
}

Supervisor::~Supervisor() {
  // Clear this before other data members get destroyed.
  client_handlers_.clear();
}

void Supervisor::Stop() {
  shutting_down_ = true;
  shutdown_trigger_.Trigger();
}

void Supervisor::AddSystemReadyCallback(ReadinessManager::Callback callback) {
  readiness_.AddSystemReadyCallback(std::move(callback));
}

void Supervisor::CloseHandler(std::shared_ptr<ClientHandler> handler) {
  for (auto it = client_handlers_.begin(); it != client_handlers_.end(); it++) {
    if (*it == handler) {
      client_handlers_.erase(it);
      break;
    }
  }
}

absl::Status
Supervisor::HandleIncomingConnection(toolbelt::TCPSocket &listen_socket,
                                     co::Coroutine *c) {
  absl::StatusOr<toolbelt::TCPSocket> s = listen_socket.Accept(c);
  if (!s.ok()) {
    return s.status();
  }

  if (absl::Status status = s->SetCloseOnExec(); !status.ok()) {
    return status;
  }

  uint32_t client_id = next_client_id_++;
  std::shared_ptr<ClientHandler> handler =
      std::make_shared<ClientHandler>(*this, std::move(*s), client_id);
  client_handlers_.push_back(handler);

  coroutines_.insert(std::make_unique<co::Coroutine>(
      co_scheduler_,
      [this, handler](co::Coroutine *c) {
        handler->Run(c);
        logger_.Log(toolbelt::LogLevel::kDebug, "client %s closed",
                    handler->GetClientName().c_str());
        handler->Shutdown();
        CloseHandler(handler);
      },
      absl::StrFormat("Client handler %d", client_id)));

  return absl::OkStatus();
}

// This coroutine listens for incoming client connections on the given
// socket and spawns a handler coroutine to handle the communication with
// the client.
void Supervisor::ListenerCoroutine(toolbelt::TCPSocket &listen_socket,
                                   co::Coroutine *c) {
  for (;;) {
    absl::Status status = HandleIncomingConnection(listen_socket, c);
    if (!status.ok()) {
      logger_.Log(toolbelt::LogLevel::kError,
                  "Unable to make incoming connection: %s",
                  status.ToString().c_str());
    }
  }
}

void Supervisor::Log(const std::string &source, toolbelt::LogLevel level,
                     const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  char buffer[256];
  vsnprintf(buffer, sizeof(buffer), fmt, ap);
  va_end(ap);
  log_store_.Add(LogMessage{
      .source = source, .level = level, .text = buffer, .timestamp = NowNs()});
}

void Supervisor::FlushLogs() {
  std::vector<std::shared_ptr<proto::LogMessage>> msgs = log_store_.Flush();
  if (msgs.empty()) {
    return;
  }

  // If no client wants log events, log it to the local logger.
  bool client_wants_events = false;
  for (auto &handler : client_handlers_) {
    if (handler->WantsEvents(kLogMessageEvents) &&
        handler->EventChannelOpen()) {
      client_wants_events = true;
      break;
    }
  }

  for (auto &msg : msgs) {
    if (!client_wants_events) {
      logger_.Log(LogLevelFromProto(msg->level()), msg->timestamp(),
                  msg->source(), msg->text());
      continue;
    }
    // Send as log events to the clients.
    for (auto &handler : client_handlers_) {
      if (absl::Status status = handler->SendLogEvent(msg); !status.ok()) {
        logger_.Log(toolbelt::LogLevel::kDebug, "Failed to send log event: %s",
                    status.ToString().c_str());
      }
    }
  }
}

void Supervisor::LoggerFlushCoroutine(co::Coroutine *c) {
  for (;;) {
    c->Millisleep(500); // Flush the log buffer every 500ms.
    FlushLogs();
  }
}

bool Supervisor::Sleep(std::chrono::nanoseconds duration, co::Coroutine *c) {
  // Two coroutines can't wait for the same fd.
  toolbelt::FileDescriptor shutdown(dup(shutdown_trigger_.GetPollFd().Fd()));
  int fd = c->Wait(shutdown.Fd(), POLLIN, duration.count());
  return fd != shutdown.Fd();
}

void Supervisor::SweepCoroutine(co::Coroutine *c) {
  while (Sleep(config_.health_check_interval, c)) {
    int n = monitor_.Sweep();
    if (n > 0) {
      logger_.Log(toolbelt::LogLevel::kDebug,
                  "Health sweep marked %d services unhealthy", n);
    }
  }
}

void Supervisor::CreateProcesses() {
  ProcessEnvironment env = ProcessEnvironment::FromConfig(config_);
  for (auto &desc : config_.services) {
    if (!desc.enabled) {
      continue;
    }
    auto process = std::make_shared<ServiceProcess>(
        co_scheduler_, logger_, desc, env,
        [this](std::unique_ptr<co::Coroutine> c) {
          AddCoroutine(std::move(c));
        });
    process->SetCancelFd(cancel_trigger_.GetPollFd().Fd());
    registry_.AddProcess(std::move(process));
  }
}

bool Supervisor::WaitForHealthy(const std::string &name,
                                std::chrono::seconds timeout,
                                co::Coroutine *c) {
  for (std::chrono::seconds waited(0); waited < timeout; waited += 1s) {
    if (std::optional<std::string> id = registry_.FindServiceId(name);
        id.has_value()) {
      absl::StatusOr<ServiceHealth> health = monitor_.GetHealth(*id);
      if (health.ok() && health->status == HealthStatus::kHealthy) {
        return true;
      }
    }
    if (!Sleep(1s, c)) {
      return false;
    }
  }
  return false;
}

void Supervisor::StartupCoroutine(co::Coroutine *c) {
  std::vector<std::string> order = config_.StartupOrder(logger_);
  logger_.Log(toolbelt::LogLevel::kInfo, "Service startup order: %s",
              absl::StrJoin(order, ", ").c_str());

  for (auto &name : order) {
    if (shutting_down_) {
      return;
    }
    const ServiceDescriptor *desc = config_.FindService(name);
    if (desc == nullptr) {
      continue;
    }
    logger_.Log(toolbelt::LogLevel::kInfo, "Starting service %s",
                name.c_str());
    if (absl::Status status =
            registry_.StartService(name, c, config_.registration_timeout);
        !status.ok()) {
      if (desc->required) {
        logger_.Log(toolbelt::LogLevel::kError,
                    "Required service %s failed to start: %s; not starting "
                    "the remaining services",
                    name.c_str(), status.ToString().c_str());
        return;
      }
      logger_.Log(toolbelt::LogLevel::kError, "Failed to start %s: %s",
                  name.c_str(), status.ToString().c_str());
      continue;
    }
    // Dependents wait for this service to be healthy.
    if (!WaitForHealthy(name, kStartupHealthWait, c) && !shutting_down_) {
      logger_.Log(toolbelt::LogLevel::kWarning,
                  "Service %s did not become healthy within %d seconds",
                  name.c_str(), int(kStartupHealthWait.count()));
    }
  }
  logger_.Log(toolbelt::LogLevel::kInfo, "All configured services launched");
}

void Supervisor::ShutdownCoroutine(co::Coroutine *c) {
  toolbelt::FileDescriptor shutdown(dup(shutdown_trigger_.GetPollFd().Fd()));
  c->Wait(shutdown.Fd(), POLLIN);
  shutting_down_ = true;
  logger_.Log(toolbelt::LogLevel::kInfo, "Shutting down");

  auto done = std::make_shared<bool>(false);
  AddCoroutine(std::make_unique<co::Coroutine>(
      co_scheduler_,
      [this, done](co::Coroutine *c2) {
        registry_.StopAllServices(c2);
        *done = true;
      },
      "StopAllServices"));

  constexpr std::chrono::milliseconds kPoll = 100ms;
  std::chrono::milliseconds waited(0);
  bool cancelled = false;
  while (!*done) {
    c->Millisleep(kPoll.count());
    waited += kPoll;
    if (!cancelled && waited >= config_.shutdown_timeout) {
      logger_.Log(toolbelt::LogLevel::kWarning,
                  "Shutdown took longer than %d seconds, killing remaining "
                  "services",
                  int(config_.shutdown_timeout.count()));
      cancel_trigger_.Trigger();
      cancelled = true;
    }
  }
  logger_.Log(toolbelt::LogLevel::kInfo, "Supervisor shutdown complete");
  co_scheduler_.Stop();
}

void Supervisor::HandleProcessExit(std::shared_ptr<ServiceProcess> process,
                                   const ExitInfo &info) {
  if (info.requested || shutting_down_) {
    return;
  }
  const ServiceDescriptor &desc = process->Descriptor();
  bool restart = false;
  switch (desc.restart_policy) {
  case RestartPolicy::kNever:
    break;
  case RestartPolicy::kOnFailure:
    restart = info.Failed();
    break;
  case RestartPolicy::kAlways:
    restart = true;
    break;
  }
  if (!restart) {
    Log(desc.name, desc.required ? toolbelt::LogLevel::kError
                                 : toolbelt::LogLevel::kWarning,
        "Service %s exited and will not be restarted (restart policy %s)",
        desc.name.c_str(), RestartPolicyName(desc.restart_policy));
    return;
  }
  if (process->NumRestarts() >= desc.max_restarts) {
    Log(desc.name, toolbelt::LogLevel::kError,
        "Service %s has been restarted %d times, giving up", desc.name.c_str(),
        process->NumRestarts());
    return;
  }
  std::chrono::seconds delay = process->IncRestartDelay();
  process->IncNumRestarts();
  Log(desc.name, toolbelt::LogLevel::kInfo,
      "Restarting service %s in %d seconds (restart %d of %d)",
      desc.name.c_str(), int(delay.count()), process->NumRestarts(),
      desc.max_restarts);

  AddCoroutine(std::make_unique<co::Coroutine>(
      co_scheduler_,
      [this, process, delay](co::Coroutine *c) {
        if (!Sleep(delay, c) || process->IsRunning()) {
          return;
        }
        if (absl::Status status = process->Start(c); !status.ok()) {
          Log(process->Name(), toolbelt::LogLevel::kError,
              "Failed to restart %s: %s", process->Name().c_str(),
              status.ToString().c_str());
        }
      },
      absl::StrFormat("Restart.%s", desc.name)));
}

void Supervisor::HandleHealthUpdate(const HealthUpdate &update) {
  if (update.new_status != HealthStatus::kHealthy) {
    return;
  }
  if (std::shared_ptr<ServiceProcess> process =
          registry_.FindProcess(update.name);
      process != nullptr) {
    process->ResetRestarts();
  }
}

void Supervisor::SendSystemReadyEvent() {
  uint64_t ready_time = readiness_.ReadyTime();
  for (auto &handler : client_handlers_) {
    if (absl::Status status = handler->SendSystemReadyEvent(ready_time);
        !status.ok()) {
      logger_.Log(toolbelt::LogLevel::kDebug,
                  "Failed to send system ready event to %s: %s",
                  handler->GetClientName().c_str(),
                  status.ToString().c_str());
    }
  }
}

absl::Status Supervisor::Run() {
  if (!init_status_.ok()) {
    return init_status_;
  }
  logger_.Log(toolbelt::LogLevel::kInfo,
              "Overseer supervisor running on address %s (instance group %s)",
              addr_.ToString().c_str(), config_.instance_group_id.c_str());

  toolbelt::TCPSocket listen_socket;

  if (absl::Status status = listen_socket.SetReuseAddr(); !status.ok()) {
    return status;
  }

  if (absl::Status status = listen_socket.SetReusePort(); !status.ok()) {
    return status;
  }

  if (absl::Status status = listen_socket.Bind(addr_, true); !status.ok()) {
    return status;
  }

  CreateProcesses();
  monitor_.SetListener(
      [this](const HealthUpdate &update) { HandleHealthUpdate(update); });
  registry_.SetExitListener(
      [this](std::shared_ptr<ServiceProcess> process, const ExitInfo &info) {
        HandleProcessExit(std::move(process), info);
      });
  readiness_.AddSystemReadyCallback([this]() {
    logger_.Log(toolbelt::LogLevel::kInfo,
                "System ready callback: all services are operational");
    SendSystemReadyEvent();
  });

  // Notify listener that we are ready.
  if (notify_fd_.Valid()) {
    int64_t val = kReady;
    (void)::write(notify_fd_.Fd(), &val, 8);
  }

  // Register a callback to be called when a coroutine completes.  The
  // server keeps track of all coroutines created.
  // This deletes them when they are done.
  co_scheduler_.SetCompletionCallback(
      [this](co::Coroutine *c) { coroutines_.erase(c); });

  coroutines_.insert(std::make_unique<co::Coroutine>(
      co_scheduler_, [this](co::Coroutine *c) { LoggerFlushCoroutine(c); },
      "Log Flusher"));

  coroutines_.insert(std::make_unique<co::Coroutine>(
      co_scheduler_, [this](co::Coroutine *c) { SweepCoroutine(c); },
      "Health Sweep"));

  coroutines_.insert(std::make_unique<co::Coroutine>(
      co_scheduler_,
      [this](co::Coroutine *c) {
        readiness_.Run(c, config_.readiness_poll_interval,
                       shutdown_trigger_.GetPollFd().Fd());
      },
      "Readiness"));

  // Start the listener coroutine.
  coroutines_.insert(
      std::make_unique<co::Coroutine>(co_scheduler_,
                                      [this, &listen_socket](co::Coroutine *c) {
                                        ListenerCoroutine(listen_socket, c);
                                      },
                                      "Listener Socket"));

  coroutines_.insert(std::make_unique<co::Coroutine>(
      co_scheduler_, [this](co::Coroutine *c) { StartupCoroutine(c); },
      "Startup"));

  coroutines_.insert(std::make_unique<co::Coroutine>(
      co_scheduler_, [this](co::Coroutine *c) { ShutdownCoroutine(c); },
      "Shutdown"));

  // Run the coroutine main loop.
  co_scheduler_.Run();

  for (auto &client : client_handlers_) {
    client->FlushEvents(nullptr);
    client->Shutdown();
  }
  FlushLogs();

  // Notify that we are stopped.
  if (notify_fd_.Valid()) {
    int64_t val = kStopped;
    (void)::write(notify_fd_.Fd(), &val, 8);
  }

  return absl::OkStatus();
}

} // namespace overseer::supervisor
