// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/client_handler.h"
#include "absl/strings/str_format.h"
#include "common/service.h"
#include "supervisor/supervisor.h"

#include <algorithm>
#include <poll.h>
#include <unistd.h>

namespace overseer::supervisor {

ClientHandler::ClientHandler(Supervisor &supervisor, toolbelt::TCPSocket socket,
                             uint32_t id)
    : TCPClientHandler(supervisor.logger_, std::move(socket)),
      supervisor_(supervisor), id_(id) {}

ClientHandler::~ClientHandler() {}

co::CoroutineScheduler &ClientHandler::GetScheduler() const {
  return supervisor_.co_scheduler_;
}

void ClientHandler::AddCoroutine(std::unique_ptr<co::Coroutine> c) {
  supervisor_.AddCoroutine(std::move(c));
}

void ClientHandler::Shutdown() {
  for (auto & [ watch_id, sub ] : watches_) {
    supervisor_.monitor_.Unsubscribe(sub);
  }
  watches_.clear();
  if (log_entries_received_ > 0) {
    logger_.Log(toolbelt::LogLevel::kDebug,
                "Log stream from %s closed after %d entries",
                client_name_.c_str(), int(log_entries_received_));
  }
}

absl::Status
ClientHandler::SendLogEvent(std::shared_ptr<proto::LogMessage> msg) {
  if ((event_mask_ & kLogMessageEvents) == 0) {
    return absl::OkStatus();
  }
  auto event = std::make_shared<proto::Event>();
  *event->mutable_log() = *msg; // This is a copy.
  return QueueEvent(std::move(event));
}

absl::Status ClientHandler::SendSystemReadyEvent(uint64_t ready_time) {
  if ((event_mask_ & kReadyEvents) == 0) {
    return absl::OkStatus();
  }
  auto event = std::make_shared<proto::Event>();
  event->mutable_ready()->set_ready_time(ready_time);
  return QueueEvent(std::move(event));
}

absl::Status ClientHandler::HandleMessage(const proto::Request &req,
                                          proto::Response &resp,
                                          co::Coroutine *c) {
  switch (req.request_case()) {
  case proto::Request::kInit:
    HandleInit(req.init(), resp.mutable_init(), c);
    break;

  case proto::Request::kRegisterService:
    HandleRegisterService(req.register_service(),
                          resp.mutable_register_service(), c);
    break;

  case proto::Request::kUnregisterService:
    HandleUnregisterService(req.unregister_service(),
                            resp.mutable_unregister_service(), c);
    break;

  case proto::Request::kStartService:
    HandleStartService(req.start_service(), resp.mutable_start_service(), c);
    break;

  case proto::Request::kStopService:
    HandleStopService(req.stop_service(), resp.mutable_stop_service(), c);
    break;

  case proto::Request::kGetServiceStatus:
    HandleGetServiceStatus(req.get_service_status(),
                           resp.mutable_get_service_status(), c);
    break;

  case proto::Request::kListServices:
    HandleListServices(req.list_services(), resp.mutable_list_services(), c);
    break;

  case proto::Request::kHeartbeat:
    HandleHeartbeat(req.heartbeat(), resp.mutable_heartbeat(), c);
    break;

  case proto::Request::kWatchServiceHealth:
    HandleWatchServiceHealth(req.watch_service_health(),
                             resp.mutable_watch_service_health(), c);
    break;

  case proto::Request::kUnwatchServiceHealth:
    HandleUnwatchServiceHealth(req.unwatch_service_health(),
                               resp.mutable_unwatch_service_health(), c);
    break;

  case proto::Request::kLogStream:
    HandleLogStream(req.log_stream(), resp.mutable_log_stream(), c);
    break;

  case proto::Request::kQueueCommand:
    HandleQueueCommand(req.queue_command(), resp.mutable_queue_command(), c);
    break;

  case proto::Request::kGetReadiness:
    HandleGetReadiness(req.get_readiness(), resp.mutable_get_readiness(), c);
    break;

  case proto::Request::kGetLogs:
    HandleGetLogs(req.get_logs(), resp.mutable_get_logs(), c);
    break;

  case proto::Request::REQUEST_NOT_SET:
    return absl::InternalError("Protocol error: unknown request");
  }
  return absl::OkStatus();
}

void ClientHandler::HandleInit(const proto::InitRequest &req,
                               proto::InitResponse *response,
                               co::Coroutine *c) {
  absl::StatusOr<int> s = Init(
      req.client_name(), req.event_mask(),
      [ this, client = shared_from_this() ]()->absl::Status {
        // A client that connects after the system is ready still hears
        // about it.
        if (supervisor_.readiness_.IsSystemReady()) {
          return SendSystemReadyEvent(supervisor_.readiness_.ReadyTime());
        }
        return absl::OkStatus();
      },
      c);
  if (!s.ok()) {
    response->set_error(s.status().ToString());
    return;
  }
  response->set_event_port(*s);
}

void ClientHandler::HandleRegisterService(
    const proto::RegisterServiceRequest &req,
    proto::RegisterServiceResponse *response, co::Coroutine *c) {
  ServiceInfo info;
  info.FromProto(req.service());
  ServiceCapabilities capabilities;
  capabilities.FromProto(req.capabilities());

  absl::StatusOr<Registration> reg =
      supervisor_.registry_.RegisterService(info, capabilities);
  if (!reg.ok()) {
    response->set_success(false);
    response->set_message(reg.status().ToString());
    return;
  }
  response->set_success(true);
  response->set_service_id(reg->service_id);
  response->set_message(reg->existing
                            ? absl::StrFormat("Service %s already registered",
                                              info.name)
                            : absl::StrFormat("Service %s registered",
                                              info.name));
  reg->initial_config.ToProto(response->mutable_initial_config());
}

void ClientHandler::HandleUnregisterService(
    const proto::UnregisterServiceRequest &req,
    proto::UnregisterServiceResponse *response, co::Coroutine *c) {
  if (absl::Status status = supervisor_.registry_.UnregisterService(
          req.service_id(), req.reason());
      !status.ok()) {
    response->set_success(false);
    response->set_message(status.ToString());
    return;
  }
  response->set_success(true);
  response->set_message("Service unregistered");
}

void ClientHandler::HandleStartService(const proto::StartServiceRequest &req,
                                       proto::StartServiceResponse *response,
                                       co::Coroutine *c) {
  if (absl::Status status = supervisor_.registry_.StartService(
          req.name(), c, supervisor_.config_.registration_timeout);
      !status.ok()) {
    response->set_success(false);
    response->set_message(status.ToString());
    return;
  }
  response->set_success(true);
  response->set_message(absl::StrFormat("Service %s started", req.name()));
}

void ClientHandler::HandleStopService(const proto::StopServiceRequest &req,
                                      proto::StopServiceResponse *response,
                                      co::Coroutine *c) {
  // Without a grace period in the request the service's own applies.
  std::chrono::seconds grace(std::max(0, req.grace_period_secs()));
  if (absl::Status status = supervisor_.registry_.StopService(
          req.service_id(), req.force(), grace, c);
      !status.ok()) {
    response->set_success(false);
    response->set_message(status.ToString());
    return;
  }
  response->set_success(true);
  response->set_message("Service stopped");
}

void ClientHandler::HandleGetServiceStatus(
    const proto::GetServiceStatusRequest &req,
    proto::GetServiceStatusResponse *response, co::Coroutine *c) {
  absl::StatusOr<ServiceStatus> status =
      supervisor_.registry_.GetServiceStatus(req.service_id());
  if (!status.ok()) {
    response->set_error(status.status().ToString());
    return;
  }
  status->ToProto(response->mutable_status());
}

void ClientHandler::HandleListServices(const proto::ListServicesRequest &req,
                                       proto::ListServicesResponse *response,
                                       co::Coroutine *c) {
  for (auto &status : supervisor_.registry_.ListServices(
           ServiceStateFromProto(req.state_filter()), req.name_pattern())) {
    status.ToProto(response->add_services());
  }
}

void ClientHandler::HandleHeartbeat(const proto::HeartbeatRequest &req,
                                    proto::HeartbeatResponse *response,
                                    co::Coroutine *c) {
  ServiceMetrics metrics;
  metrics.FromProto(req.metrics());
  if (absl::Status status = supervisor_.registry_.UpdateHeartbeat(
          req.service_id(), HealthStatusFromProto(req.health()), metrics);
      !status.ok()) {
    response->set_acknowledged(false);
    response->set_error(status.ToString());
    return;
  }
  response->set_acknowledged(true);
  for (auto &cmd :
       supervisor_.monitor_.GetPendingCommands(req.service_id())) {
    cmd.ToProto(response->add_commands());
  }
}

void ClientHandler::HandleWatchServiceHealth(
    const proto::WatchServiceHealthRequest &req,
    proto::WatchServiceHealthResponse *response, co::Coroutine *c) {
  std::vector<std::string> ids(req.service_ids().begin(),
                               req.service_ids().end());
  absl::StatusOr<std::shared_ptr<Subscriber>> sub =
      supervisor_.monitor_.Subscribe(ids);
  if (!sub.ok()) {
    response->set_error(sub.status().ToString());
    return;
  }
  watches_.emplace((*sub)->Id(), *sub);
  response->set_watch_id((*sub)->Id());

  AddCoroutine(std::make_unique<co::Coroutine>(
      GetScheduler(),
      [ client = shared_from_this(), sub = *sub ](co::Coroutine * c2) {
        client->WatchCoroutine(sub, c2);
      },
      absl::StrFormat("Watch.%s.%d", client_name_, (*sub)->Id())));
}

void ClientHandler::WatchCoroutine(std::shared_ptr<Subscriber> sub,
                                   co::Coroutine *c) {
  // The client connects the event channel during Init but we might not
  // have accepted it yet.  Updates wait in the subscriber's queue.
  while (!EventChannelOpen() && !sub->IsClosed()) {
    c->Millisleep(10);
  }

  // Two coroutines can't wait for the same fd.
  toolbelt::FileDescriptor poll_fd(dup(sub->PollFd()));
  while (!sub->IsClosed() && EventChannelOpen()) {
    c->Wait(poll_fd.Fd(), POLLIN);
    for (auto &update : sub->Drain()) {
      auto event = std::make_shared<proto::Event>();
      auto *h = event->mutable_health_update();
      h->set_watch_id(sub->Id());
      update.ToProto(h->mutable_update());
      if (absl::Status status = QueueEvent(std::move(event)); !status.ok()) {
        logger_.Log(toolbelt::LogLevel::kDebug,
                    "Health update for %s not sent to %s: %s",
                    update.service_id.c_str(), client_name_.c_str(),
                    status.ToString().c_str());
      }
    }
  }
  if (sub->Dropped() > 0) {
    logger_.Log(toolbelt::LogLevel::kWarning,
                "Watch %d for %s dropped %d health updates", sub->Id(),
                client_name_.c_str(), int(sub->Dropped()));
  }
}

void ClientHandler::HandleUnwatchServiceHealth(
    const proto::UnwatchServiceHealthRequest &req,
    proto::UnwatchServiceHealthResponse *response, co::Coroutine *c) {
  auto it = watches_.find(req.watch_id());
  if (it == watches_.end()) {
    response->set_error(absl::StrFormat("No such watch %d", req.watch_id()));
    return;
  }
  supervisor_.monitor_.Unsubscribe(it->second);
  watches_.erase(it);
}

void ClientHandler::HandleLogStream(const proto::LogStreamRequest &req,
                                    proto::LogStreamResponse *response,
                                    co::Coroutine *c) {
  for (auto &entry : req.entries()) {
    LogMessage msg;
    msg.FromProto(entry);
    if (msg.source.empty()) {
      msg.source = client_name_;
    }
    if (msg.timestamp == 0) {
      msg.timestamp = NowNs();
    }
    supervisor_.log_store_.Add(std::move(msg));
    log_entries_received_++;
  }
  response->set_received(log_entries_received_);
  if (req.close()) {
    // End of the stream: acknowledge everything sent on it.
    response->set_acknowledged(true);
    log_entries_received_ = 0;
  }
}

void ClientHandler::HandleQueueCommand(const proto::QueueCommandRequest &req,
                                       proto::QueueCommandResponse *response,
                                       co::Coroutine *c) {
  ServiceCommand cmd;
  cmd.FromProto(req.command());
  if (absl::Status status =
          supervisor_.monitor_.QueueCommand(req.service_id(), cmd);
      !status.ok()) {
    response->set_success(false);
    response->set_message(status.ToString());
    return;
  }
  response->set_success(true);
  response->set_message(absl::StrFormat("Queued %s command",
                                        CommandTypeName(cmd.type)));
}

void ClientHandler::HandleGetReadiness(const proto::GetReadinessRequest &req,
                                       proto::GetReadinessResponse *response,
                                       co::Coroutine *c) {
  response->set_ready(supervisor_.readiness_.IsSystemReady());
  response->set_ready_time(supervisor_.readiness_.ReadyTime());
  for (auto & [ name, status ] :
       supervisor_.registry_.GetConfiguredServiceStatus()) {
    (*response->mutable_services())[name] = status;
  }
}

void ClientHandler::HandleGetLogs(const proto::GetLogsRequest &req,
                                  proto::GetLogsResponse *response,
                                  co::Coroutine *c) {
  size_t max = req.max_entries() > 0 ? size_t(req.max_entries())
                                     : kDefaultLogQueryEntries;
  for (auto &entry : supervisor_.log_store_.Recent(max, req.source())) {
    entry.ToProto(response->add_entries());
  }
}

} // namespace overseer::supervisor
