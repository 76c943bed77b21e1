// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.
#include "supervisor/client/client.h"
#include "absl/strings/str_format.h"

namespace overseer::client {

absl::Status Client::Init(toolbelt::InetAddress addr, const std::string &name,
                          int event_mask, co::Coroutine *c) {
  c = Co(c);
  name_ = name;
  if (absl::Status status = command_socket_.Connect(addr); !status.ok()) {
    return status;
  }
  // Services launched by a client must not inherit its connections.
  if (absl::Status status = command_socket_.SetCloseOnExec(); !status.ok()) {
    return status;
  }

  proto::Request req;
  auto init = req.mutable_init();
  init->set_client_name(name);
  init->set_event_mask(event_mask);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to initialize connection to %s: %s", addr.ToString(),
        status.ToString()));
  }
  if (!resp.init().error().empty()) {
    command_socket_.Close();
    return absl::InternalError(absl::StrFormat(
        "Supervisor refused client %s: %s", name, resp.init().error()));
  }

  toolbelt::InetAddress event_addr = addr;
  event_addr.SetPort(resp.init().event_port());
  if (absl::Status status = event_socket_.Connect(event_addr); !status.ok()) {
    command_socket_.Close();
    return status;
  }
  return event_socket_.SetCloseOnExec();
}

absl::Status Client::Call(const proto::Request &req, proto::Response &resp,
                          co::Coroutine *c) {
  c = Co(c);
  if (!command_socket_.Connected()) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Client %s is not connected", name_));
  }
  // The socket writes the length prefix into the 4 bytes before the
  // message.
  size_t length = req.ByteSizeLong();
  std::vector<char> buffer(sizeof(int32_t) + length);
  char *msg = buffer.data() + sizeof(int32_t);
  if (!req.SerializeToArray(msg, length)) {
    return absl::InternalError("Failed to serialize request");
  }
  if (absl::StatusOr<ssize_t> n = command_socket_.SendMessage(msg, length, c);
      !n.ok()) {
    command_socket_.Close();
    return n.status();
  }

  absl::StatusOr<std::vector<char>> reply =
      command_socket_.ReceiveVariableLengthMessage(c);
  if (!reply.ok() || reply->empty()) {
    command_socket_.Close();
    return reply.ok() ? absl::UnavailableError(absl::StrFormat(
                            "Supervisor closed connection for %s", name_))
                      : reply.status();
  }
  if (!resp.ParseFromArray(reply->data(), reply->size())) {
    command_socket_.Close();
    return absl::InternalError("Malformed response from supervisor");
  }
  return absl::OkStatus();
}

absl::StatusOr<std::shared_ptr<Event>> Client::ReadEvent(co::Coroutine *c) {
  absl::StatusOr<std::vector<char>> msg =
      event_socket_.ReceiveVariableLengthMessage(Co(c));
  if (!msg.ok() || msg->empty()) {
    event_socket_.Close();
    return absl::CancelledError(absl::StrFormat(
        "Event connection for %s closed: %s", name_,
        msg.ok() ? std::string("EOF") : msg.status().ToString()));
  }
  proto::Event proto_event;
  if (!proto_event.ParseFromArray(msg->data(), msg->size())) {
    event_socket_.Close();
    return absl::InternalError("Malformed event from supervisor");
  }
  auto result = std::make_shared<Event>();
  if (absl::Status status = result->FromProto(proto_event); !status.ok()) {
    return status;
  }
  return result;
}

absl::Status Client::WaitForHealth(const std::string &service_id,
                                   HealthStatus health, co::Coroutine *c) {
  for (;;) {
    absl::StatusOr<std::shared_ptr<Event>> e = WaitForEvent(c);
    if (!e.ok()) {
      return e.status();
    }
    std::shared_ptr<Event> event = *e;
    if (event->type != EventType::kHealthUpdate) {
      continue;
    }
    const HealthUpdate &update = std::get<0>(event->event).update;
    if (update.service_id == service_id && update.new_status == health) {
      return absl::OkStatus();
    }
  }
}

absl::StatusOr<Registration>
Client::RegisterService(const ServiceInfo &info,
                        const ServiceCapabilities &capabilities,
                        co::Coroutine *c) {
  proto::Request req;
  auto r = req.mutable_register_service();
  info.ToProto(r->mutable_service());
  capabilities.ToProto(r->mutable_capabilities());

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &reg_resp = resp.register_service();
  if (!reg_resp.success()) {
    return absl::InternalError(absl::StrFormat("Failed to register %s: %s",
                                               info.name, reg_resp.message()));
  }
  Registration result = {.service_id = reg_resp.service_id()};
  result.config.FromProto(reg_resp.initial_config());
  return result;
}

absl::Status Client::UnregisterService(const std::string &service_id,
                                       const std::string &reason,
                                       co::Coroutine *c) {
  proto::Request req;
  auto u = req.mutable_unregister_service();
  u->set_service_id(service_id);
  u->set_reason(reason);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &unreg_resp = resp.unregister_service();
  if (!unreg_resp.success()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to unregister service: %s", unreg_resp.message()));
  }
  return absl::OkStatus();
}

absl::Status Client::StartService(const std::string &name, co::Coroutine *c) {
  proto::Request req;
  req.mutable_start_service()->set_name(name);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &start_resp = resp.start_service();
  if (!start_resp.success()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to start service %s: %s", name, start_resp.message()));
  }
  return absl::OkStatus();
}

absl::Status Client::StopService(const std::string &service_id, bool force,
                                 int grace_period_secs, co::Coroutine *c) {
  proto::Request req;
  auto s = req.mutable_stop_service();
  s->set_service_id(service_id);
  s->set_force(force);
  s->set_grace_period_secs(grace_period_secs);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &stop_resp = resp.stop_service();
  if (!stop_resp.success()) {
    return absl::InternalError(
        absl::StrFormat("Failed to stop service: %s", stop_resp.message()));
  }
  return absl::OkStatus();
}

absl::StatusOr<ServiceStatus>
Client::GetServiceStatus(const std::string &service_id, co::Coroutine *c) {
  proto::Request req;
  req.mutable_get_service_status()->set_service_id(service_id);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &status_resp = resp.get_service_status();
  if (!status_resp.error().empty()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to get service status: %s", status_resp.error()));
  }
  ServiceStatus result;
  result.FromProto(status_resp.status());
  return result;
}

absl::StatusOr<std::vector<ServiceStatus>>
Client::ListServices(ServiceState state_filter,
                     const std::string &name_pattern, co::Coroutine *c) {
  proto::Request req;
  auto l = req.mutable_list_services();
  l->set_state_filter(ServiceStateToProto(state_filter));
  l->set_name_pattern(name_pattern);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  std::vector<ServiceStatus> result;
  for (auto &s : resp.list_services().services()) {
    ServiceStatus status;
    status.FromProto(s);
    result.push_back(std::move(status));
  }
  return result;
}

absl::StatusOr<std::vector<ServiceCommand>>
Client::Heartbeat(const std::string &service_id, HealthStatus health,
                  const ServiceMetrics &metrics, co::Coroutine *c) {
  proto::Request req;
  auto h = req.mutable_heartbeat();
  h->set_service_id(service_id);
  h->set_health(HealthStatusToProto(health));
  metrics.ToProto(h->mutable_metrics());
  h->set_timestamp(NowNs());

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &hb_resp = resp.heartbeat();
  if (!hb_resp.acknowledged()) {
    return absl::InternalError(
        absl::StrFormat("Heartbeat not acknowledged: %s", hb_resp.error()));
  }
  std::vector<ServiceCommand> commands;
  for (auto &cmd : hb_resp.commands()) {
    ServiceCommand command;
    command.FromProto(cmd);
    commands.push_back(std::move(command));
  }
  return commands;
}

absl::StatusOr<int>
Client::WatchServiceHealth(const std::vector<std::string> &service_ids,
                           co::Coroutine *c) {
  proto::Request req;
  auto w = req.mutable_watch_service_health();
  for (auto &id : service_ids) {
    w->add_service_ids(id);
  }

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &watch_resp = resp.watch_service_health();
  if (!watch_resp.error().empty()) {
    return absl::InternalError(
        absl::StrFormat("Failed to watch health: %s", watch_resp.error()));
  }
  return watch_resp.watch_id();
}

absl::Status Client::UnwatchServiceHealth(int watch_id, co::Coroutine *c) {
  proto::Request req;
  req.mutable_unwatch_service_health()->set_watch_id(watch_id);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &unwatch_resp = resp.unwatch_service_health();
  if (!unwatch_resp.error().empty()) {
    return absl::InternalError(
        absl::StrFormat("Failed to unwatch health: %s", unwatch_resp.error()));
  }
  return absl::OkStatus();
}

absl::StatusOr<int64_t> Client::SendLogs(const std::vector<LogMessage> &entries,
                                         bool close, co::Coroutine *c) {
  proto::Request req;
  auto l = req.mutable_log_stream();
  for (auto &entry : entries) {
    entry.ToProto(l->add_entries());
  }
  l->set_close(close);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &log_resp = resp.log_stream();
  if (!log_resp.error().empty()) {
    return absl::InternalError(
        absl::StrFormat("Failed to send logs: %s", log_resp.error()));
  }
  if (close && !log_resp.acknowledged()) {
    return absl::InternalError("Log stream close was not acknowledged");
  }
  return log_resp.received();
}

absl::Status Client::QueueCommand(const std::string &service_id,
                                  const ServiceCommand &cmd,
                                  co::Coroutine *c) {
  proto::Request req;
  auto q = req.mutable_queue_command();
  q->set_service_id(service_id);
  cmd.ToProto(q->mutable_command());

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &queue_resp = resp.queue_command();
  if (!queue_resp.success()) {
    return absl::InternalError(
        absl::StrFormat("Failed to queue command: %s", queue_resp.message()));
  }
  return absl::OkStatus();
}

absl::StatusOr<Readiness> Client::GetReadiness(co::Coroutine *c) {
  proto::Request req;
  req.mutable_get_readiness();

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  auto &ready_resp = resp.get_readiness();
  Readiness result = {.ready = ready_resp.ready(),
                      .ready_time = ready_resp.ready_time()};
  for (auto & [ name, status ] : ready_resp.services()) {
    result.services[name] = status;
  }
  return result;
}

absl::StatusOr<std::vector<LogMessage>>
Client::GetLogs(int max_entries, const std::string &source, co::Coroutine *c) {
  proto::Request req;
  auto g = req.mutable_get_logs();
  g->set_max_entries(max_entries);
  g->set_source(source);

  proto::Response resp;
  if (absl::Status status = Call(req, resp, c); !status.ok()) {
    return status;
  }
  std::vector<LogMessage> result;
  for (auto &entry : resp.get_logs().entries()) {
    result.emplace_back().FromProto(entry);
  }
  return result;
}

} // namespace overseer::client
