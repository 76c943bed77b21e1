// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "common/tcp_client_handler.h"
#include "proto/control.pb.h"
#include "proto/log.pb.h"
#include "supervisor/health_monitor.h"
#include "toolbelt/logging.h"
#include "toolbelt/sockets.h"

#include "absl/container/flat_hash_map.h"
#include <memory>

#include "coroutine.h"

namespace overseer::supervisor {

class Supervisor;

// Log entries returned by GetLogs when the request doesn't say.
constexpr size_t kDefaultLogQueryEntries = 100;

// One connection to the supervisor, from a service or an operator.  The
// health watches and the log stream opened on a connection are owned by
// it and end when it closes.
class ClientHandler
    : public common::TCPClientHandler<proto::Request, proto::Response,
                                      proto::Event> {
public:
  ClientHandler(Supervisor &supervisor, toolbelt::TCPSocket socket,
                uint32_t id);
  ~ClientHandler();

  co::CoroutineScheduler &GetScheduler() const override;

  void AddCoroutine(std::unique_ptr<co::Coroutine> c) override;

  absl::Status SendLogEvent(std::shared_ptr<proto::LogMessage> msg);
  absl::Status SendSystemReadyEvent(uint64_t ready_time);

  // Cancels every watch owned by this connection.
  void Shutdown() override;

private:
  std::shared_ptr<ClientHandler> shared_from_this() {
    return std::static_pointer_cast<ClientHandler>(
        TCPClientHandler<proto::Request, proto::Response,
                         proto::Event>::shared_from_this());
  }

  absl::Status HandleMessage(const proto::Request &req, proto::Response &resp,
                             co::Coroutine *c) override;

  void HandleInit(const proto::InitRequest &req, proto::InitResponse *response,
                  co::Coroutine *c);

  void HandleRegisterService(const proto::RegisterServiceRequest &req,
                             proto::RegisterServiceResponse *response,
                             co::Coroutine *c);

  void HandleUnregisterService(const proto::UnregisterServiceRequest &req,
                               proto::UnregisterServiceResponse *response,
                               co::Coroutine *c);

  void HandleStartService(const proto::StartServiceRequest &req,
                          proto::StartServiceResponse *response,
                          co::Coroutine *c);

  void HandleStopService(const proto::StopServiceRequest &req,
                         proto::StopServiceResponse *response,
                         co::Coroutine *c);

  void HandleGetServiceStatus(const proto::GetServiceStatusRequest &req,
                              proto::GetServiceStatusResponse *response,
                              co::Coroutine *c);

  void HandleListServices(const proto::ListServicesRequest &req,
                          proto::ListServicesResponse *response,
                          co::Coroutine *c);

  void HandleHeartbeat(const proto::HeartbeatRequest &req,
                       proto::HeartbeatResponse *response, co::Coroutine *c);

  void HandleWatchServiceHealth(const proto::WatchServiceHealthRequest &req,
                                proto::WatchServiceHealthResponse *response,
                                co::Coroutine *c);

  void HandleUnwatchServiceHealth(const proto::UnwatchServiceHealthRequest &req,
                                  proto::UnwatchServiceHealthResponse *response,
                                  co::Coroutine *c);

  void HandleLogStream(const proto::LogStreamRequest &req,
                       proto::LogStreamResponse *response, co::Coroutine *c);

  void HandleQueueCommand(const proto::QueueCommandRequest &req,
                          proto::QueueCommandResponse *response,
                          co::Coroutine *c);

  void HandleGetReadiness(const proto::GetReadinessRequest &req,
                          proto::GetReadinessResponse *response,
                          co::Coroutine *c);

  void HandleGetLogs(const proto::GetLogsRequest &req,
                     proto::GetLogsResponse *response, co::Coroutine *c);

  // Moves health updates from the subscriber's queue to the event channel.
  void WatchCoroutine(std::shared_ptr<Subscriber> sub, co::Coroutine *c);

  Supervisor &supervisor_;
  uint32_t id_;
  absl::flat_hash_map<int, std::shared_ptr<Subscriber>> watches_;
  int64_t log_entries_received_ = 0;
};

} // namespace overseer::supervisor
