// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.
#pragma once

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/event.h"
#include "common/health.h"
#include "common/log.h"
#include "common/service.h"
#include "coroutine.h"
#include "proto/control.pb.h"
#include "toolbelt/sockets.h"
#include <memory>
#include <string>
#include <vector>

namespace overseer::client {

enum class ClientMode {
  kBlocking,
  kNonBlocking,
};

struct Registration {
  std::string service_id;
  ServiceConfiguration config;
};

struct Readiness {
  bool ready = false;
  uint64_t ready_time = 0;
  absl::flat_hash_map<std::string, std::string> services;
};

// Connection to the supervisor.  Services use it to register, heartbeat
// and send their logs; operators use it to start and stop services and to
// watch health.
//
// Two sockets: requests and responses share the command socket, and the
// supervisor pushes events on a second one whose port comes back in the
// init response.  With a coroutine, socket operations yield to it,
// otherwise they block.
class Client {
public:
  Client(ClientMode mode = ClientMode::kBlocking, co::Coroutine *co = nullptr)
      : mode_(mode), co_(co) {}
  ~Client() = default;

  absl::Status Init(toolbelt::InetAddress addr, const std::string &name,
                    int event_mask = kNoEvents, co::Coroutine *c = nullptr);

  // Drops both connections.  The supervisor cancels this client's watches
  // and log streams.
  void Close() {
    command_socket_.Close();
    event_socket_.Close();
  }

  absl::StatusOr<Registration>
  RegisterService(const ServiceInfo &info,
                  const ServiceCapabilities &capabilities = {},
                  co::Coroutine *c = nullptr);

  absl::Status UnregisterService(const std::string &service_id,
                                 const std::string &reason = "",
                                 co::Coroutine *c = nullptr);

  // Launches a configured service.  Returns once it has registered.
  absl::Status StartService(const std::string &name,
                            co::Coroutine *c = nullptr);

  // A zero grace period means the default.
  absl::Status StopService(const std::string &service_id, bool force = false,
                           int grace_period_secs = 0,
                           co::Coroutine *c = nullptr);

  absl::StatusOr<ServiceStatus>
  GetServiceStatus(const std::string &service_id, co::Coroutine *c = nullptr);

  absl::StatusOr<std::vector<ServiceStatus>>
  ListServices(ServiceState state_filter = ServiceState::kUnspecified,
               const std::string &name_pattern = "",
               co::Coroutine *c = nullptr);

  // Reports health and returns the commands queued for the service.
  absl::StatusOr<std::vector<ServiceCommand>>
  Heartbeat(const std::string &service_id, HealthStatus health,
            const ServiceMetrics &metrics = {}, co::Coroutine *c = nullptr);

  // Health updates for the watch arrive as events.  An empty list of ids
  // watches every service.  Returns the watch id.
  absl::StatusOr<int>
  WatchServiceHealth(const std::vector<std::string> &service_ids = {},
                     co::Coroutine *c = nullptr);

  absl::Status UnwatchServiceHealth(int watch_id, co::Coroutine *c = nullptr);

  // Sends log entries.  close ends the stream and the supervisor
  // acknowledges everything sent on it.  Returns the number of entries
  // received on the stream so far.
  absl::StatusOr<int64_t> SendLogs(const std::vector<LogMessage> &entries,
                                   bool close = false,
                                   co::Coroutine *c = nullptr);

  absl::Status QueueCommand(const std::string &service_id,
                            const ServiceCommand &cmd,
                            co::Coroutine *c = nullptr);

  absl::StatusOr<Readiness> GetReadiness(co::Coroutine *c = nullptr);

  // The most recent log entries held by the supervisor, oldest first.
  // Zero max_entries means the supervisor's default.
  absl::StatusOr<std::vector<LogMessage>>
  GetLogs(int max_entries = 0, const std::string &source = "",
          co::Coroutine *c = nullptr);

  // Wait for an incoming event.
  absl::StatusOr<std::shared_ptr<Event>>
  WaitForEvent(co::Coroutine *c = nullptr) {
    return ReadEvent(c);
  }
  absl::StatusOr<std::shared_ptr<Event>> ReadEvent(co::Coroutine *c = nullptr);

  // Reads events until the given service reaches the given health.
  absl::Status WaitForHealth(const std::string &service_id, HealthStatus health,
                             co::Coroutine *c = nullptr);

private:
  // One request/response exchange on the command socket.  Any transport
  // failure closes the socket.
  absl::Status Call(const proto::Request &req, proto::Response &resp,
                    co::Coroutine *c);

  co::Coroutine *Co(co::Coroutine *c) const { return c != nullptr ? c : co_; }

  ClientMode mode_;
  co::Coroutine *co_;
  std::string name_;
  toolbelt::TCPSocket command_socket_;
  toolbelt::TCPSocket event_socket_;
};

} // namespace overseer::client
