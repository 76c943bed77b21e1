// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "common/event.h"
#include "toolbelt/logging.h"
#include "toolbelt/sockets.h"
#include "toolbelt/triggerfd.h"
#include <functional>
#include <list>
#include <memory>

#include "coroutine.h"

namespace overseer::common {

// Handles one client connected over TCP.  A client has two sockets: the
// command socket carries length-prefixed request/response pairs and the
// event socket, opened on an ephemeral port handed out by Init, carries
// events pushed by the server.
//
// Events are queued and written by a separate coroutine so that nothing
// that produces an event ever waits for a slow client.  The queue is
// bounded and events that do not fit are dropped.
template <typename Request, typename Response, typename Event>
class TCPClientHandler : public std::enable_shared_from_this<
                             TCPClientHandler<Request, Response, Event>> {
public:
  static constexpr size_t kMaxQueuedEvents = 1000;

  TCPClientHandler(toolbelt::Logger &logger, toolbelt::TCPSocket socket)
      : logger_(logger), command_socket_(std::move(socket)) {}
  virtual ~TCPClientHandler() = default;

  void Run(co::Coroutine *c);
  void Stop() { stop_trigger_.Trigger(); }

  const std::string &GetClientName() const { return client_name_; }

  toolbelt::Logger &GetLogger() const { return logger_; }

  virtual co::CoroutineScheduler &GetScheduler() const = 0;

  virtual void AddCoroutine(std::unique_ptr<co::Coroutine> c) = 0;

  // Called when the command socket has closed.
  virtual void Shutdown() {}

  void SetEventSocket(toolbelt::TCPSocket socket) {
    event_socket_ = std::move(socket);
  }

  bool EventChannelOpen() const { return event_socket_.Connected(); }

  // Queue an event to be sent at the next available opportunity.
  absl::Status QueueEvent(std::shared_ptr<Event> event);

  bool WantsEvents(int mask) const { return (event_mask_ & mask) != 0; }

  // Send everything in the queue now.  Used at shutdown.
  void FlushEvents(co::Coroutine *c);

protected:
  static constexpr size_t kMaxMessageSize = 65536;

  virtual absl::Status HandleMessage(const Request &req, Response &resp,
                                     co::Coroutine *c) = 0;

  // Init the client and return the port number for the event channel.
  // The ready callback is called once the client has connected the event
  // channel.
  absl::StatusOr<int> Init(const std::string &client_name, int event_mask,
                           std::function<absl::Status()> ready,
                           co::Coroutine *c);

  void EventSenderCoroutine(co::Coroutine *c);
  void SendEvent(std::shared_ptr<Event> event, co::Coroutine *c);

  toolbelt::Logger &logger_;

  toolbelt::TCPSocket command_socket_;
  std::string client_name_ = "unknown";

  char event_buffer_[kMaxMessageSize];
  toolbelt::TCPSocket event_socket_;

  std::list<std::shared_ptr<Event>> events_;
  toolbelt::TriggerFd stop_trigger_;
  toolbelt::TriggerFd event_trigger_;
  int event_mask_ = 0;
};

template <typename Request, typename Response, typename Event>
inline void TCPClientHandler<Request, Response, Event>::Run(co::Coroutine *c) {
  if (absl::Status status = stop_trigger_.Open(); !status.ok()) {
    logger_.Log(toolbelt::LogLevel::kError, "Failed to open stop trigger: %s",
                status.ToString().c_str());
    return;
  }
  for (;;) {
    int fd = c->Wait({command_socket_.GetFileDescriptor().Fd(),
                      stop_trigger_.GetPollFd().Fd()},
                     POLLIN);
    if (fd == stop_trigger_.GetPollFd().Fd()) {
      break;
    }
    absl::StatusOr<std::vector<char>> command_buffer =
        command_socket_.ReceiveVariableLengthMessage(c);
    if (!command_buffer.ok() || command_buffer->empty()) {
      // Error or EOF: the client has gone away.
      return;
    }
    Request request;
    if (!request.ParseFromArray(command_buffer->data(),
                                command_buffer->size())) {
      logger_.Log(toolbelt::LogLevel::kError,
                  "Failed to parse request from client %s",
                  client_name_.c_str());
      return;
    }
    Response response;
    if (absl::Status s = HandleMessage(request, response, c); !s.ok()) {
      logger_.Log(toolbelt::LogLevel::kError, "%s", s.ToString().c_str());
      return;
    }

    // SendMessage puts the length in the 4 bytes before the buffer.
    size_t resplen = response.ByteSizeLong();
    std::vector<char> sendbuf(resplen + sizeof(int32_t));
    char *buf = sendbuf.data() + sizeof(int32_t);
    if (!response.SerializeToArray(buf, resplen)) {
      logger_.Log(toolbelt::LogLevel::kError, "Failed to serialize response");
      return;
    }
    if (absl::StatusOr<ssize_t> n =
            command_socket_.SendMessage(buf, resplen, c);
        !n.ok()) {
      return;
    }
  }
}

template <typename Request, typename Response, typename Event>
inline absl::StatusOr<int> TCPClientHandler<Request, Response, Event>::Init(
    const std::string &client_name, int event_mask,
    std::function<absl::Status()> ready, co::Coroutine *c) {
  client_name_ = client_name;
  event_mask_ = event_mask;

  // Event channel is an ephemeral port on the same interface.
  toolbelt::InetAddress event_channel_addr = command_socket_.BoundAddress();
  event_channel_addr.SetPort(0);

  toolbelt::TCPSocket listen_socket;
  if (absl::Status status = listen_socket.SetCloseOnExec(); !status.ok()) {
    return status;
  }
  if (absl::Status status = listen_socket.Bind(event_channel_addr, true);
      !status.ok()) {
    return status;
  }
  int event_port = listen_socket.BoundAddress().Port();

  if (absl::Status status = event_trigger_.Open(); !status.ok()) {
    return status;
  }

  AddCoroutine(std::make_unique<co::Coroutine>(
      GetScheduler(),
      [
        client = this->shared_from_this(),
        listen_socket = std::move(listen_socket), ready = std::move(ready)
      ](co::Coroutine * c2) mutable {
        absl::StatusOr<toolbelt::TCPSocket> socket = listen_socket.Accept(c2);
        if (!socket.ok()) {
          client->GetLogger().Log(toolbelt::LogLevel::kError,
                                  "Failed to open event channel: %s",
                                  socket.status().ToString().c_str());
          return;
        }
        if (absl::Status status = socket->SetCloseOnExec(); !status.ok()) {
          client->GetLogger().Log(
              toolbelt::LogLevel::kError,
              "Failed to set close-on-exec on event channel: %s",
              status.ToString().c_str());
          return;
        }
        client->SetEventSocket(std::move(*socket));
        client->GetLogger().Log(toolbelt::LogLevel::kDebug,
                                "Event channel open for %s",
                                client->GetClientName().c_str());

        client->AddCoroutine(std::make_unique<co::Coroutine>(
            client->GetScheduler(),
            [client](co::Coroutine *c3) { client->EventSenderCoroutine(c3); },
            absl::StrFormat("EventSender.%s", client->GetClientName())));

        if (absl::Status status = ready(); !status.ok()) {
          client->GetLogger().Log(toolbelt::LogLevel::kError,
                                  "Client ready callback failed: %s",
                                  status.ToString().c_str());
        }
      },
      absl::StrFormat("EventAcceptor.%s", client_name_)));
  return event_port;
}

template <typename Request, typename Response, typename Event>
inline absl::Status TCPClientHandler<Request, Response, Event>::QueueEvent(
    std::shared_ptr<Event> event) {
  if (!event_socket_.Connected()) {
    return absl::FailedPreconditionError(
        "Unable to send event: event socket is not connected");
  }
  if (events_.size() >= kMaxQueuedEvents) {
    return absl::ResourceExhaustedError(absl::StrFormat(
        "Event queue for client %s is full", client_name_));
  }
  events_.push_back(std::move(event));
  event_trigger_.Trigger();
  return absl::OkStatus();
}

template <typename Request, typename Response, typename Event>
inline void TCPClientHandler<Request, Response, Event>::EventSenderCoroutine(
    co::Coroutine *c) {
  auto client = this->shared_from_this();
  while (event_socket_.Connected()) {
    int fd = c->Wait({stop_trigger_.GetPollFd().Fd(),
                      event_trigger_.GetPollFd().Fd(),
                      event_socket_.GetFileDescriptor().Fd()},
                     POLLIN);
    // The client never writes to the event socket so it being readable
    // means it has closed.
    if (fd == event_socket_.GetFileDescriptor().Fd() ||
        fd == stop_trigger_.GetPollFd().Fd()) {
      break;
    }
    event_trigger_.Clear();

    // Drain the whole queue before waiting on the trigger again so that
    // nothing is left behind after the trigger is cleared.
    FlushEvents(c);
  }
}

template <typename Request, typename Response, typename Event>
inline void TCPClientHandler<Request, Response, Event>::SendEvent(
    std::shared_ptr<Event> event, co::Coroutine *c) {
  char *sendbuf = event_buffer_ + sizeof(int32_t);
  constexpr size_t kSendBufLen = sizeof(event_buffer_) - sizeof(int32_t);
  if (!event->SerializeToArray(sendbuf, kSendBufLen)) {
    logger_.Log(toolbelt::LogLevel::kError, "Failed to serialize event");
    return;
  }
  size_t msglen = event->ByteSizeLong();
  absl::StatusOr<ssize_t> n = event_socket_.SendMessage(sendbuf, msglen, c);
  if (!n.ok()) {
    // Normal when the client closes its end first.
    logger_.Log(toolbelt::LogLevel::kDebug, "Failed to send event to %s: %s",
                client_name_.c_str(), n.status().ToString().c_str());
  }
}

template <typename Request, typename Response, typename Event>
inline void
TCPClientHandler<Request, Response, Event>::FlushEvents(co::Coroutine *c) {
  auto client = this->shared_from_this();
  while (!events_.empty()) {
    std::shared_ptr<Event> event = std::move(events_.front());
    events_.pop_front();
    if (event_socket_.Connected()) {
      SendEvent(event, c);
    }
  }
}

} // namespace overseer::common
