// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "common/health.h"
#include "toolbelt/logging.h"
#include "toolbelt/triggerfd.h"

namespace overseer::supervisor {

// A bounded queue of health updates for one watcher.  The monitor pushes
// and never blocks: an update that doesn't fit is dropped.  The consumer
// waits on PollFd() and then drains the queue.
class Subscriber {
public:
  static constexpr size_t kCapacity = 100;

  static absl::StatusOr<std::shared_ptr<Subscriber>>
  Create(int id, const std::vector<std::string> &service_ids);

  int Id() const { return id_; }

  // True if this subscriber wants updates for the service.  An empty
  // allow-list wants everything.
  bool Wants(const std::string &service_id) const {
    return service_ids_.empty() || service_ids_.contains(service_id);
  }

  // Returns false if the update was dropped because the queue is full or
  // the subscriber has been closed.
  bool Push(const HealthUpdate &update);

  // Take everything queued, oldest first.
  std::vector<HealthUpdate> Drain();

  size_t Size() const;
  int64_t Dropped() const;

  // Readable while updates are queued or after Close.
  int PollFd() { return trigger_.GetPollFd().Fd(); }

  void Close();
  bool IsClosed() const;

private:
  Subscriber(int id, absl::flat_hash_set<std::string> service_ids)
      : id_(id), service_ids_(std::move(service_ids)) {}

  int id_;
  absl::flat_hash_set<std::string> service_ids_;
  toolbelt::TriggerFd trigger_;

  mutable absl::Mutex mutex_;
  std::deque<HealthUpdate> queue_ ABSL_GUARDED_BY(mutex_);
  int64_t dropped_ ABSL_GUARDED_BY(mutex_) = 0;
  bool closed_ ABSL_GUARDED_BY(mutex_) = false;
};

struct ServiceHealth {
  std::string name;
  HealthStatus status = HealthStatus::kStarting;
  uint64_t last_update = 0;  // Last heartbeat, ns since epoch.
  uint64_t last_healthy = 0; // Last time the service entered HEALTHY.
};

// Tracks the health of every registered service, notices services that
// have stopped sending heartbeats and tells subscribers about changes.
// It also holds the commands waiting to be picked up by each service's
// next heartbeat.
class HealthMonitor {
public:
  using Listener = std::function<void(const HealthUpdate &)>;

  HealthMonitor(toolbelt::Logger &logger,
                std::chrono::nanoseconds heartbeat_timeout);

  void AddService(const std::string &id, const std::string &name,
                  uint64_t now = NowNs());

  // Emits the terminal STOPPED transition and forgets the service and any
  // commands queued for it.  Unknown ids are ignored.
  void RemoveService(const std::string &id, uint64_t now = NowNs());

  // Heartbeat path.  Refreshes the last update time and returns true if
  // the status changed.  An unknown id is logged and ignored.
  bool UpdateHealth(const std::string &id, HealthStatus status,
                    uint64_t now = NowNs());

  // Forces every service that has been silent for longer than the
  // heartbeat timeout to UNHEALTHY.  Returns the number of services that
  // changed.
  int Sweep(uint64_t now = NowNs());

  absl::StatusOr<ServiceHealth> GetHealth(const std::string &id) const;
  bool Contains(const std::string &id) const;

  absl::StatusOr<std::shared_ptr<Subscriber>>
  Subscribe(const std::vector<std::string> &service_ids);
  void Unsubscribe(const std::shared_ptr<Subscriber> &sub);
  size_t NumSubscribers() const;

  absl::Status QueueCommand(const std::string &id, const ServiceCommand &cmd);

  // Returns the queued commands and clears the queue.
  std::vector<ServiceCommand> GetPendingCommands(const std::string &id);

  // Called, without the monitor's lock held, for every status change.
  void SetListener(Listener listener) { listener_ = std::move(listener); }

  std::chrono::nanoseconds HeartbeatTimeout() const {
    return heartbeat_timeout_;
  }

private:
  // Change detection and fan-out shared by heartbeats and the sweep.
  // Returns the update if the status changed.  Updates that full
  // subscribers couldn't take are added to dropped.
  std::optional<HealthUpdate> SetStatus(const std::string &id,
                                        ServiceHealth &health,
                                        HealthStatus status, uint64_t now,
                                        int &dropped)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Returns the number of subscribers that dropped the update.
  int Publish(const HealthUpdate &update)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  // Logs the updates and passes them to the listener.  Must be called
  // without the lock held.
  void Notify(const std::vector<HealthUpdate> &updates, int dropped)
      ABSL_LOCKS_EXCLUDED(mutex_);

  toolbelt::Logger &logger_;
  std::chrono::nanoseconds heartbeat_timeout_;
  Listener listener_;

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, ServiceHealth>
      services_ ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<std::string, std::vector<ServiceCommand>>
      commands_ ABSL_GUARDED_BY(mutex_);
  absl::flat_hash_map<int, std::shared_ptr<Subscriber>>
      subscribers_ ABSL_GUARDED_BY(mutex_);
  int next_subscriber_id_ ABSL_GUARDED_BY(mutex_) = 1;
};

} // namespace overseer::supervisor
