// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/health_monitor.h"

#include "absl/strings/str_format.h"

namespace overseer::supervisor {

absl::StatusOr<std::shared_ptr<Subscriber>>
Subscriber::Create(int id, const std::vector<std::string> &service_ids) {
  absl::flat_hash_set<std::string> ids(service_ids.begin(), service_ids.end());
  std::shared_ptr<Subscriber> sub(new Subscriber(id, std::move(ids)));
  if (absl::Status status = sub->trigger_.Open(); !status.ok()) {
    return status;
  }
  return sub;
}

bool Subscriber::Push(const HealthUpdate &update) {
  absl::MutexLock lock(&mutex_);
  if (closed_ || queue_.size() >= kCapacity) {
    dropped_++;
    return false;
  }
  queue_.push_back(update);
  trigger_.Trigger();
  return true;
}

std::vector<HealthUpdate> Subscriber::Drain() {
  absl::MutexLock lock(&mutex_);
  if (!closed_) {
    trigger_.Clear();
  }
  std::vector<HealthUpdate> updates(queue_.begin(), queue_.end());
  queue_.clear();
  return updates;
}

size_t Subscriber::Size() const {
  absl::MutexLock lock(&mutex_);
  return queue_.size();
}

int64_t Subscriber::Dropped() const {
  absl::MutexLock lock(&mutex_);
  return dropped_;
}

void Subscriber::Close() {
  absl::MutexLock lock(&mutex_);
  closed_ = true;
  // Leave the trigger set so that a waiting consumer wakes up.
  trigger_.Trigger();
}

bool Subscriber::IsClosed() const {
  absl::MutexLock lock(&mutex_);
  return closed_;
}

HealthMonitor::HealthMonitor(toolbelt::Logger &logger,
                             std::chrono::nanoseconds heartbeat_timeout)
    : logger_(logger), heartbeat_timeout_(heartbeat_timeout) {}

void HealthMonitor::AddService(const std::string &id, const std::string &name,
                               uint64_t now) {
  bool inserted;
  {
    absl::MutexLock lock(&mutex_);
    inserted = services_
                   .emplace(id, ServiceHealth{.name = name,
                                              .status = HealthStatus::kStarting,
                                              .last_update = now})
                   .second;
  }
  if (!inserted) {
    logger_.Log(toolbelt::LogLevel::kDebug,
                "Service %s (%s) is already being monitored", name.c_str(),
                id.c_str());
  }
}

void HealthMonitor::RemoveService(const std::string &id, uint64_t now) {
  std::vector<HealthUpdate> updates;
  int dropped = 0;
  {
    absl::MutexLock lock(&mutex_);
    auto it = services_.find(id);
    if (it == services_.end()) {
      return;
    }
    if (std::optional<HealthUpdate> update =
            SetStatus(id, it->second, HealthStatus::kStopped, now, dropped);
        update.has_value()) {
      updates.push_back(std::move(*update));
    }
    services_.erase(it);
    commands_.erase(id);
  }
  Notify(updates, dropped);
}

bool HealthMonitor::UpdateHealth(const std::string &id, HealthStatus status,
                                 uint64_t now) {
  std::optional<HealthUpdate> update;
  int dropped = 0;
  bool known = true;
  {
    absl::MutexLock lock(&mutex_);
    auto it = services_.find(id);
    if (it == services_.end()) {
      known = false;
    } else {
      it->second.last_update = now;
      update = SetStatus(id, it->second, status, now, dropped);
    }
  }
  if (!known) {
    // Can happen when a heartbeat races with unregistration.
    logger_.Log(toolbelt::LogLevel::kDebug,
                "Health update for unknown service %s ignored", id.c_str());
    return false;
  }
  if (!update.has_value()) {
    return false;
  }
  Notify({*update}, dropped);
  return true;
}

int HealthMonitor::Sweep(uint64_t now) {
  std::vector<HealthUpdate> updates;
  std::vector<uint64_t> silences;
  int dropped = 0;
  {
    absl::MutexLock lock(&mutex_);
    uint64_t timeout = heartbeat_timeout_.count();
    for (auto & [ id, health ] : services_) {
      if (health.status == HealthStatus::kUnhealthy ||
          health.status == HealthStatus::kStopped) {
        continue;
      }
      if (now < health.last_update || now - health.last_update <= timeout) {
        continue;
      }
      if (std::optional<HealthUpdate> update =
              SetStatus(id, health, HealthStatus::kUnhealthy, now, dropped);
          update.has_value()) {
        updates.push_back(std::move(*update));
        silences.push_back(now - health.last_update);
      }
    }
  }
  for (size_t i = 0; i < updates.size(); i++) {
    logger_.Log(toolbelt::LogLevel::kWarning,
                "Service %s (%s) has not sent a heartbeat for %d seconds",
                updates[i].name.c_str(), updates[i].service_id.c_str(),
                int(silences[i] / 1000000000ULL));
  }
  Notify(updates, dropped);
  return int(updates.size());
}

std::optional<HealthUpdate>
HealthMonitor::SetStatus(const std::string &id, ServiceHealth &health,
                         HealthStatus status, uint64_t now, int &dropped) {
  if (status == HealthStatus::kHealthy) {
    health.last_healthy = now;
  }
  if (health.status == status) {
    return std::nullopt;
  }
  HealthUpdate update = {.service_id = id,
                         .name = health.name,
                         .old_status = health.status,
                         .new_status = status,
                         .timestamp = now};
  health.status = status;
  dropped += Publish(update);
  return update;
}

int HealthMonitor::Publish(const HealthUpdate &update) {
  // Delivery happens under the lock so that every subscriber sees the
  // updates for a service in the order they happened.  Push never blocks.
  int dropped = 0;
  for (auto & [ sub_id, sub ] : subscribers_) {
    if (sub->Wants(update.service_id) && !sub->Push(update)) {
      dropped++;
    }
  }
  return dropped;
}

void HealthMonitor::Notify(const std::vector<HealthUpdate> &updates,
                           int dropped) {
  for (auto &update : updates) {
    logger_.Log(toolbelt::LogLevel::kInfo, "Service %s health %s -> %s",
                update.name.c_str(), HealthStatusName(update.old_status),
                HealthStatusName(update.new_status));
  }
  if (dropped > 0) {
    logger_.Log(toolbelt::LogLevel::kDebug,
                "%d health updates dropped by full subscribers", dropped);
  }
  if (listener_ == nullptr) {
    return;
  }
  for (auto &update : updates) {
    listener_(update);
  }
}

absl::StatusOr<ServiceHealth>
HealthMonitor::GetHealth(const std::string &id) const {
  absl::ReaderMutexLock lock(&mutex_);
  auto it = services_.find(id);
  if (it == services_.end()) {
    return absl::NotFoundError(absl::StrFormat("Unknown service %s", id));
  }
  return it->second;
}

bool HealthMonitor::Contains(const std::string &id) const {
  absl::ReaderMutexLock lock(&mutex_);
  return services_.contains(id);
}

absl::StatusOr<std::shared_ptr<Subscriber>>
HealthMonitor::Subscribe(const std::vector<std::string> &service_ids) {
  absl::MutexLock lock(&mutex_);
  absl::StatusOr<std::shared_ptr<Subscriber>> sub =
      Subscriber::Create(next_subscriber_id_++, service_ids);
  if (!sub.ok()) {
    return sub.status();
  }
  subscribers_.emplace((*sub)->Id(), *sub);
  return sub;
}

void HealthMonitor::Unsubscribe(const std::shared_ptr<Subscriber> &sub) {
  if (sub == nullptr) {
    return;
  }
  {
    absl::MutexLock lock(&mutex_);
    subscribers_.erase(sub->Id());
  }
  sub->Close();
}

size_t HealthMonitor::NumSubscribers() const {
  absl::ReaderMutexLock lock(&mutex_);
  return subscribers_.size();
}

absl::Status HealthMonitor::QueueCommand(const std::string &id,
                                         const ServiceCommand &cmd) {
  absl::MutexLock lock(&mutex_);
  if (!services_.contains(id)) {
    return absl::NotFoundError(absl::StrFormat("Unknown service %s", id));
  }
  commands_[id].push_back(cmd);
  return absl::OkStatus();
}

std::vector<ServiceCommand>
HealthMonitor::GetPendingCommands(const std::string &id) {
  absl::MutexLock lock(&mutex_);
  auto it = commands_.find(id);
  if (it == commands_.end()) {
    return {};
  }
  std::vector<ServiceCommand> cmds = std::move(it->second);
  commands_.erase(it);
  return cmds;
}

} // namespace overseer::supervisor
