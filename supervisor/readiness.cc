// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/readiness.h"

#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "toolbelt/fd.h"

#include <poll.h>
#include <unistd.h>

namespace overseer::supervisor {

ReadinessManager::ReadinessManager(toolbelt::Logger &logger,
                                   AllHealthyFunc all_healthy,
                                   DescribeFunc describe, Spawner spawner)
    : logger_(logger), all_healthy_(std::move(all_healthy)),
      describe_(std::move(describe)), spawner_(std::move(spawner)) {}

bool ReadinessManager::Check(uint64_t now) {
  {
    absl::ReaderMutexLock lock(&mutex_);
    if (is_ready_) {
      return true;
    }
  }

  // The aggregate is computed without our lock held.  It takes the
  // registry's lock.
  bool healthy = all_healthy_();

  std::vector<Callback> callbacks;
  bool log_status = false;
  {
    absl::MutexLock lock(&mutex_);
    if (is_ready_) {
      return true;
    }
    if (!healthy) {
      if (!logged_ || now - last_log_time_ >= uint64_t(kLogInterval.count())) {
        logged_ = true;
        last_log_time_ = now;
        log_status = true;
      }
    } else {
      is_ready_ = true;
      ready_time_ = now;
      callbacks = callbacks_;
    }
  }

  if (log_status) {
    LogStatus();
    return false;
  }
  if (!healthy) {
    return false;
  }

  logger_.Log(toolbelt::LogLevel::kInfo,
              "System is ready: all required services are operational");
  for (auto &callback : callbacks) {
    spawner_(callback);
  }
  return true;
}

void ReadinessManager::LogStatus() {
  std::vector<std::pair<std::string, std::string>> services = describe_();
  std::vector<std::string> parts;
  parts.reserve(services.size());
  for (auto & [ name, status ] : services) {
    parts.push_back(absl::StrFormat("%s: %s", name, status));
  }
  logger_.Log(toolbelt::LogLevel::kInfo, "Waiting for system ready: %s",
              absl::StrJoin(parts, ", ").c_str());
}

void ReadinessManager::Run(co::Coroutine *c, std::chrono::nanoseconds interval,
                           int stop_fd) {
  // Two coroutines can't wait on the same fd.
  toolbelt::FileDescriptor stop(dup(stop_fd));
  if (Check()) {
    return;
  }
  for (;;) {
    int fd = c->Wait(stop.Fd(), POLLIN, interval.count());
    if (fd == stop.Fd()) {
      return;
    }
    if (Check()) {
      return;
    }
  }
}

bool ReadinessManager::IsSystemReady() const {
  absl::ReaderMutexLock lock(&mutex_);
  return is_ready_;
}

uint64_t ReadinessManager::ReadyTime() const {
  absl::ReaderMutexLock lock(&mutex_);
  return ready_time_;
}

void ReadinessManager::AddSystemReadyCallback(Callback callback) {
  {
    absl::MutexLock lock(&mutex_);
    if (!is_ready_) {
      callbacks_.push_back(std::move(callback));
      return;
    }
  }
  // Already ready: there will be no future transition to wait for.
  spawner_(std::move(callback));
}

} // namespace overseer::supervisor
