// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "common/health.h"
#include "toolbelt/logging.h"

#include "coroutine.h"

namespace overseer::supervisor {

using namespace std::chrono_literals;

// Polls the aggregate health of the configured services and latches
// system readiness the first time they are all operational.  Once ready,
// the system stays ready.  Callbacks run once, when readiness is reached,
// or immediately if they are added after that.
class ReadinessManager {
public:
  using Callback = std::function<void()>;

  // Runs a callback independently of the others (in the supervisor, on its
  // own coroutine).
  using Spawner = std::function<void(Callback)>;

  using AllHealthyFunc = std::function<bool()>;

  // Per-service description of the configured services, used for the
  // diagnostic line while not ready.
  using DescribeFunc =
      std::function<std::vector<std::pair<std::string, std::string>>()>;

  static constexpr std::chrono::nanoseconds kLogInterval = 20s;

  ReadinessManager(toolbelt::Logger &logger, AllHealthyFunc all_healthy,
                   DescribeFunc describe, Spawner spawner);

  // One poll.  Returns true if the system is ready.
  bool Check(uint64_t now = NowNs());

  // Polls immediately and then once per interval until ready or until
  // stop_fd becomes readable.
  void Run(co::Coroutine *c, std::chrono::nanoseconds interval, int stop_fd);

  bool IsSystemReady() const;

  // Zero until ready.
  uint64_t ReadyTime() const;

  void AddSystemReadyCallback(Callback callback);

private:
  void LogStatus();

  toolbelt::Logger &logger_;
  AllHealthyFunc all_healthy_;
  DescribeFunc describe_;
  Spawner spawner_;

  mutable absl::Mutex mutex_;
  bool is_ready_ ABSL_GUARDED_BY(mutex_) = false;
  uint64_t ready_time_ ABSL_GUARDED_BY(mutex_) = 0;
  uint64_t last_log_time_ ABSL_GUARDED_BY(mutex_) = 0;
  bool logged_ ABSL_GUARDED_BY(mutex_) = false;
  std::vector<Callback> callbacks_ ABSL_GUARDED_BY(mutex_);
};

} // namespace overseer::supervisor
