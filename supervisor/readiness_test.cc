// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/readiness.h"
#include "supervisor/health_monitor.h"
#include "toolbelt/triggerfd.h"
#include <gtest/gtest.h>

#include <atomic>
#include <map>

using ReadinessManager = overseer::supervisor::ReadinessManager;
using HealthMonitor = overseer::supervisor::HealthMonitor;
using HealthStatus = overseer::HealthStatus;

using namespace std::chrono_literals;

class ReadinessTest : public ::testing::Test {
public:
  ReadinessTest()
      : logger_("test", true), monitor_(logger_, 30s),
        readiness_(
            logger_, [this]() { return AllRequiredOperational(); },
            [this]() { return Describe(); },
            [this](ReadinessManager::Callback cb) {
              spawned_++;
              cb();
            }) {}

  // Required services are "security" and "core"; "metrics" is optional.
  bool AllRequiredOperational() {
    for (const char *name : {"security", "core"}) {
      absl::StatusOr<overseer::supervisor::ServiceHealth> h =
          monitor_.GetHealth(name);
      if (!h.ok() || !overseer::IsOperational(h->status)) {
        return false;
      }
    }
    return true;
  }

  std::vector<std::pair<std::string, std::string>> Describe() {
    describe_calls_++;
    return {{"security", "not started (required)"},
            {"core", "not started (required)"}};
  }

protected:
  toolbelt::Logger logger_;
  HealthMonitor monitor_;
  ReadinessManager readiness_;
  int spawned_ = 0;
  int describe_calls_ = 0;
};

TEST_F(ReadinessTest, ReadyAfterAllRequiredHealthy) {
  int called = 0;
  readiness_.AddSystemReadyCallback([&called]() { called++; });
  ASSERT_EQ(0, spawned_);

  monitor_.AddService("security", "security");
  monitor_.AddService("core", "core");
  monitor_.AddService("metrics", "metrics");

  ASSERT_FALSE(readiness_.Check(1));
  ASSERT_FALSE(readiness_.IsSystemReady());
  ASSERT_EQ(0, readiness_.ReadyTime());

  monitor_.UpdateHealth("security", HealthStatus::kHealthy);
  ASSERT_FALSE(readiness_.Check(2));

  // Degraded counts as operational.
  monitor_.UpdateHealth("core", HealthStatus::kDegraded);
  ASSERT_TRUE(readiness_.Check(3));
  ASSERT_TRUE(readiness_.IsSystemReady());
  ASSERT_EQ(3, readiness_.ReadyTime());
  ASSERT_EQ(1, called);
}

TEST_F(ReadinessTest, ReadinessLatches) {
  int called = 0;
  readiness_.AddSystemReadyCallback([&called]() { called++; });
  monitor_.AddService("security", "security");
  monitor_.AddService("core", "core");
  monitor_.UpdateHealth("security", HealthStatus::kHealthy);
  monitor_.UpdateHealth("core", HealthStatus::kHealthy);
  ASSERT_TRUE(readiness_.Check(10));

  monitor_.UpdateHealth("core", HealthStatus::kUnhealthy);
  ASSERT_TRUE(readiness_.Check(11));
  ASSERT_TRUE(readiness_.IsSystemReady());
  ASSERT_EQ(10, readiness_.ReadyTime());

  // Callbacks run once.
  ASSERT_EQ(1, called);
}

TEST_F(ReadinessTest, LateCallbackRunsImmediately) {
  monitor_.AddService("security", "security");
  monitor_.AddService("core", "core");
  monitor_.UpdateHealth("security", HealthStatus::kHealthy);
  monitor_.UpdateHealth("core", HealthStatus::kHealthy);
  ASSERT_TRUE(readiness_.Check());

  bool called = false;
  readiness_.AddSystemReadyCallback([&called]() { called = true; });
  ASSERT_TRUE(called);
}

TEST_F(ReadinessTest, StatusLoggedAtInterval) {
  ASSERT_FALSE(readiness_.Check(1));
  ASSERT_EQ(1, describe_calls_);

  // Not again until the log interval has passed.
  ASSERT_FALSE(readiness_.Check(2));
  ASSERT_EQ(1, describe_calls_);

  uint64_t later = 1 + uint64_t(ReadinessManager::kLogInterval.count());
  ASSERT_FALSE(readiness_.Check(later));
  ASSERT_EQ(2, describe_calls_);
}

TEST_F(ReadinessTest, RunOnScheduler) {
  co::CoroutineScheduler scheduler;
  toolbelt::TriggerFd stop;
  ASSERT_TRUE(stop.Open().ok());

  bool called = false;
  readiness_.AddSystemReadyCallback([&called]() { called = true; });

  monitor_.AddService("security", "security");
  monitor_.AddService("core", "core");

  co::Coroutine runner(scheduler, [this, &stop](co::Coroutine *c) {
    readiness_.Run(c, 20ms, stop.GetPollFd().Fd());
  });

  co::Coroutine heartbeats(scheduler, [this](co::Coroutine *c) {
    c->Millisleep(50);
    monitor_.UpdateHealth("security", HealthStatus::kHealthy);
    c->Millisleep(50);
    monitor_.UpdateHealth("core", HealthStatus::kHealthy);
  });

  scheduler.Run();
  ASSERT_TRUE(readiness_.IsSystemReady());
  ASSERT_TRUE(called);
}

TEST_F(ReadinessTest, RunStopsOnTrigger) {
  co::CoroutineScheduler scheduler;
  toolbelt::TriggerFd stop;
  ASSERT_TRUE(stop.Open().ok());

  co::Coroutine runner(scheduler, [this, &stop](co::Coroutine *c) {
    readiness_.Run(c, 20ms, stop.GetPollFd().Fd());
  });
  co::Coroutine stopper(scheduler, [&stop](co::Coroutine *c) {
    c->Millisleep(100);
    stop.Trigger();
  });

  scheduler.Run();
  ASSERT_FALSE(readiness_.IsSystemReady());
}
