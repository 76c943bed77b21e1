// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "absl/container/flat_hash_set.h"
#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/strings/str_format.h"
#include "supervisor/client/client.h"
#include "supervisor/supervisor.h"
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <signal.h>
#include <thread>
#include <unistd.h>

#ifndef OVERSEER_TEST_WORKER
#define OVERSEER_TEST_WORKER "testdata/worker"
#endif

ABSL_FLAG(std::string, worker, OVERSEER_TEST_WORKER, "Worker executable");

using Client = overseer::client::Client;
using Event = overseer::Event;
using EventType = overseer::EventType;
using HealthStatus = overseer::HealthStatus;
using ServiceState = overseer::ServiceState;
using Supervisor = overseer::supervisor::Supervisor;
using SupervisorConfig = overseer::supervisor::SupervisorConfig;
using ServiceDescriptor = overseer::supervisor::ServiceDescriptor;

using namespace std::chrono_literals;

void SignalHandler(int sig);

static ServiceDescriptor Worker(const std::string &name, int supervisor_port,
                                std::vector<std::string> extra_args = {}) {
  ServiceDescriptor desc = {
      .name = name,
      .executable = absl::GetFlag(FLAGS_worker),
      .args = {absl::StrFormat("--supervisor=localhost:%d", supervisor_port)},
      .required = true,
      .enabled = true};
  for (auto &arg : extra_args) {
    desc.args.push_back(arg);
  }
  return desc;
}

// One supervisor running in a thread.
class SupervisorRunner {
public:
  void Start(SupervisorConfig config) {
    // The supervisor writes to this pipe when it has started and when it
    // has stopped.  This end of the pipe is blocking.
    (void)pipe(pipe_);

    addr_ = toolbelt::InetAddress("localhost", config.ListenPort());
    supervisor_ = std::make_unique<Supervisor>(scheduler_, std::move(config),
                                               addr_, true, "", "debug",
                                               pipe_[1]);
    thread_ = std::make_unique<std::thread>([this]() {
      absl::Status s = supervisor_->Run();
      if (!s.ok()) {
        fprintf(stderr, "Error running supervisor: %s\n",
                s.ToString().c_str());
        exit(1);
      }
    });

    int64_t val;
    (void)::read(pipe_[0], &val, sizeof(val));
    std::cout << "supervisor running\n";
  }

  void Stop() {
    supervisor_->Stop();
    int64_t val;
    (void)::read(pipe_[0], &val, sizeof(val));
    thread_->join();
    close(pipe_[0]);
    close(pipe_[1]);
  }

  const toolbelt::InetAddress &Addr() const { return addr_; }
  Supervisor &Get() { return *supervisor_; }

private:
  co::CoroutineScheduler scheduler_;
  toolbelt::InetAddress addr_;
  std::unique_ptr<Supervisor> supervisor_;
  std::unique_ptr<std::thread> thread_;
  int pipe_[2];
};

class ClientTest : public ::testing::Test {
public:
  static constexpr int kPort = 6640;

  // We run one server for the duration of the whole test suite.
  static void SetUpTestSuite() {
    printf("Starting supervisor\n");
    SupervisorConfig config;
    config.port = kPort;
    config.health_check_interval = 1s;
    config.heartbeat_timeout = 3s;
    config.readiness_poll_interval = 1s;
    config.shutdown_timeout = 20s;
    config.registration_timeout = 20s;
    config.database_name = "test";
    config.services.push_back(Worker("security", kPort));
    ServiceDescriptor core = Worker("core", kPort);
    core.dependencies = {"security"};
    core.grace_period = 5s;
    config.services.push_back(core);
    config.services.push_back(
        {.name = "reports", .executable = "/bin/true", .enabled = false});

    runner_ = new SupervisorRunner();
    runner_->Start(std::move(config));
    signal(SIGINT, SignalHandler);
  }

  static void TearDownTestSuite() {
    printf("Stopping supervisor\n");
    runner_->Stop();
    delete runner_;
    runner_ = nullptr;
  }

  void SetUp() override { signal(SIGPIPE, SIG_IGN); }

  void InitClient(Client &client, const std::string &name,
                  int event_mask = overseer::kNoEvents) {
    absl::Status s = client.Init(runner_->Addr(), name, event_mask);
    std::cout << "Init status: " << s << std::endl;
    ASSERT_TRUE(s.ok());
  }

  void WaitForReady() {
    Client client;
    InitClient(client, "ready", overseer::kReadyEvents);
    for (;;) {
      absl::StatusOr<std::shared_ptr<Event>> e = client.WaitForEvent();
      ASSERT_TRUE(e.ok()) << e.status();
      if ((*e)->type == EventType::kReady) {
        ASSERT_NE(0, std::get<2>((*e)->event).ready_time);
        return;
      }
    }
  }

  overseer::HealthUpdate NextHealthUpdate(Client &client, int watch_id) {
    for (;;) {
      absl::StatusOr<std::shared_ptr<Event>> e = client.WaitForEvent();
      EXPECT_TRUE(e.ok()) << e.status();
      if (!e.ok()) {
        return {};
      }
      if ((*e)->type != EventType::kHealthUpdate) {
        continue;
      }
      auto &watched = std::get<0>((*e)->event);
      EXPECT_EQ(watch_id, watched.watch_id);
      return watched.update;
    }
  }

  static SupervisorRunner *runner_;
};

SupervisorRunner *ClientTest::runner_;

void SignalHandler(int sig) {
  printf("Signal %d\n", sig);
  if (ClientTest::runner_ != nullptr) {
    ClientTest::runner_->Get().Stop();
  }
  signal(sig, SIG_DFL);
  raise(sig);
}

TEST_F(ClientTest, SystemReady) {
  WaitForReady();

  Client client;
  InitClient(client, "readiness");
  absl::StatusOr<overseer::client::Readiness> r = client.GetReadiness();
  ASSERT_TRUE(r.ok()) << r.status();
  ASSERT_TRUE(r->ready);
  ASSERT_NE(0, r->ready_time);
  ASSERT_EQ("healthy", r->services["security"]);
  ASSERT_EQ("healthy", r->services["core"]);
  ASSERT_EQ("disabled", r->services["reports"]);
}

TEST_F(ClientTest, ListServices) {
  WaitForReady();
  Client client;
  InitClient(client, "list");

  absl::StatusOr<std::vector<overseer::ServiceStatus>> services =
      client.ListServices();
  ASSERT_TRUE(services.ok()) << services.status();
  ASSERT_EQ(2, services->size());
  ASSERT_EQ("core", (*services)[0].info.name);
  ASSERT_EQ("security", (*services)[1].info.name);
  for (auto &s : *services) {
    ASSERT_EQ(ServiceState::kRunning, s.state);
    ASSERT_EQ(HealthStatus::kHealthy, s.health);
    ASSERT_TRUE(s.capabilities.supports_graceful_shutdown);
    ASSERT_NE(0, s.last_heartbeat);
  }

  services = client.ListServices(ServiceState::kUnspecified, "sec*");
  ASSERT_TRUE(services.ok());
  ASSERT_EQ(1, services->size());

  services = client.ListServices(ServiceState::kStopping);
  ASSERT_TRUE(services.ok());
  ASSERT_EQ(0, services->size());
}

TEST_F(ClientTest, RegisterAndHeartbeat) {
  Client client;
  InitClient(client, "external");

  absl::StatusOr<overseer::client::Registration> reg =
      client.RegisterService({.name = "external", .instance_id = "x1"});
  ASSERT_TRUE(reg.ok()) << reg.status();
  ASSERT_FALSE(reg->service_id.empty());
  // Not a configured service.
  ASSERT_TRUE(reg->config.config.empty());

  absl::StatusOr<overseer::ServiceStatus> status =
      client.GetServiceStatus(reg->service_id);
  ASSERT_TRUE(status.ok()) << status.status();
  ASSERT_EQ(ServiceState::kStarting, status->state);

  absl::StatusOr<std::vector<overseer::ServiceCommand>> cmds =
      client.Heartbeat(reg->service_id, HealthStatus::kHealthy,
                       {.memory_usage_bytes = 4096});
  ASSERT_TRUE(cmds.ok()) << cmds.status();
  ASSERT_TRUE(cmds->empty());

  status = client.GetServiceStatus(reg->service_id);
  ASSERT_TRUE(status.ok());
  ASSERT_EQ(ServiceState::kRunning, status->state);
  ASSERT_EQ(HealthStatus::kHealthy, status->health);
  ASSERT_EQ(4096, status->metrics.memory_usage_bytes);

  // Commands are delivered on the next heartbeat.
  ASSERT_TRUE(client
                  .QueueCommand(reg->service_id,
                                {.type = overseer::ServiceCommand::Type::
                                     kRotateLogs})
                  .ok());
  cmds = client.Heartbeat(reg->service_id, HealthStatus::kHealthy);
  ASSERT_TRUE(cmds.ok());
  ASSERT_EQ(1, cmds->size());
  ASSERT_EQ(overseer::ServiceCommand::Type::kRotateLogs, (*cmds)[0].type);

  ASSERT_TRUE(client.UnregisterService(reg->service_id, "test done").ok());
  ASSERT_FALSE(client.GetServiceStatus(reg->service_id).ok());
  ASSERT_FALSE(client.Heartbeat(reg->service_id, HealthStatus::kHealthy).ok());
  ASSERT_FALSE(client.UnregisterService(reg->service_id).ok());
}

TEST_F(ClientTest, WatchHealth) {
  Client watcher;
  InitClient(watcher, "watcher", overseer::kHealthEvents);
  Client service;
  InitClient(service, "watched");

  absl::StatusOr<overseer::client::Registration> reg =
      service.RegisterService({.name = "watched"});
  ASSERT_TRUE(reg.ok()) << reg.status();

  absl::StatusOr<int> watch_id = watcher.WatchServiceHealth({reg->service_id});
  ASSERT_TRUE(watch_id.ok()) << watch_id.status();

  ASSERT_TRUE(service.Heartbeat(reg->service_id, HealthStatus::kHealthy).ok());
  overseer::HealthUpdate u = NextHealthUpdate(watcher, *watch_id);
  ASSERT_EQ(reg->service_id, u.service_id);
  ASSERT_EQ("watched", u.name);
  ASSERT_EQ(HealthStatus::kStarting, u.old_status);
  ASSERT_EQ(HealthStatus::kHealthy, u.new_status);

  // A repeated status is not an update.
  ASSERT_TRUE(service.Heartbeat(reg->service_id, HealthStatus::kHealthy).ok());
  ASSERT_TRUE(
      service.Heartbeat(reg->service_id, HealthStatus::kDegraded).ok());
  u = NextHealthUpdate(watcher, *watch_id);
  ASSERT_EQ(HealthStatus::kHealthy, u.old_status);
  ASSERT_EQ(HealthStatus::kDegraded, u.new_status);

  // Unregistering is the last update.
  ASSERT_TRUE(service.UnregisterService(reg->service_id).ok());
  u = NextHealthUpdate(watcher, *watch_id);
  ASSERT_EQ(HealthStatus::kStopped, u.new_status);

  ASSERT_TRUE(watcher.UnwatchServiceHealth(*watch_id).ok());
  ASSERT_FALSE(watcher.UnwatchServiceHealth(*watch_id).ok());
}

TEST_F(ClientTest, DisconnectCancelsWatches) {
  overseer::supervisor::HealthMonitor &monitor = runner_->Get().Monitor();
  auto wait_for_subscribers = [&monitor](size_t n) {
    for (int i = 0; i < 50 && monitor.NumSubscribers() != n; i++) {
      std::this_thread::sleep_for(100ms);
    }
    return monitor.NumSubscribers();
  };
  // Watchers from earlier tests have all disconnected.
  ASSERT_EQ(0, wait_for_subscribers(0));

  Client watcher;
  InitClient(watcher, "dropper", overseer::kHealthEvents);
  ASSERT_TRUE(watcher.WatchServiceHealth().ok());
  ASSERT_TRUE(watcher.WatchServiceHealth({"nonexistent"}).ok());
  ASSERT_EQ(2, monitor.NumSubscribers());

  // Go away without unwatching.
  watcher.Close();
  ASSERT_EQ(0, wait_for_subscribers(0));

  // Updates still flow to everyone else.
  Client other;
  InitClient(other, "other", overseer::kHealthEvents);
  absl::StatusOr<int> watch_id = other.WatchServiceHealth();
  ASSERT_TRUE(watch_id.ok());
  absl::StatusOr<overseer::client::Registration> reg =
      other.RegisterService({.name = "after-drop"});
  ASSERT_TRUE(reg.ok());
  ASSERT_TRUE(other.Heartbeat(reg->service_id, HealthStatus::kHealthy).ok());
  ASSERT_TRUE(
      other.WaitForHealth(reg->service_id, HealthStatus::kHealthy).ok());
  ASSERT_TRUE(other.UnregisterService(reg->service_id).ok());
}

TEST_F(ClientTest, HeartbeatTimeout) {
  Client watcher;
  InitClient(watcher, "watcher", overseer::kHealthEvents);
  Client service;
  InitClient(service, "silent");

  absl::StatusOr<overseer::client::Registration> reg =
      service.RegisterService({.name = "silent"});
  ASSERT_TRUE(reg.ok()) << reg.status();
  absl::StatusOr<int> watch_id = watcher.WatchServiceHealth({reg->service_id});
  ASSERT_TRUE(watch_id.ok());

  ASSERT_TRUE(service.Heartbeat(reg->service_id, HealthStatus::kHealthy).ok());
  auto start = std::chrono::steady_clock::now();
  overseer::HealthUpdate u = NextHealthUpdate(watcher, *watch_id);
  ASSERT_EQ(HealthStatus::kHealthy, u.new_status);

  // Now go quiet.
  u = NextHealthUpdate(watcher, *watch_id);
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_EQ(HealthStatus::kUnhealthy, u.new_status);
  ASSERT_GE(elapsed, 3s);
  ASSERT_LT(elapsed, 8s);

  ASSERT_TRUE(service.UnregisterService(reg->service_id).ok());
}

TEST_F(ClientTest, WatchAll) {
  Client watcher;
  InitClient(watcher, "watch-all", overseer::kHealthEvents);
  absl::StatusOr<int> watch_id = watcher.WatchServiceHealth();
  ASSERT_TRUE(watch_id.ok());

  Client a;
  InitClient(a, "a");
  Client b;
  InitClient(b, "b");
  absl::StatusOr<overseer::client::Registration> ra =
      a.RegisterService({.name = "a"});
  ASSERT_TRUE(ra.ok());
  absl::StatusOr<overseer::client::Registration> rb =
      b.RegisterService({.name = "b"});
  ASSERT_TRUE(rb.ok());

  ASSERT_TRUE(a.Heartbeat(ra->service_id, HealthStatus::kHealthy).ok());
  ASSERT_TRUE(b.Heartbeat(rb->service_id, HealthStatus::kHealthy).ok());

  absl::flat_hash_set<std::string> seen;
  while (seen.size() < 2) {
    overseer::HealthUpdate u = NextHealthUpdate(watcher, *watch_id);
    if (u.new_status == HealthStatus::kHealthy) {
      seen.insert(u.service_id);
    }
  }
  ASSERT_TRUE(seen.contains(ra->service_id));
  ASSERT_TRUE(seen.contains(rb->service_id));

  ASSERT_TRUE(a.UnregisterService(ra->service_id).ok());
  ASSERT_TRUE(b.UnregisterService(rb->service_id).ok());
}

TEST_F(ClientTest, StopAndStartService) {
  WaitForReady();
  Client client;
  InitClient(client, "operator");

  absl::StatusOr<std::vector<overseer::ServiceStatus>> services =
      client.ListServices(ServiceState::kUnspecified, "core");
  ASSERT_TRUE(services.ok());
  ASSERT_EQ(1, services->size());
  std::string id = (*services)[0].service_id;

  ASSERT_TRUE(client.StopService(id).ok());
  ASSERT_FALSE(client.GetServiceStatus(id).ok());

  // Readiness is latched.
  absl::StatusOr<overseer::client::Readiness> r = client.GetReadiness();
  ASSERT_TRUE(r.ok());
  ASSERT_TRUE(r->ready);
  ASSERT_EQ("not started (required)", r->services["core"]);

  ASSERT_TRUE(client.StartService("core").ok());
  services = client.ListServices(ServiceState::kUnspecified, "core");
  ASSERT_TRUE(services.ok());
  ASSERT_EQ(1, services->size());
  ASSERT_NE(id, (*services)[0].service_id);

  // Already running.
  ASSERT_FALSE(client.StartService("core").ok());
}

TEST_F(ClientTest, Errors) {
  Client client;
  InitClient(client, "errors");
  ASSERT_FALSE(client.StartService("nonexistent").ok());
  ASSERT_FALSE(client.StartService("reports").ok());
  ASSERT_FALSE(client.StopService("bogus").ok());
  ASSERT_FALSE(client.GetServiceStatus("bogus").ok());
  ASSERT_FALSE(client.QueueCommand("bogus", {}).ok());
  ASSERT_FALSE(client.RegisterService({}).ok());
}

TEST_F(ClientTest, StopUnownedService) {
  Client client;
  InitClient(client, "unowned");
  absl::StatusOr<overseer::client::Registration> reg =
      client.RegisterService({.name = "unowned"});
  ASSERT_TRUE(reg.ok());
  ASSERT_FALSE(client.StopService(reg->service_id).ok());
  ASSERT_TRUE(client.UnregisterService(reg->service_id).ok());
}

TEST_F(ClientTest, Logs) {
  Client listener;
  InitClient(listener, "log-listener", overseer::kLogMessageEvents);

  Client client;
  InitClient(client, "logger");
  uint64_t now = overseer::NowNs();
  std::vector<overseer::LogMessage> entries = {
      {.source = "logger", .text = "first", .timestamp = now},
      {.source = "logger",
       .level = toolbelt::LogLevel::kError,
       .text = "second",
       .timestamp = now + 1}};
  absl::StatusOr<int64_t> n = client.SendLogs(entries);
  ASSERT_TRUE(n.ok()) << n.status();
  ASSERT_EQ(2, *n);

  n = client.SendLogs({{.text = "third"}}, true);
  ASSERT_TRUE(n.ok()) << n.status();
  ASSERT_EQ(3, *n);

  // The stream starts again after a close.
  n = client.SendLogs({{.text = "fourth"}}, true);
  ASSERT_TRUE(n.ok());
  ASSERT_EQ(1, *n);

  // Log events are delivered in timestamp order.
  std::vector<std::string> texts;
  while (texts.size() < 2) {
    absl::StatusOr<std::shared_ptr<Event>> e = listener.WaitForEvent();
    ASSERT_TRUE(e.ok()) << e.status();
    if ((*e)->type != EventType::kLog) {
      continue;
    }
    auto &msg = std::get<1>((*e)->event);
    if (msg.source == "logger") {
      texts.push_back(msg.text);
    }
  }
  ASSERT_EQ("first", texts[0]);
  ASSERT_EQ("second", texts[1]);

  // The supervisor keeps the recent entries.  Missing sources are filled in
  // with the client's name.
  absl::StatusOr<std::vector<overseer::LogMessage>> logs =
      client.GetLogs(3, "logger");
  ASSERT_TRUE(logs.ok()) << logs.status();
  ASSERT_EQ(3, logs->size());
  ASSERT_EQ("second", (*logs)[0].text);
  ASSERT_EQ(toolbelt::LogLevel::kError, (*logs)[0].level);
  ASSERT_EQ("third", (*logs)[1].text);
  ASSERT_EQ("fourth", (*logs)[2].text);

  logs = client.GetLogs(0, "nobody");
  ASSERT_TRUE(logs.ok());
  ASSERT_TRUE(logs->empty());
}

// A supervisor of its own: the restart test kills its service repeatedly.
TEST(RestartTest, RestartsFailedService) {
  constexpr int kPort = 6650;
  SupervisorConfig config;
  config.port = kPort;
  config.health_check_interval = 1s;
  config.heartbeat_timeout = 3s;
  config.readiness_poll_interval = 1s;
  config.shutdown_timeout = 20s;
  config.registration_timeout = 20s;
  config.database_name = "test";
  ServiceDescriptor phoenix = Worker("phoenix", kPort, {"exit_after=5"});
  phoenix.restart_policy = overseer::supervisor::RestartPolicy::kOnFailure;
  phoenix.max_restarts = 2;
  config.services.push_back(phoenix);

  SupervisorRunner runner;
  runner.Start(std::move(config));

  Client watcher;
  ASSERT_TRUE(
      watcher.Init(runner.Addr(), "watcher", overseer::kHealthEvents).ok());
  absl::StatusOr<int> watch_id = watcher.WatchServiceHealth();
  ASSERT_TRUE(watch_id.ok());

  // Each incarnation registers with a new id and reports healthy.
  absl::flat_hash_set<std::string> incarnations;
  while (incarnations.size() < 3) {
    absl::StatusOr<std::shared_ptr<Event>> e = watcher.WaitForEvent();
    ASSERT_TRUE(e.ok()) << e.status();
    if ((*e)->type != EventType::kHealthUpdate) {
      continue;
    }
    auto &u = std::get<0>((*e)->event).update;
    if (u.name == "phoenix" && u.new_status == HealthStatus::kHealthy) {
      incarnations.insert(u.service_id);
    }
  }
  runner.Stop();
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  absl::ParseCommandLine(argc, argv);

  return RUN_ALL_TESTS();
}
