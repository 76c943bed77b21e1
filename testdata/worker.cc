// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

// Test service.  Registers with the supervisor, heartbeats and unregisters
// when told to terminate.  Arguments:
//   --supervisor=host:port  supervisor address (required)
//   --name=<name>           service name (default: $OVERSEER_SERVICE_NAME)
//   exit_before_register    exit immediately with status 1
//   unhealthy               report unhealthy instead of healthy
//   ignore_signal           ignore SIGTERM
//   exit_after=<n>          exit with status 2 after n heartbeats

#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "supervisor/client/client.h"
#include <iostream>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

static volatile sig_atomic_t g_terminate = 0;

static void Signal(int sig) { g_terminate = 1; }

static void IgnoredSignal(int sig) { printf("Signal %d ignored\n", sig); }

int main(int argc, char **argv) {
  absl::InitializeSymbolizer(argv[0]);

  absl::InstallFailureSignalHandler({
      .use_alternate_stack = false,
  });

  std::string supervisor;
  std::string name;
  bool exit_before_register = false;
  bool unhealthy = false;
  bool ignore_signal = false;
  int exit_after = -1;

  if (char *env = getenv("OVERSEER_SERVICE_NAME"); env != nullptr) {
    name = env;
  }
  for (int i = 1; i < argc; i++) {
    std::string_view arg = argv[i];
    if (absl::ConsumePrefix(&arg, "--supervisor=")) {
      supervisor = std::string(arg);
    } else if (absl::ConsumePrefix(&arg, "--name=")) {
      name = std::string(arg);
    } else if (absl::ConsumePrefix(&arg, "exit_after=")) {
      if (!absl::SimpleAtoi(arg, &exit_after)) {
        fprintf(stderr, "Bad exit_after value %s\n", argv[i]);
        exit(1);
      }
    } else if (arg == "exit_before_register") {
      exit_before_register = true;
    } else if (arg == "unhealthy") {
      unhealthy = true;
    } else if (arg == "ignore_signal") {
      ignore_signal = true;
    }
  }

  if (exit_before_register) {
    printf("Exiting before register\n");
    return 1;
  }

  std::vector<std::string> parts = absl::StrSplit(supervisor, ':');
  int port = 0;
  if (parts.size() != 2 || !absl::SimpleAtoi(parts[1], &port)) {
    fprintf(stderr, "Bad supervisor address '%s'\n", supervisor.c_str());
    exit(1);
  }

  if (ignore_signal) {
    signal(SIGTERM, IgnoredSignal);
  } else {
    signal(SIGTERM, Signal);
  }
  signal(SIGINT, Signal);

  overseer::client::Client client;
  if (absl::Status status =
          client.Init(toolbelt::InetAddress(parts[0], port), name);
      !status.ok()) {
    std::cerr << "Failed to connect to supervisor: " << status << std::endl;
    exit(1);
  }

  overseer::ServiceInfo info = {.name = name,
                                .version = "1.0",
                                .instance_id = absl::StrFormat("%d", getpid()),
                                .host = "localhost"};
  overseer::ServiceCapabilities caps = {.supports_graceful_shutdown = true};
  absl::StatusOr<overseer::client::Registration> reg =
      client.RegisterService(info, caps);
  if (!reg.ok()) {
    std::cerr << reg.status() << std::endl;
    exit(1);
  }
  printf("Registered %s as %s\n", name.c_str(), reg->service_id.c_str());

  overseer::LogMessage msg = {
      .source = name,
      .service_id = reg->service_id,
      .text = absl::StrFormat("%s running as pid %d", name, getpid()),
      .timestamp = overseer::NowNs()};
  if (absl::StatusOr<int64_t> n = client.SendLogs({msg}, true); !n.ok()) {
    std::cerr << n.status() << std::endl;
  }

  overseer::HealthStatus health = unhealthy
                                      ? overseer::HealthStatus::kUnhealthy
                                      : overseer::HealthStatus::kHealthy;
  for (int beats = 0; g_terminate == 0; beats++) {
    if (exit_after >= 0 && beats >= exit_after) {
      printf("Exiting after %d heartbeats\n", beats);
      return 2;
    }
    absl::StatusOr<std::vector<overseer::ServiceCommand>> commands =
        client.Heartbeat(reg->service_id, health);
    if (!commands.ok()) {
      std::cerr << commands.status() << std::endl;
      exit(1);
    }
    for (auto &cmd : *commands) {
      printf("Command %s\n", overseer::CommandTypeName(cmd.type));
    }
    fflush(stdout);
    usleep(200000);
  }

  if (absl::Status status =
          client.UnregisterService(reg->service_id, "terminated");
      !status.ok()) {
    std::cerr << status << std::endl;
    exit(1);
  }
  return 0;
}
