// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "coroutine.h"
#include "supervisor/config.h"
#include "supervisor/supervisor.h"

#include <iostream>
#include <signal.h>

overseer::supervisor::Supervisor *g_supervisor;
co::CoroutineScheduler *g_scheduler;

static void Signal(int sig) {
  if (sig == SIGQUIT && g_scheduler != nullptr) {
    g_scheduler->Show();
  }
  if (g_supervisor != nullptr) {
    g_supervisor->Stop();
  }
  if (sig == SIGINT || sig == SIGTERM) {
    return;
  }
  signal(sig, SIG_DFL);
  raise(sig);
}

ABSL_FLAG(std::string, config, "", "Configuration file (text protobuf)");
ABSL_FLAG(int, port, -1,
          "TCP listening port (default: from config, after the port offset)");
ABSL_FLAG(int, notify_fd, -1, "Notification file descriptor");
ABSL_FLAG(std::string, log_file, "", "Worker log file");
ABSL_FLAG(std::string, listen_address, "",
          "IP Address or hostname to listen on");
ABSL_FLAG(bool, silent, false, "Don't log messages to output");
ABSL_FLAG(std::string, log_level, "",
          "Log level (verbose, debug, info, warning, error)");

int main(int argc, char **argv) {
  absl::ParseCommandLine(argc, argv);

  std::string config_file = absl::GetFlag(FLAGS_config);
  if (config_file.empty()) {
    std::cerr << "No configuration file given (use --config)" << std::endl;
    exit(1);
  }
  absl::StatusOr<overseer::supervisor::SupervisorConfig> config =
      overseer::supervisor::LoadConfig(config_file);
  if (!config.ok()) {
    std::cerr << config.status().ToString() << std::endl;
    exit(1);
  }

  co::CoroutineScheduler scheduler;
  g_scheduler = &scheduler;

  signal(SIGINT, Signal);
  signal(SIGTERM, Signal);
  signal(SIGQUIT, Signal);
  signal(SIGHUP, Signal);
  signal(SIGPIPE, SIG_IGN);

  std::string listen_addr = absl::GetFlag(FLAGS_listen_address);
  int listen_port = absl::GetFlag(FLAGS_port);
  if (listen_port < 0) {
    listen_port = config->ListenPort();
  }
  toolbelt::InetAddress supervisor_addr(
      listen_addr.empty() ? toolbelt::InetAddress::AnyAddress(listen_port)
                          : toolbelt::InetAddress(listen_addr, listen_port));

  auto supervisor = std::make_unique<overseer::supervisor::Supervisor>(
      scheduler, std::move(*config), supervisor_addr,
      !absl::GetFlag(FLAGS_silent), absl::GetFlag(FLAGS_log_file),
      absl::GetFlag(FLAGS_log_level), absl::GetFlag(FLAGS_notify_fd));
  g_supervisor = supervisor.get();

  if (absl::Status status = supervisor->Run(); !status.ok()) {
    std::cerr << "Failed to run supervisor: " << status.ToString()
              << std::endl;
    exit(1);
  }
}
