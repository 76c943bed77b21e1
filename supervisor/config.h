// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "proto/config.pb.h"
#include "toolbelt/logging.h"

namespace overseer::supervisor {

using namespace std::chrono_literals;

enum class RestartPolicy {
  kNever,
  kOnFailure,
  kAlways,
};

inline const char *RestartPolicyName(RestartPolicy p) {
  switch (p) {
  case RestartPolicy::kNever:
    return "never";
  case RestartPolicy::kOnFailure:
    return "on-failure";
  case RestartPolicy::kAlways:
    return "always";
  }
  return "unknown";
}

constexpr int kDefaultMaxRestarts = 3;
constexpr std::chrono::seconds kDefaultGracePeriod = 30s;
constexpr int kDefaultSupervisorPort = 50000;
constexpr char kDefaultInstanceGroup[] = "default";

// Declared identity of a configured service.  Built from the configuration
// file at startup and never changed afterwards.
struct ServiceDescriptor {
  std::string name;
  std::string executable;
  std::vector<std::string> args;
  absl::flat_hash_map<std::string, std::string> environment;
  int port = 0;          // Internal RPC port.  Subject to the port offset.
  int external_port = 0; // Never offset.
  int rest_api_port = 0; // Never offset.
  std::vector<std::string> dependencies;
  bool required = false;
  bool enabled = false;
  absl::flat_hash_map<std::string, std::string> config;
  RestartPolicy restart_policy = RestartPolicy::kNever;
  int max_restarts = kDefaultMaxRestarts;
  std::chrono::seconds grace_period = kDefaultGracePeriod;

  void FromProto(const config::Service &src);
};

// Everything the supervisor reads from its configuration file, with
// defaults applied.
struct SupervisorConfig {
  int port = kDefaultSupervisorPort;
  std::chrono::seconds health_check_interval = 10s;
  std::chrono::seconds heartbeat_timeout = 30s;
  std::chrono::seconds readiness_poll_interval = 2s;
  std::chrono::seconds shutdown_timeout = 60s;
  std::chrono::seconds registration_timeout = 60s;

  std::string database_name;
  std::string database_user = "overseer";

  std::string keyring_backend = "auto";
  std::string keyring_path;
  std::string keyring_service_name = "overseer";

  std::string instance_group_id = kDefaultInstanceGroup;
  int port_offset = 0;

  std::string log_level = "info";
  std::string log_file;
  int log_retention = 10000;

  std::vector<ServiceDescriptor> services;

  absl::Status FromProto(const config::Config &src);

  // Checks the constraints between fields.
  absl::Status Validate() const;

  const ServiceDescriptor *FindService(const std::string &name) const;

  // Names of the enabled services, each after the services it depends on.
  // Dependency cycles are reported to the logger and broken.
  std::vector<std::string> StartupOrder(toolbelt::Logger &logger) const;

  // The port the supervisor listens on, after the instance offset.
  int ListenPort() const { return ApplyPortOffset(port); }

  int ApplyPortOffset(int base_port) const { return base_port + port_offset; }

  // Address a client of the named service connects to, or empty if the
  // service has no internal port.
  std::string ServiceAddress(const std::string &name) const;

  // Keyring file for this instance group.  Non-default groups get their
  // own file so colocated instances never share credentials.
  std::string KeyringPath() const;

  std::string KeyringServiceName(const std::string &service) const;
};

absl::StatusOr<SupervisorConfig> ParseConfig(const std::string &text);
absl::StatusOr<SupervisorConfig> LoadConfig(const std::filesystem::path &file);

} // namespace overseer::supervisor
