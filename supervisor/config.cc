// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/config.h"
#include "supervisor/port_offset.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_format.h"
#include "toolbelt/fd.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/text_format.h>

namespace overseer::supervisor {

void ServiceDescriptor::FromProto(const config::Service &src) {
  name = src.name();
  executable = src.executable();
  args.assign(src.args().begin(), src.args().end());
  environment.clear();
  for (auto & [ var, value ] : src.environment()) {
    environment[var] = value;
  }
  port = src.port();
  external_port = src.external_port();
  rest_api_port = src.rest_api_port();
  dependencies.assign(src.dependencies().begin(), src.dependencies().end());
  required = src.required();
  enabled = src.enabled();
  config.clear();
  for (auto & [ key, value ] : src.config()) {
    config[key] = value;
  }
  switch (src.restart()) {
  case config::RESTART_ON_FAILURE:
    restart_policy = RestartPolicy::kOnFailure;
    break;
  case config::RESTART_ALWAYS:
    restart_policy = RestartPolicy::kAlways;
    break;
  case config::RESTART_NEVER:
  default:
    restart_policy = RestartPolicy::kNever;
    break;
  }
  max_restarts =
      src.max_restarts() > 0 ? src.max_restarts() : kDefaultMaxRestarts;
  grace_period = src.grace_period_secs() > 0
                     ? std::chrono::seconds(src.grace_period_secs())
                     : kDefaultGracePeriod;
}

absl::Status SupervisorConfig::FromProto(const config::Config &src) {
  const config::SupervisorOptions &opts = src.supervisor();
  if (opts.port() != 0) {
    port = opts.port();
  }
  if (opts.health_check_interval_secs() > 0) {
    health_check_interval =
        std::chrono::seconds(opts.health_check_interval_secs());
  }
  if (opts.heartbeat_timeout_secs() > 0) {
    heartbeat_timeout = std::chrono::seconds(opts.heartbeat_timeout_secs());
  }
  if (opts.readiness_poll_interval_secs() > 0) {
    readiness_poll_interval =
        std::chrono::seconds(opts.readiness_poll_interval_secs());
  }
  if (opts.shutdown_timeout_secs() > 0) {
    shutdown_timeout = std::chrono::seconds(opts.shutdown_timeout_secs());
  }
  if (opts.registration_timeout_secs() > 0) {
    registration_timeout =
        std::chrono::seconds(opts.registration_timeout_secs());
  }

  database_name = src.database().name();
  if (!src.database().user().empty()) {
    database_user = src.database().user();
  }

  if (!src.keyring().backend().empty()) {
    keyring_backend = src.keyring().backend();
  }
  keyring_path = src.keyring().path();
  if (!src.keyring().service_name().empty()) {
    keyring_service_name = src.keyring().service_name();
  }

  if (!src.instance_group().group_id().empty()) {
    instance_group_id = src.instance_group().group_id();
  }
  port_offset = src.instance_group().port_offset();

  if (!src.logging().level().empty()) {
    log_level = src.logging().level();
  }
  log_file = src.logging().file();
  if (src.logging().retention_entries() > 0) {
    log_retention = src.logging().retention_entries();
  }

  absl::flat_hash_set<std::string> names;
  for (auto &s : src.service()) {
    if (s.name().empty()) {
      return absl::InvalidArgumentError("Service with no name");
    }
    if (!names.insert(s.name()).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate service %s", s.name()));
    }
    ServiceDescriptor desc;
    desc.FromProto(s);
    services.push_back(std::move(desc));
  }
  return Validate();
}

absl::Status SupervisorConfig::Validate() const {
  if (database_name.empty()) {
    return absl::InvalidArgumentError(
        "database.name is required in the configuration");
  }
  if (heartbeat_timeout <= health_check_interval) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Heartbeat timeout (%ds) must be longer than the health check "
        "interval (%ds)",
        heartbeat_timeout.count(), health_check_interval.count()));
  }
  if (port_offset < 0 || ListenPort() > kMaxPort) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid port offset %d", port_offset));
  }
  for (auto &s : services) {
    if (!s.enabled) {
      continue;
    }
    if (s.executable.empty()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Enabled service %s has no executable", s.name));
    }
    if (s.port > 0 && ApplyPortOffset(s.port) > kMaxPort) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Port %d of service %s is out of range with port "
                          "offset %d",
                          s.port, s.name, port_offset));
    }
    for (auto &arg : s.args) {
      if (std::optional<int> p = InternalPort(arg);
          p.has_value() && ApplyPortOffset(*p) > kMaxPort) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Argument %s of service %s is out of range with port offset %d",
            arg, s.name, port_offset));
      }
    }
  }
  return absl::OkStatus();
}

const ServiceDescriptor *
SupervisorConfig::FindService(const std::string &name) const {
  for (auto &s : services) {
    if (s.name == name) {
      return &s;
    }
  }
  return nullptr;
}

std::vector<std::string>
SupervisorConfig::StartupOrder(toolbelt::Logger &logger) const {
  absl::flat_hash_set<std::string> visited;
  absl::flat_hash_set<std::string> visiting;
  std::vector<std::string> order;

  // Depth first, emitting a service after all its dependencies.  Returns
  // false if a cycle was found through this service.
  std::function<bool(const std::string &)> visit =
      [&](const std::string &name) -> bool {
    if (visited.contains(name)) {
      return true;
    }
    if (visiting.contains(name)) {
      logger.Log(toolbelt::LogLevel::kWarning,
                 "Circular dependency detected involving service %s",
                 name.c_str());
      return false;
    }
    const ServiceDescriptor *desc = FindService(name);
    if (desc == nullptr || !desc->enabled) {
      // Disabled and unknown services are not started.
      visited.insert(name);
      return true;
    }
    visiting.insert(name);
    for (auto &dep : desc->dependencies) {
      if (!visit(dep)) {
        logger.Log(toolbelt::LogLevel::kWarning,
                   "Failed to resolve dependency %s for service %s",
                   dep.c_str(), name.c_str());
      }
    }
    visiting.erase(name);
    visited.insert(name);
    order.push_back(name);
    return true;
  };

  for (auto &s : services) {
    if (s.enabled) {
      visit(s.name);
    }
  }
  return order;
}

std::string SupervisorConfig::ServiceAddress(const std::string &name) const {
  const ServiceDescriptor *desc = FindService(name);
  if (desc == nullptr || desc->port == 0) {
    return "";
  }
  return absl::StrFormat("localhost:%d", ApplyPortOffset(desc->port));
}

std::string SupervisorConfig::KeyringPath() const {
  bool isolated = instance_group_id != kDefaultInstanceGroup;
  if (!keyring_path.empty()) {
    return isolated ? absl::StrFormat("%s-%s", keyring_path, instance_group_id)
                    : keyring_path;
  }
  const char *home = getenv("HOME");
  if (home == nullptr || home[0] == '\0') {
    return isolated
               ? absl::StrFormat("/tmp/overseer-keyring-%s.json",
                                 instance_group_id)
               : std::string("/tmp/overseer-keyring.json");
  }
  return isolated ? absl::StrFormat("%s/.local/share/overseer/keyring-%s.json",
                                    home, instance_group_id)
                  : absl::StrFormat("%s/.local/share/overseer/keyring.json",
                                    home);
}

std::string
SupervisorConfig::KeyringServiceName(const std::string &service) const {
  if (instance_group_id != kDefaultInstanceGroup) {
    return absl::StrFormat("%s-%s-%s", keyring_service_name, instance_group_id,
                           service);
  }
  return absl::StrFormat("%s-%s", keyring_service_name, service);
}

absl::StatusOr<SupervisorConfig> ParseConfig(const std::string &text) {
  config::Config proto;
  if (!google::protobuf::TextFormat::ParseFromString(text, &proto)) {
    return absl::InvalidArgumentError("Failed to parse configuration");
  }
  SupervisorConfig config;
  if (absl::Status status = config.FromProto(proto); !status.ok()) {
    return status;
  }
  return config;
}

absl::StatusOr<SupervisorConfig> LoadConfig(const std::filesystem::path &file) {
  toolbelt::FileDescriptor fd(open(file.c_str(), O_RDONLY));
  if (!fd.Valid()) {
    return absl::NotFoundError(absl::StrFormat(
        "Failed to open config file %s: %s", file.string(), strerror(errno)));
  }

  google::protobuf::io::FileInputStream in(fd.Fd());
  config::Config proto;
  if (!google::protobuf::TextFormat::Parse(&in, &proto)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Failed to parse config file %s", file.string()));
  }
  SupervisorConfig config;
  if (absl::Status status = config.FromProto(proto); !status.ok()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "%s: %s", file.string(), status.message()));
  }
  return config;
}

} // namespace overseer::supervisor
