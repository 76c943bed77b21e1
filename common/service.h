// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "common/health.h"
#include "proto/control.pb.h"

namespace overseer {

// What a worker says about itself when it registers.
struct ServiceInfo {
  std::string name;
  std::string version;
  std::string instance_id;
  std::string host;
  int port = 0;
  absl::flat_hash_map<std::string, std::string> metadata;

  void ToProto(proto::ServiceInfo *dest) const;
  void FromProto(const proto::ServiceInfo &src);
};

struct ServiceCapabilities {
  std::vector<std::string> features;
  bool supports_hot_reload = false;
  bool supports_graceful_shutdown = false;
  std::vector<std::string> dependencies;

  void ToProto(proto::ServiceCapabilities *dest) const;
  void FromProto(const proto::ServiceCapabilities &src);
};

// Configuration handed back to a worker when it registers.
struct ServiceConfiguration {
  absl::flat_hash_map<std::string, std::string> config;
  absl::flat_hash_map<std::string, std::string> environment;

  void ToProto(proto::ServiceConfiguration *dest) const;
  void FromProto(const proto::ServiceConfiguration &src);
};

// Snapshot of a registered service.
struct ServiceStatus {
  std::string service_id;
  ServiceInfo info;
  ServiceCapabilities capabilities;
  ServiceState state = ServiceState::kUnspecified;
  HealthStatus health = HealthStatus::kUnknown;
  uint64_t started_at = 0;
  uint64_t last_heartbeat = 0;
  uint64_t last_healthy = 0;
  ServiceMetrics metrics;

  void ToProto(proto::ServiceStatus *dest) const;
  void FromProto(const proto::ServiceStatus &src);
};

} // namespace overseer
