// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <cstdint>
#include <ctime>
#include <iostream>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "proto/control.pb.h"

namespace overseer {

// Wall clock time in nanoseconds since the epoch.  All timestamps that
// cross the wire use this.
inline uint64_t NowNs() {
  struct timespec now_ts;
  clock_gettime(CLOCK_REALTIME, &now_ts);
  return uint64_t(now_ts.tv_sec) * 1000000000ULL + now_ts.tv_nsec;
}

// Health of a registered service.  STOPPED is terminal and only entered
// when the service unregisters.
enum class HealthStatus {
  kUnknown,
  kStarting,
  kHealthy,
  kDegraded,
  kUnhealthy,
  kStopped,
};

// Lifecycle state of a registered service.
enum class ServiceState {
  kUnspecified,
  kStarting,
  kRunning,
  kStopping,
  kStopped,
};

inline const char *HealthStatusName(HealthStatus s) {
  switch (s) {
  case HealthStatus::kStarting:
    return "starting";
  case HealthStatus::kHealthy:
    return "healthy";
  case HealthStatus::kDegraded:
    return "degraded";
  case HealthStatus::kUnhealthy:
    return "unhealthy";
  case HealthStatus::kStopped:
    return "stopped";
  case HealthStatus::kUnknown:
    break;
  }
  return "unknown";
}

inline const char *ServiceStateName(ServiceState s) {
  switch (s) {
  case ServiceState::kStarting:
    return "starting";
  case ServiceState::kRunning:
    return "running";
  case ServiceState::kStopping:
    return "stopping";
  case ServiceState::kStopped:
    return "stopped";
  case ServiceState::kUnspecified:
    break;
  }
  return "unspecified";
}

inline std::ostream &operator<<(std::ostream &os, HealthStatus s) {
  os << HealthStatusName(s);
  return os;
}

inline std::ostream &operator<<(std::ostream &os, ServiceState s) {
  os << ServiceStateName(s);
  return os;
}

// Healthy and degraded services are both operational.
inline bool IsOperational(HealthStatus s) {
  return s == HealthStatus::kHealthy || s == HealthStatus::kDegraded;
}

proto::HealthStatus HealthStatusToProto(HealthStatus s);
HealthStatus HealthStatusFromProto(proto::HealthStatus s);
proto::ServiceState ServiceStateToProto(ServiceState s);
ServiceState ServiceStateFromProto(proto::ServiceState s);

struct HealthUpdate {
  std::string service_id;
  std::string name;
  HealthStatus old_status = HealthStatus::kUnknown;
  HealthStatus new_status = HealthStatus::kUnknown;
  uint64_t timestamp = 0;

  void ToProto(proto::HealthUpdate *dest) const;
  void FromProto(const proto::HealthUpdate &src);
};

struct ServiceMetrics {
  int64_t memory_usage_bytes = 0;
  double cpu_usage_percent = 0;
  int64_t threads = 0;
  absl::flat_hash_map<std::string, double> custom_metrics;

  void ToProto(proto::ServiceMetrics *dest) const;
  void FromProto(const proto::ServiceMetrics &src);
};

struct ServiceCommand {
  enum class Type {
    kUnspecified,
    kReloadConfig,
    kRotateLogs,
    kCollectMetrics,
    kCustom,
  };
  Type type = Type::kUnspecified;
  absl::flat_hash_map<std::string, std::string> parameters;

  void ToProto(proto::ServiceCommand *dest) const;
  void FromProto(const proto::ServiceCommand &src);
};

inline const char *CommandTypeName(ServiceCommand::Type t) {
  switch (t) {
  case ServiceCommand::Type::kReloadConfig:
    return "reload-config";
  case ServiceCommand::Type::kRotateLogs:
    return "rotate-logs";
  case ServiceCommand::Type::kCollectMetrics:
    return "collect-metrics";
  case ServiceCommand::Type::kCustom:
    return "custom";
  case ServiceCommand::Type::kUnspecified:
    break;
  }
  return "unspecified";
}

} // namespace overseer
