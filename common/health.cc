// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/health.h"

namespace overseer {

proto::HealthStatus HealthStatusToProto(HealthStatus s) {
  switch (s) {
  case HealthStatus::kStarting:
    return proto::HEALTH_STARTING;
  case HealthStatus::kHealthy:
    return proto::HEALTH_HEALTHY;
  case HealthStatus::kDegraded:
    return proto::HEALTH_DEGRADED;
  case HealthStatus::kUnhealthy:
    return proto::HEALTH_UNHEALTHY;
  case HealthStatus::kStopped:
    return proto::HEALTH_STOPPED;
  case HealthStatus::kUnknown:
    break;
  }
  return proto::HEALTH_UNKNOWN;
}

HealthStatus HealthStatusFromProto(proto::HealthStatus s) {
  switch (s) {
  case proto::HEALTH_STARTING:
    return HealthStatus::kStarting;
  case proto::HEALTH_HEALTHY:
    return HealthStatus::kHealthy;
  case proto::HEALTH_DEGRADED:
    return HealthStatus::kDegraded;
  case proto::HEALTH_UNHEALTHY:
    return HealthStatus::kUnhealthy;
  case proto::HEALTH_STOPPED:
    return HealthStatus::kStopped;
  default:
    break;
  }
  return HealthStatus::kUnknown;
}

proto::ServiceState ServiceStateToProto(ServiceState s) {
  switch (s) {
  case ServiceState::kStarting:
    return proto::STATE_STARTING;
  case ServiceState::kRunning:
    return proto::STATE_RUNNING;
  case ServiceState::kStopping:
    return proto::STATE_STOPPING;
  case ServiceState::kStopped:
    return proto::STATE_STOPPED;
  case ServiceState::kUnspecified:
    break;
  }
  return proto::STATE_UNSPECIFIED;
}

ServiceState ServiceStateFromProto(proto::ServiceState s) {
  switch (s) {
  case proto::STATE_STARTING:
    return ServiceState::kStarting;
  case proto::STATE_RUNNING:
    return ServiceState::kRunning;
  case proto::STATE_STOPPING:
    return ServiceState::kStopping;
  case proto::STATE_STOPPED:
    return ServiceState::kStopped;
  default:
    break;
  }
  return ServiceState::kUnspecified;
}

void HealthUpdate::ToProto(proto::HealthUpdate *dest) const {
  dest->set_service_id(service_id);
  dest->set_name(name);
  dest->set_old_status(HealthStatusToProto(old_status));
  dest->set_new_status(HealthStatusToProto(new_status));
  dest->set_timestamp(timestamp);
}

void HealthUpdate::FromProto(const proto::HealthUpdate &src) {
  service_id = src.service_id();
  name = src.name();
  old_status = HealthStatusFromProto(src.old_status());
  new_status = HealthStatusFromProto(src.new_status());
  timestamp = src.timestamp();
}

void ServiceMetrics::ToProto(proto::ServiceMetrics *dest) const {
  dest->set_memory_usage_bytes(memory_usage_bytes);
  dest->set_cpu_usage_percent(cpu_usage_percent);
  dest->set_threads(threads);
  for (auto & [ name, value ] : custom_metrics) {
    (*dest->mutable_custom_metrics())[name] = value;
  }
}

void ServiceMetrics::FromProto(const proto::ServiceMetrics &src) {
  memory_usage_bytes = src.memory_usage_bytes();
  cpu_usage_percent = src.cpu_usage_percent();
  threads = src.threads();
  custom_metrics.clear();
  for (auto & [ name, value ] : src.custom_metrics()) {
    custom_metrics[name] = value;
  }
}

void ServiceCommand::ToProto(proto::ServiceCommand *dest) const {
  switch (type) {
  case Type::kReloadConfig:
    dest->set_type(proto::ServiceCommand::RELOAD_CONFIG);
    break;
  case Type::kRotateLogs:
    dest->set_type(proto::ServiceCommand::ROTATE_LOGS);
    break;
  case Type::kCollectMetrics:
    dest->set_type(proto::ServiceCommand::COLLECT_METRICS);
    break;
  case Type::kCustom:
    dest->set_type(proto::ServiceCommand::CUSTOM);
    break;
  case Type::kUnspecified:
    dest->set_type(proto::ServiceCommand::COMMAND_UNSPECIFIED);
    break;
  }
  for (auto & [ name, value ] : parameters) {
    (*dest->mutable_parameters())[name] = value;
  }
}

void ServiceCommand::FromProto(const proto::ServiceCommand &src) {
  switch (src.type()) {
  case proto::ServiceCommand::RELOAD_CONFIG:
    type = Type::kReloadConfig;
    break;
  case proto::ServiceCommand::ROTATE_LOGS:
    type = Type::kRotateLogs;
    break;
  case proto::ServiceCommand::COLLECT_METRICS:
    type = Type::kCollectMetrics;
    break;
  case proto::ServiceCommand::CUSTOM:
    type = Type::kCustom;
    break;
  default:
    type = Type::kUnspecified;
    break;
  }
  parameters.clear();
  for (auto & [ name, value ] : src.parameters()) {
    parameters[name] = value;
  }
}

} // namespace overseer
