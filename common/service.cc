// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/service.h"

namespace overseer {

void ServiceInfo::ToProto(proto::ServiceInfo *dest) const {
  dest->set_name(name);
  dest->set_version(version);
  dest->set_instance_id(instance_id);
  dest->set_host(host);
  dest->set_port(port);
  for (auto & [ key, value ] : metadata) {
    (*dest->mutable_metadata())[key] = value;
  }
}

void ServiceInfo::FromProto(const proto::ServiceInfo &src) {
  name = src.name();
  version = src.version();
  instance_id = src.instance_id();
  host = src.host();
  port = src.port();
  metadata.clear();
  for (auto & [ key, value ] : src.metadata()) {
    metadata[key] = value;
  }
}

void ServiceCapabilities::ToProto(proto::ServiceCapabilities *dest) const {
  for (auto &f : features) {
    dest->add_features(f);
  }
  dest->set_supports_hot_reload(supports_hot_reload);
  dest->set_supports_graceful_shutdown(supports_graceful_shutdown);
  for (auto &d : dependencies) {
    dest->add_dependencies(d);
  }
}

void ServiceCapabilities::FromProto(const proto::ServiceCapabilities &src) {
  features.assign(src.features().begin(), src.features().end());
  supports_hot_reload = src.supports_hot_reload();
  supports_graceful_shutdown = src.supports_graceful_shutdown();
  dependencies.assign(src.dependencies().begin(), src.dependencies().end());
}

void ServiceConfiguration::ToProto(proto::ServiceConfiguration *dest) const {
  for (auto & [ key, value ] : config) {
    (*dest->mutable_config())[key] = value;
  }
  for (auto & [ key, value ] : environment) {
    (*dest->mutable_environment())[key] = value;
  }
}

void ServiceConfiguration::FromProto(const proto::ServiceConfiguration &src) {
  config.clear();
  for (auto & [ key, value ] : src.config()) {
    config[key] = value;
  }
  environment.clear();
  for (auto & [ key, value ] : src.environment()) {
    environment[key] = value;
  }
}

void ServiceStatus::ToProto(proto::ServiceStatus *dest) const {
  dest->set_service_id(service_id);
  info.ToProto(dest->mutable_info());
  capabilities.ToProto(dest->mutable_capabilities());
  dest->set_state(ServiceStateToProto(state));
  dest->set_health(HealthStatusToProto(health));
  dest->set_started_at(started_at);
  dest->set_last_heartbeat(last_heartbeat);
  dest->set_last_healthy(last_healthy);
  metrics.ToProto(dest->mutable_metrics());
}

void ServiceStatus::FromProto(const proto::ServiceStatus &src) {
  service_id = src.service_id();
  info.FromProto(src.info());
  capabilities.FromProto(src.capabilities());
  state = ServiceStateFromProto(src.state());
  health = HealthStatusFromProto(src.health());
  started_at = src.started_at();
  last_heartbeat = src.last_heartbeat();
  last_healthy = src.last_healthy();
  metrics.FromProto(src.metrics());
}

} // namespace overseer
