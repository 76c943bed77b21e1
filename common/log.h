// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <cstdint>
#include <string>

#include "proto/log.pb.h"
#include "toolbelt/logging.h"

namespace overseer {

inline proto::LogMessage::LogLevel LogLevelToProto(toolbelt::LogLevel level) {
  switch (level) {
  case toolbelt::LogLevel::kVerboseDebug:
    return proto::LogMessage::LOG_VERBOSE;
  case toolbelt::LogLevel::kDebug:
    return proto::LogMessage::LOG_DBG;
  case toolbelt::LogLevel::kInfo:
    return proto::LogMessage::LOG_INFO;
  case toolbelt::LogLevel::kWarning:
    return proto::LogMessage::LOG_WARNING;
  case toolbelt::LogLevel::kError:
  case toolbelt::LogLevel::kFatal:
    return proto::LogMessage::LOG_ERR;
  }
  return proto::LogMessage::LOG_UNKNOWN;
}

// Unknown levels are logged as info so that nothing a service sends us
// disappears.
inline toolbelt::LogLevel LogLevelFromProto(proto::LogMessage::LogLevel level) {
  switch (level) {
  case proto::LogMessage::LOG_VERBOSE:
    return toolbelt::LogLevel::kVerboseDebug;
  case proto::LogMessage::LOG_DBG:
    return toolbelt::LogLevel::kDebug;
  case proto::LogMessage::LOG_WARNING:
    return toolbelt::LogLevel::kWarning;
  case proto::LogMessage::LOG_ERR:
    return toolbelt::LogLevel::kError;
  case proto::LogMessage::LOG_INFO:
  default:
    return toolbelt::LogLevel::kInfo;
  }
}

struct LogMessage {
  std::string source;
  std::string service_id;
  toolbelt::LogLevel level = toolbelt::LogLevel::kInfo;
  std::string text;
  uint64_t timestamp = 0;

  void ToProto(proto::LogMessage *dest) const {
    dest->set_source(source);
    dest->set_service_id(service_id);
    dest->set_text(text);
    dest->set_timestamp(timestamp);
    dest->set_level(LogLevelToProto(level));
  }

  void FromProto(const proto::LogMessage &src) {
    source = src.source();
    service_id = src.service_id();
    text = src.text();
    timestamp = src.timestamp();
    level = LogLevelFromProto(src.level());
  }
};

} // namespace overseer
