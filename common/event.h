// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "common/health.h"
#include "common/log.h"
#include <string>
#include <variant>

#include "absl/status/status.h"
#include "proto/control.pb.h"

namespace overseer {

// Event masks.  These control what type of events the client
// wants to see on its event channel.  Health updates are always
// delivered for the watches a client has asked for.
constexpr int kNoEvents = 0;
constexpr int kAllEvents = -1;
constexpr int kHealthEvents = 1;
constexpr int kLogMessageEvents = 2;
constexpr int kReadyEvents = 4;

enum class EventType {
  kHealthUpdate,
  kLog,
  kReady,
};

struct WatchedHealthUpdate {
  int watch_id;
  HealthUpdate update;
};

struct SystemReady {
  uint64_t ready_time;
};

struct Event {
  EventType type;
  std::variant<WatchedHealthUpdate, LogMessage, SystemReady> event;

  void ToProto(proto::Event *dest) const;
  absl::Status FromProto(const proto::Event &src);

  bool IsMaskedIn(int mask) const {
    switch (type) {
    case EventType::kHealthUpdate:
      return (mask & kHealthEvents) != 0;
    case EventType::kLog:
      return (mask & kLogMessageEvents) != 0;
    case EventType::kReady:
      return (mask & kReadyEvents) != 0;
    }
    return false;
  }
};

} // namespace overseer
