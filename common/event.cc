// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "common/event.h"
#include "absl/strings/str_format.h"

namespace overseer {

void Event::ToProto(proto::Event *dest) const {
  switch (type) {
  case EventType::kHealthUpdate: {
    const WatchedHealthUpdate &h = std::get<0>(event);
    auto u = dest->mutable_health_update();
    u->set_watch_id(h.watch_id);
    h.update.ToProto(u->mutable_update());
    break;
  }
  case EventType::kLog: {
    const LogMessage &log = std::get<1>(event);
    log.ToProto(dest->mutable_log());
    break;
  }
  case EventType::kReady: {
    const SystemReady &ready = std::get<2>(event);
    dest->mutable_ready()->set_ready_time(ready.ready_time);
    break;
  }
  }
}

absl::Status Event::FromProto(const proto::Event &src) {
  switch (src.event_case()) {
  case proto::Event::kHealthUpdate: {
    type = EventType::kHealthUpdate;
    WatchedHealthUpdate h;
    h.watch_id = src.health_update().watch_id();
    h.update.FromProto(src.health_update().update());
    event = std::move(h);
    break;
  }
  case proto::Event::kLog: {
    type = EventType::kLog;
    LogMessage log;
    log.FromProto(src.log());
    event = std::move(log);
    break;
  }
  case proto::Event::kReady:
    type = EventType::kReady;
    event = SystemReady{.ready_time = src.ready().ready_time()};
    break;
  case proto::Event::EVENT_NOT_SET:
    return absl::InternalError(
        absl::StrFormat("Unknown event type %d", src.event_case()));
  }
  return absl::OkStatus();
}

} // namespace overseer
