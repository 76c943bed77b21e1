// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "common/log.h"
#include "proto/log.pb.h"
#include "toolbelt/fd.h"
#include "toolbelt/logging.h"

namespace overseer::supervisor {

// Log entries sent to the supervisor by its services.  New entries are
// buffered until the next flush, which writes them to the log file in
// timestamp order and hands them back for printing or forwarding.  The
// most recent entries are also retained in memory.
class LogStore {
public:
  LogStore(toolbelt::Logger &logger, size_t retention);

  // Opens (truncating) the binary log file.  An empty name picks
  // /tmp/overseer-<local time>.pb.
  absl::Status OpenFile(std::string filename);
  const std::string &FileName() const { return filename_; }

  void Add(LogMessage msg);

  // Everything added since the last flush, oldest first.
  std::vector<std::shared_ptr<proto::LogMessage>> Flush();

  // The newest max retained entries from the source, oldest first.  An
  // empty source matches all of them.
  std::vector<LogMessage> Recent(size_t max,
                                 const std::string &source = "") const;

  size_t Size() const;
  int64_t Received() const;

private:
  void WriteToFile(const proto::LogMessage &msg);

  toolbelt::Logger &logger_;
  size_t retention_;
  std::string filename_;
  toolbelt::FileDescriptor file_;

  mutable absl::Mutex mutex_;
  std::multimap<uint64_t, std::shared_ptr<proto::LogMessage>>
      pending_ ABSL_GUARDED_BY(mutex_);
  std::deque<LogMessage> retained_ ABSL_GUARDED_BY(mutex_);
  int64_t received_ ABSL_GUARDED_BY(mutex_) = 0;
};

} // namespace overseer::supervisor
