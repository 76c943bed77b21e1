// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/log_store.h"

#include "absl/strings/str_format.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>

namespace overseer::supervisor {

LogStore::LogStore(toolbelt::Logger &logger, size_t retention)
    : logger_(logger), retention_(retention) {}

absl::Status LogStore::OpenFile(std::string filename) {
  // Make a log file name with the current local time and date.
  if (filename.empty()) {
    char timebuf[64];
    struct tm tm;
    struct timespec now_ts;
    clock_gettime(CLOCK_REALTIME, &now_ts);

    size_t n = strftime(timebuf, sizeof(timebuf), "%FT%T",
                        localtime_r(&now_ts.tv_sec, &tm));
    if (n == 0) {
      filename = "/tmp/overseer.pb";
    } else {
      filename = absl::StrFormat("/tmp/overseer-%s.pb", timebuf);
    }
  }
  file_.SetFd(open(filename.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0666));
  if (!file_.Valid()) {
    return absl::InternalError(absl::StrFormat(
        "Failed to open log file %s: %s", filename, strerror(errno)));
  }
  filename_ = std::move(filename);
  return absl::OkStatus();
}

void LogStore::Add(LogMessage msg) {
  auto proto_msg = std::make_shared<proto::LogMessage>();
  msg.ToProto(proto_msg.get());
  absl::MutexLock lock(&mutex_);
  received_++;
  pending_.emplace(msg.timestamp, std::move(proto_msg));
  retained_.push_back(std::move(msg));
  while (retained_.size() > retention_) {
    retained_.pop_front();
  }
}

std::vector<std::shared_ptr<proto::LogMessage>> LogStore::Flush() {
  std::vector<std::shared_ptr<proto::LogMessage>> msgs;
  {
    absl::MutexLock lock(&mutex_);
    msgs.reserve(pending_.size());
    for (auto & [ timestamp, msg ] : pending_) {
      msgs.push_back(std::move(msg));
    }
    pending_.clear();
  }
  if (file_.Valid()) {
    for (auto &msg : msgs) {
      WriteToFile(*msg);
    }
  }
  return msgs;
}

void LogStore::WriteToFile(const proto::LogMessage &msg) {
  // Length prefixed serialized proto.
  uint64_t size = msg.ByteSizeLong();
  ssize_t n = ::write(file_.Fd(), &size, sizeof(size));
  if (n <= 0) {
    logger_.Log(toolbelt::LogLevel::kError, "Failed to write to log file: %s",
                strerror(errno));
    return;
  }
  if (!msg.SerializeToFileDescriptor(file_.Fd())) {
    logger_.Log(toolbelt::LogLevel::kError,
                "Failed to serialize to log file: %s", strerror(errno));
  }
}

std::vector<LogMessage> LogStore::Recent(size_t max,
                                         const std::string &source) const {
  std::vector<LogMessage> result;
  absl::MutexLock lock(&mutex_);
  for (auto it = retained_.rbegin();
       it != retained_.rend() && result.size() < max; ++it) {
    if (source.empty() || it->source == source) {
      result.push_back(*it);
    }
  }
  std::reverse(result.begin(), result.end());
  return result;
}

size_t LogStore::Size() const {
  absl::MutexLock lock(&mutex_);
  return retained_.size();
}

int64_t LogStore::Received() const {
  absl::MutexLock lock(&mutex_);
  return received_;
}

} // namespace overseer::supervisor
