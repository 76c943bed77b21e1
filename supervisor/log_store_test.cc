// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/log_store.h"
#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

using LogStore = overseer::supervisor::LogStore;
using LogMessage = overseer::LogMessage;

static LogMessage Message(const std::string &text, uint64_t timestamp) {
  return {.source = "worker",
          .service_id = "id",
          .level = toolbelt::LogLevel::kWarning,
          .text = text,
          .timestamp = timestamp};
}

TEST(LogStoreTest, FlushInTimestampOrder) {
  toolbelt::Logger logger("test", true);
  LogStore store(logger, 100);
  store.Add(Message("three", 3));
  store.Add(Message("one", 1));
  store.Add(Message("two", 2));
  ASSERT_EQ(3, store.Received());

  std::vector<std::shared_ptr<overseer::proto::LogMessage>> msgs =
      store.Flush();
  ASSERT_EQ(3, msgs.size());
  ASSERT_EQ("one", msgs[0]->text());
  ASSERT_EQ("two", msgs[1]->text());
  ASSERT_EQ("three", msgs[2]->text());
  ASSERT_EQ(overseer::proto::LogMessage::LOG_WARNING, msgs[0]->level());

  ASSERT_TRUE(store.Flush().empty());
}

TEST(LogStoreTest, Retention) {
  toolbelt::Logger logger("test", true);
  LogStore store(logger, 3);
  for (int i = 0; i < 5; i++) {
    store.Add(Message(std::to_string(i), i));
  }
  ASSERT_EQ(3, store.Size());
  ASSERT_EQ(5, store.Received());

  std::vector<LogMessage> recent = store.Recent(2);
  ASSERT_EQ(2, recent.size());
  ASSERT_EQ("3", recent[0].text);
  ASSERT_EQ("4", recent[1].text);

  ASSERT_EQ(3, store.Recent(10).size());
}

TEST(LogStoreTest, RecentBySource) {
  toolbelt::Logger logger("test", true);
  LogStore store(logger, 10);
  for (int i = 0; i < 6; i++) {
    LogMessage msg = Message(std::to_string(i), i);
    msg.source = i % 2 == 0 ? "even" : "odd";
    store.Add(std::move(msg));
  }
  std::vector<LogMessage> odd = store.Recent(2, "odd");
  ASSERT_EQ(2, odd.size());
  ASSERT_EQ("3", odd[0].text);
  ASSERT_EQ("5", odd[1].text);

  ASSERT_EQ(3, store.Recent(10, "even").size());
  ASSERT_TRUE(store.Recent(10, "none").empty());
}

TEST(LogStoreTest, WritesLengthPrefixedFile) {
  toolbelt::Logger logger("test", true);
  char tmp[] = "/tmp/overseer_logsXXXXXX";
  int tmpfd = mkstemp(tmp);
  ASSERT_NE(-1, tmpfd);
  close(tmpfd);

  {
    LogStore store(logger, 10);
    ASSERT_TRUE(store.OpenFile(tmp).ok());
    ASSERT_EQ(tmp, store.FileName());
    store.Add(Message("hello", 1));
    store.Add(Message("world", 2));
    store.Flush();
  }

  toolbelt::FileDescriptor fd(open(tmp, O_RDONLY));
  ASSERT_TRUE(fd.Valid());
  std::vector<std::string> texts;
  for (;;) {
    uint64_t size;
    ssize_t n = ::read(fd.Fd(), &size, sizeof(size));
    if (n == 0) {
      break;
    }
    ASSERT_EQ(sizeof(size), n);
    std::string buffer(size, '\0');
    ASSERT_EQ(ssize_t(size), ::read(fd.Fd(), buffer.data(), size));
    overseer::proto::LogMessage msg;
    ASSERT_TRUE(msg.ParseFromString(buffer));
    texts.push_back(msg.text());
  }
  ASSERT_EQ((std::vector<std::string>{"hello", "world"}), texts);
  remove(tmp);
}

TEST(LogStoreTest, BadFile) {
  toolbelt::Logger logger("test", true);
  LogStore store(logger, 10);
  absl::Status status = store.OpenFile("/nonexistent/dir/log.pb");
  ASSERT_FALSE(status.ok());
  ASSERT_EQ(absl::StatusCode::kInternal, status.code());

  // Still usable without a file.
  store.Add(Message("x", 1));
  ASSERT_EQ(1, store.Flush().size());
}
