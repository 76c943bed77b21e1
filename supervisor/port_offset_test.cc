// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/port_offset.h"
#include <gtest/gtest.h>

using overseer::supervisor::ApplyPortOffset;

TEST(PortOffsetTest, PortFlags) {
  ASSERT_EQ("--port=51051", ApplyPortOffset("--port=50051", 1000));
  ASSERT_EQ("--grpc-port=9100", ApplyPortOffset("--grpc-port=9000", 100));
  ASSERT_EQ("--supervisor=localhost:51000",
            ApplyPortOffset("--supervisor=localhost:50000", 1000));
  ASSERT_EQ("--grpc-address=10.0.0.1:6001",
            ApplyPortOffset("--grpc-address=10.0.0.1:6000", 1));
  ASSERT_EQ("--listen-address=:8081",
            ApplyPortOffset("--listen-address=:8080", 1));
}

TEST(PortOffsetTest, UnrelatedArgsUnchanged) {
  ASSERT_EQ("--name=foo", ApplyPortOffset("--name=foo", 1000));
  ASSERT_EQ("--external-port=8080",
            ApplyPortOffset("--external-port=8080", 1000));
  ASSERT_EQ("--rest-api-port=8080",
            ApplyPortOffset("--rest-api-port=8080", 1000));
  ASSERT_EQ("--portable=1", ApplyPortOffset("--portable=1", 1000));
  ASSERT_EQ("50051", ApplyPortOffset("50051", 1000));
  ASSERT_EQ("--port", ApplyPortOffset("--port", 1000));
}

TEST(PortOffsetTest, UnparseablePortUnchanged) {
  ASSERT_EQ("--port=abc", ApplyPortOffset("--port=abc", 1000));
  ASSERT_EQ("--port=", ApplyPortOffset("--port=", 1000));
  ASSERT_EQ("--port=+80", ApplyPortOffset("--port=+80", 1000));
  ASSERT_EQ("--supervisor=localhost",
            ApplyPortOffset("--supervisor=localhost", 1000));
  ASSERT_EQ("--supervisor=localhost:",
            ApplyPortOffset("--supervisor=localhost:", 1000));
  ASSERT_EQ("--port=0", ApplyPortOffset("--port=0", 1000));
}

TEST(PortOffsetTest, OutOfRangeUnchanged) {
  ASSERT_EQ("--port=65000", ApplyPortOffset("--port=65000", 1000));
  ASSERT_EQ("--grpc-address=10.0.0.1:65535",
            ApplyPortOffset("--grpc-address=10.0.0.1:65535", 1));
  ASSERT_EQ("--port=65535", ApplyPortOffset("--port=64535", 1000));
}

TEST(PortOffsetTest, InternalPort) {
  ASSERT_EQ(50051, overseer::supervisor::InternalPort("--port=50051"));
  ASSERT_EQ(50000, overseer::supervisor::InternalPort(
                       "--supervisor=localhost:50000"));
  ASSERT_FALSE(
      overseer::supervisor::InternalPort("--external-port=80").has_value());
  ASSERT_FALSE(overseer::supervisor::InternalPort("--port=x").has_value());
}

TEST(PortOffsetTest, ZeroOffset) {
  ASSERT_EQ("--port=50051", ApplyPortOffset("--port=50051", 0));
}

TEST(PortOffsetTest, ArgumentList) {
  std::vector<std::string> args = {"--port=50051", "--name=foo",
                                   "--supervisor=localhost:50000", "-v"};
  std::vector<std::string> result = ApplyPortOffset(args, 1000);
  ASSERT_EQ(4, result.size());
  ASSERT_EQ("--port=51051", result[0]);
  ASSERT_EQ("--name=foo", result[1]);
  ASSERT_EQ("--supervisor=localhost:51000", result[2]);
  ASSERT_EQ("-v", result[3]);
}
