// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/port_offset.h"

#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

#include <optional>

namespace overseer::supervisor {

const std::vector<std::string> kInternalPortFlags = {
    "--port", "--grpc-port", "--supervisor", "--grpc-address",
    "--listen-address",
};

namespace {

// An internal port flag split at its port: everything before the port
// (flag, '=' and any host with its colon) and the port itself.
struct PortFlag {
  std::string head;
  int port;
};

std::optional<PortFlag> ParsePortFlag(const std::string &arg) {
  for (auto &flag : kInternalPortFlags) {
    std::string prefix = absl::StrCat(flag, "=");
    if (!absl::StartsWith(arg, prefix)) {
      continue;
    }
    absl::string_view value = absl::string_view(arg).substr(prefix.size());

    // The port is whatever follows the last colon, or the whole value.
    size_t colon = value.rfind(':');
    size_t port_start =
        prefix.size() + (colon == absl::string_view::npos ? 0 : colon + 1);
    absl::string_view port_str = absl::string_view(arg).substr(port_start);

    // SimpleAtoi accepts a leading sign and whitespace; a port doesn't.
    int port;
    if (port_str.empty() ||
        port_str.find_first_not_of("0123456789") != absl::string_view::npos ||
        !absl::SimpleAtoi(port_str, &port) || port <= 0 || port > kMaxPort) {
      return std::nullopt;
    }
    return PortFlag{.head = arg.substr(0, port_start), .port = port};
  }
  return std::nullopt;
}

} // namespace

std::optional<int> InternalPort(const std::string &arg) {
  std::optional<PortFlag> flag = ParsePortFlag(arg);
  if (!flag.has_value()) {
    return std::nullopt;
  }
  return flag->port;
}

std::string ApplyPortOffset(const std::string &arg, int offset) {
  if (offset == 0) {
    return arg;
  }
  std::optional<PortFlag> flag = ParsePortFlag(arg);
  if (!flag.has_value() || flag->port + offset > kMaxPort ||
      flag->port + offset <= 0) {
    return arg;
  }
  return absl::StrCat(flag->head, flag->port + offset);
}

std::vector<std::string> ApplyPortOffset(const std::vector<std::string> &args,
                                         int offset) {
  if (offset == 0) {
    return args;
  }
  std::vector<std::string> result;
  result.reserve(args.size());
  for (auto &arg : args) {
    result.push_back(ApplyPortOffset(arg, offset));
  }
  return result;
}

} // namespace overseer::supervisor
