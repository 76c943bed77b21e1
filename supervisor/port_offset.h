// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace overseer::supervisor {

constexpr int kMaxPort = 65535;

// Flags whose values carry internal ports.  Only these are offset.
extern const std::vector<std::string> kInternalPortFlags;

// The port carried by an internal port flag argument, if it is one and
// the port parses.
std::optional<int> InternalPort(const std::string &arg);

// Rewrite a single argument.  If it is --flag=<port> or --flag=<host>:<port>
// for one of the internal port flags, the port is replaced by
// port + offset.  Anything else, including values that don't parse and
// ports that the offset would take out of range, is returned unchanged.
std::string ApplyPortOffset(const std::string &arg, int offset);

// Apply ApplyPortOffset to each argument.  An offset of 0 returns the
// arguments as given.
std::vector<std::string> ApplyPortOffset(const std::vector<std::string> &args,
                                         int offset);

} // namespace overseer::supervisor
