// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "coroutine.h"
#include "supervisor/config.h"
#include "toolbelt/fd.h"
#include "toolbelt/logging.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace overseer::supervisor {

// Values passed through to every child's environment.  Empty values fall
// back to the supervisor's own environment variable of the same name.
struct ProcessEnvironment {
  std::string database_name;
  std::string database_user;
  std::string keyring_backend;
  std::string keyring_path;
  std::string instance_group_id;
  int port_offset = 0;

  static ProcessEnvironment FromConfig(const SupervisorConfig &config);
};

struct ExitInfo {
  int pid = 0;
  bool exited = false; // Exited normally, exit_status is valid.
  int exit_status = 0;
  int term_signal = 0; // Signal that killed it if !exited.
  bool requested = false; // Exit was caused by Stop.

  bool Failed() const { return !exited || exit_status != 0; }
};

// Owns the OS process for one configured service.  At most one process
// runs per descriptor.  Start and Stop on the same ServiceProcess are
// serialized; different ServiceProcesses never wait for each other.
//
// The watcher coroutine that waits for the child to exit holds a shared_ptr
// to this, so the object lives until the watcher has finished.
class ServiceProcess : public std::enable_shared_from_this<ServiceProcess> {
public:
  using CoroutineAdder = std::function<void(std::unique_ptr<co::Coroutine>)>;
  using ExitHook =
      std::function<void(std::shared_ptr<ServiceProcess>, const ExitInfo &)>;

  ServiceProcess(co::CoroutineScheduler &scheduler, toolbelt::Logger &logger,
                 ServiceDescriptor descriptor, ProcessEnvironment env,
                 CoroutineAdder add_coroutine);

  absl::Status Start(co::Coroutine *c);

  // Asks the process to terminate and waits up to grace_period for it.  A
  // zero grace period means the one configured for the service.  A
  // process that outlives the grace period is killed and DeadlineExceeded
  // is returned.  force kills immediately.  If the cancel fd becomes
  // readable during the wait the process is killed and Cancelled is
  // returned.
  absl::Status Stop(co::Coroutine *c, bool force = false,
                    std::chrono::seconds grace_period = 0s);

  bool IsRunning() const { return child_ != nullptr; }
  int GetPid() const { return child_ == nullptr ? 0 : child_->pid; }

  const ServiceDescriptor &Descriptor() const { return descriptor_; }
  const std::string &Name() const { return descriptor_.name; }

  // Called once for every child that exits, however it exits.
  void SetExitHook(ExitHook hook) { exit_hook_ = std::move(hook); }

  void SetCancelFd(int fd) { cancel_fd_ = fd; }

  // The argument list after internal ports have been offset.
  std::vector<std::string> BuildArgs() const;

  // NAME=value strings: the supervisor's environment, overlaid by the
  // descriptor's environment, overlaid by the passthrough variables.
  std::vector<std::string> BuildEnvironment() const;

  int NumRestarts() const { return num_restarts_; }
  void IncNumRestarts() { num_restarts_++; }
  void ResetRestarts() {
    num_restarts_ = 0;
    restart_delay_ = std::chrono::seconds(1);
  }

  // Returns the delay to wait before the next restart and doubles the
  // following one, up to kMaxRestartDelay.
  std::chrono::seconds IncRestartDelay() {
    auto old_delay = restart_delay_;
    restart_delay_ *= 2;
    if (restart_delay_ > kMaxRestartDelay) {
      restart_delay_ = kMaxRestartDelay;
    }
    return old_delay;
  }

  static constexpr std::chrono::seconds kMaxRestartDelay = 32s;

private:
  struct Child {
    int pid;
    toolbelt::FileDescriptor pidfd;
    bool reaped = false;
  };

  // Start and Stop both suspend, so exclusion is a flag that waiting
  // coroutines poll.
  class OperationLock {
  public:
    OperationLock(ServiceProcess *proc, co::Coroutine *c);
    ~OperationLock() { proc_->busy_ = false; }

  private:
    ServiceProcess *proc_;
  };

  void WatchChild(std::shared_ptr<Child> child);

  // Collects the exit status of the child if it has exited.  Returns true
  // if the child is gone (now or earlier).
  bool Reap(std::shared_ptr<Child> child);

  absl::Status SendSignal(const Child &child, int sig);

  // Wait for the child's pidfd to become readable, up to the timeout.
  bool WaitForExit(co::Coroutine *c, const Child &child,
                   std::chrono::nanoseconds timeout);

  absl::Status Kill(co::Coroutine *c, std::shared_ptr<Child> child);

  co::CoroutineScheduler &scheduler_;
  toolbelt::Logger &logger_;
  ServiceDescriptor descriptor_;
  ProcessEnvironment env_;
  CoroutineAdder add_coroutine_;
  ExitHook exit_hook_;
  int cancel_fd_ = -1;

  std::shared_ptr<Child> child_;
  bool stop_requested_ = false;
  bool busy_ = false;

  int num_restarts_ = 0;
  std::chrono::seconds restart_delay_ = std::chrono::seconds(1);
};

} // namespace overseer::supervisor
