// Copyright 2024 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "supervisor/service_process.h"
#include "supervisor/port_offset.h"

#include "absl/strings/str_format.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <map>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__)
#include <linux/wait.h> // For P_PIDFD
#include <syscall.h>

static int pidfd_open(pid_t pid, unsigned int flags) {
  return syscall(__NR_pidfd_open, pid, flags);
}

static int pidfd_send_signal(int pidfd, int sig, siginfo_t *info,
                             unsigned int flags) {
  return syscall(__NR_pidfd_send_signal, pidfd, sig, info, flags);
}
#else
#error "Process supervision needs pidfd support"
#endif

extern char **environ;

namespace overseer::supervisor {

// How long to wait for a killed process to go away.
static constexpr std::chrono::seconds kKillTimeout = 5s;

static constexpr int kLockPollMs = 10;

ProcessEnvironment
ProcessEnvironment::FromConfig(const SupervisorConfig &config) {
  return ProcessEnvironment{.database_name = config.database_name,
                            .database_user = config.database_user,
                            .keyring_backend = config.keyring_backend,
                            .keyring_path = config.KeyringPath(),
                            .instance_group_id = config.instance_group_id,
                            .port_offset = config.port_offset};
}

ServiceProcess::OperationLock::OperationLock(ServiceProcess *proc,
                                             co::Coroutine *c)
    : proc_(proc) {
  while (proc_->busy_) {
    c->Millisleep(kLockPollMs);
  }
  proc_->busy_ = true;
}

ServiceProcess::ServiceProcess(co::CoroutineScheduler &scheduler,
                               toolbelt::Logger &logger,
                               ServiceDescriptor descriptor,
                               ProcessEnvironment env,
                               CoroutineAdder add_coroutine)
    : scheduler_(scheduler), logger_(logger),
      descriptor_(std::move(descriptor)), env_(std::move(env)),
      add_coroutine_(std::move(add_coroutine)) {}

std::vector<std::string> ServiceProcess::BuildArgs() const {
  return ApplyPortOffset(descriptor_.args, env_.port_offset);
}

std::vector<std::string> ServiceProcess::BuildEnvironment() const {
  std::map<std::string, std::string> vars;
  for (char **e = environ; e != nullptr && *e != nullptr; e++) {
    const char *eq = strchr(*e, '=');
    if (eq == nullptr) {
      continue;
    }
    vars[std::string(*e, eq - *e)] = eq + 1;
  }
  for (auto & [ name, value ] : descriptor_.environment) {
    vars[name] = value;
  }

  auto passthrough = [&vars](const char *name, const std::string &value) {
    if (!value.empty()) {
      vars[name] = value;
      return;
    }
    if (const char *inherited = getenv(name); inherited != nullptr) {
      vars[name] = inherited;
    }
  };
  passthrough("OVERSEER_DATABASE_NAME", env_.database_name);
  passthrough("OVERSEER_DATABASE_USER", env_.database_user);
  passthrough("OVERSEER_KEYRING_BACKEND", env_.keyring_backend);
  passthrough("OVERSEER_KEYRING_PATH", env_.keyring_path);
  passthrough("OVERSEER_INSTANCE_GROUP_ID", env_.instance_group_id);

  vars["OVERSEER_SERVICE_NAME"] = descriptor_.name;

  // External ports are fixed by the operator and are never offset.
  if (descriptor_.external_port > 0) {
    vars["OVERSEER_EXTERNAL_PORT"] =
        absl::StrFormat("%d", descriptor_.external_port);
  }
  if (descriptor_.rest_api_port > 0) {
    vars["OVERSEER_REST_API_PORT"] =
        absl::StrFormat("%d", descriptor_.rest_api_port);
  }

  std::vector<std::string> result;
  result.reserve(vars.size());
  for (auto & [ name, value ] : vars) {
    result.push_back(absl::StrFormat("%s=%s", name, value));
  }
  return result;
}

absl::Status ServiceProcess::Start(co::Coroutine *c) {
  OperationLock lock(this, c);
  if (child_ != nullptr) {
    return absl::FailedPreconditionError(
        absl::StrFormat("Service %s is already running (pid %d)", Name(),
                        child_->pid));
  }

  const std::string &exe = descriptor_.executable;
  struct stat st;
  if (stat(exe.c_str(), &st) == -1) {
    return absl::NotFoundError(absl::StrFormat(
        "Executable %s for service %s: %s", exe, Name(), strerror(errno)));
  }
  if (!S_ISREG(st.st_mode) || access(exe.c_str(), X_OK) != 0) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "%s for service %s is not an executable file", exe, Name()));
  }

  // Everything the child needs is built before the fork.
  std::vector<std::string> args = BuildArgs();
  std::vector<std::string> env_strings = BuildEnvironment();

  std::vector<const char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(exe.c_str());
  for (auto &arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  std::vector<const char *> envp;
  envp.reserve(env_strings.size() + 1);
  for (auto &var : env_strings) {
    envp.push_back(var.c_str());
  }
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    return absl::InternalError(
        absl::StrFormat("Fork failed for %s: %s", Name(), strerror(errno)));
  }
  if (pid == 0) {
    // Child.  Standard output and error are inherited from the supervisor.
    setpgrp();
    execve(exe.c_str(),
           reinterpret_cast<char *const *>(const_cast<char **>(argv.data())),
           reinterpret_cast<char *const *>(const_cast<char **>(envp.data())));
    std::cerr << "Failed to exec " << exe << ": " << strerror(errno)
              << std::endl;
    _exit(127);
  }

  int pidfd = pidfd_open(pid, 0);
  if (pidfd == -1) {
    int e = errno;
    ::kill(pid, SIGKILL);
    int status;
    (void)waitpid(pid, &status, 0);
    return absl::InternalError(absl::StrFormat(
        "Failed to open pidfd for %s (pid %d): %s", Name(), pid, strerror(e)));
  }

  child_ = std::make_shared<Child>(
      Child{.pid = pid, .pidfd = toolbelt::FileDescriptor(pidfd)});
  stop_requested_ = false;
  logger_.Log(toolbelt::LogLevel::kInfo, "Started service %s (pid %d): %s",
              Name().c_str(), pid, exe.c_str());
  WatchChild(child_);
  return absl::OkStatus();
}

void ServiceProcess::WatchChild(std::shared_ptr<Child> child) {
  add_coroutine_(std::make_unique<co::Coroutine>(
      scheduler_,
      [ proc = shared_from_this(), child ](co::Coroutine * c) {
        while (!child->reaped) {
          c->Wait(child->pidfd.Fd(), POLLIN);
          if (proc->Reap(child)) {
            break;
          }
        }
      },
      absl::StrFormat("Watcher.%s", Name())));
}

bool ServiceProcess::Reap(std::shared_ptr<Child> child) {
  if (child->reaped) {
    return true;
  }
  ExitInfo info = {.pid = child->pid, .requested = stop_requested_};
  siginfo_t siginfo = {};
  int e = waitid(idtype_t(P_PIDFD), child->pidfd.Fd(), &siginfo,
                 WEXITED | WNOHANG);
  if (e == 0) {
    if (siginfo.si_pid == 0) {
      // Still running.
      return false;
    }
    if (siginfo.si_code == CLD_EXITED) {
      info.exited = true;
      info.exit_status = siginfo.si_status;
    } else {
      info.term_signal = siginfo.si_status;
    }
  } else {
    // Someone else has collected it.  All we know is that it's gone.
    logger_.Log(toolbelt::LogLevel::kWarning,
                "Unable to collect exit status of %s (pid %d): %s",
                Name().c_str(), child->pid, strerror(errno));
    info.exited = true;
    info.exit_status = 127;
  }
  child->reaped = true;
  if (child_ == child) {
    child_.reset();
  }

  if (info.exited) {
    logger_.Log(info.exit_status == 0 || info.requested
                    ? toolbelt::LogLevel::kInfo
                    : toolbelt::LogLevel::kError,
                "Service %s (pid %d) exited with status %d", Name().c_str(),
                info.pid, info.exit_status);
  } else {
    logger_.Log(info.requested ? toolbelt::LogLevel::kInfo
                               : toolbelt::LogLevel::kError,
                "Service %s (pid %d) received signal %d \"%s\"",
                Name().c_str(), info.pid, info.term_signal,
                strsignal(info.term_signal));
  }
  if (exit_hook_ != nullptr) {
    exit_hook_(shared_from_this(), info);
  }
  return true;
}

absl::Status ServiceProcess::SendSignal(const Child &child, int sig) {
  if (pidfd_send_signal(child.pidfd.Fd(), sig, nullptr, 0) != 0) {
    return absl::InternalError(
        absl::StrFormat("Failed to send %s to %s (pid %d): %s", strsignal(sig),
                        Name(), child.pid, strerror(errno)));
  }
  return absl::OkStatus();
}

bool ServiceProcess::WaitForExit(co::Coroutine *c, const Child &child,
                                 std::chrono::nanoseconds timeout) {
  // Two coroutines can't wait for the same fd and the watcher is already
  // waiting on the pidfd.
  toolbelt::FileDescriptor fd(dup(child.pidfd.Fd()));
  return c->Wait(fd.Fd(), POLLIN, timeout.count()) == fd.Fd();
}

absl::Status ServiceProcess::Kill(co::Coroutine *c,
                                  std::shared_ptr<Child> child) {
  if (absl::Status status = SendSignal(*child, SIGKILL); !status.ok()) {
    // ESRCH means it has already gone.
    if (errno != ESRCH) {
      return status;
    }
  }
  if (!WaitForExit(c, *child, kKillTimeout)) {
    return absl::InternalError(absl::StrFormat(
        "Service %s (pid %d) did not exit after SIGKILL", Name(), child->pid));
  }
  Reap(child);
  return absl::OkStatus();
}

absl::Status ServiceProcess::Stop(co::Coroutine *c, bool force,
                                  std::chrono::seconds grace_period) {
  OperationLock lock(this, c);
  std::shared_ptr<Child> child = child_;
  if (child == nullptr) {
    return absl::OkStatus();
  }
  stop_requested_ = true;
  if (grace_period <= 0s) {
    grace_period = descriptor_.grace_period;
  }

  if (force) {
    logger_.Log(toolbelt::LogLevel::kInfo, "Killing service %s (pid %d)",
                Name().c_str(), child->pid);
    return Kill(c, child);
  }

  logger_.Log(toolbelt::LogLevel::kInfo,
              "Stopping service %s (pid %d) with SIGTERM (grace period %d "
              "seconds)",
              Name().c_str(), child->pid, int(grace_period.count()));
  if (absl::Status status = SendSignal(*child, SIGTERM); !status.ok()) {
    if (errno != ESRCH) {
      return status;
    }
  }

  toolbelt::FileDescriptor exit_fd(dup(child->pidfd.Fd()));
  std::vector<int> fds = {exit_fd.Fd()};
  toolbelt::FileDescriptor cancel;
  if (cancel_fd_ != -1) {
    cancel.SetFd(dup(cancel_fd_));
    fds.push_back(cancel.Fd());
  }
  int fd = c->Wait(
      fds, POLLIN,
      std::chrono::duration_cast<std::chrono::nanoseconds>(grace_period)
          .count());
  if (fd == exit_fd.Fd()) {
    Reap(child);
    return absl::OkStatus();
  }

  bool cancelled = cancel.Valid() && fd == cancel.Fd();
  logger_.Log(toolbelt::LogLevel::kWarning,
              "Service %s (pid %d) did not exit %s, killing it with SIGKILL",
              Name().c_str(), child->pid,
              cancelled ? "before shutdown" : "within its grace period");
  if (absl::Status status = Kill(c, child); !status.ok()) {
    return status;
  }
  if (cancelled) {
    return absl::CancelledError(
        absl::StrFormat("Stop of service %s was cancelled", Name()));
  }
  return absl::DeadlineExceededError(absl::StrFormat(
      "Service %s did not exit gracefully within %d seconds and was killed",
      Name(), grace_period.count()));
}

} // namespace overseer::supervisor
