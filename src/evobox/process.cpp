#include <evobox/process.h>

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr int kKillGraceMs = 200;
constexpr int kWaitPollMs = 10;

using Clock = std::chrono::steady_clock;

inline long RemainingMs(Clock::time_point deadline) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
}

void DecodeStatus(int status, ProcessResult& ret) {
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signaled = true;
    ret.exit_code = 128 + WTERMSIG(status);
  }
}

// SIGTERM the group, then SIGKILL whatever is left after a short grace
int KillGroup(pid_t pid) {
  int status = 0;
  killpg(pid, SIGTERM);
  for (int waited = 0; waited < kKillGraceMs; waited += kWaitPollMs) {
    if (waitpid(pid, &status, WNOHANG) == pid) return status;
    usleep(kWaitPollMs * 1000);
  }
  killpg(pid, SIGKILL);
  waitpid(pid, &status, 0);
  return status;
}

void ClosePipe(int fds[2]) {
  if (fds[0] >= 0) close(fds[0]);
  if (fds[1] >= 0) close(fds[1]);
  fds[0] = fds[1] = -1;
}

} // namespace

ProcessResult SubprocessRunner::Run(const std::vector<std::string>& argv, const ProcessOptions& opt) {
  ProcessResult ret;
  if (argv.empty()) {
    ret.spawn_failed = true;
    return ret;
  }
  spdlog::debug("Executing: {}", FormatCommand(argv));
  // prepared before fork; the child must not allocate
  std::vector<char*> args;
  for (auto& i : argv) args.push_back(const_cast<char*>(i.c_str()));
  args.push_back(nullptr);

  int outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, execpipe[2] = {-1, -1};
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
      pipe2(execpipe, O_CLOEXEC) < 0) {
    ret.err = fmt::format("pipe: {}", strerror(errno));
    ClosePipe(outpipe), ClosePipe(errpipe), ClosePipe(execpipe);
    ret.spawn_failed = true;
    return ret;
  }
  pid_t pid = fork();
  if (pid < 0) {
    ret.err = fmt::format("fork: {}", strerror(errno));
    ClosePipe(outpipe), ClosePipe(errpipe), ClosePipe(execpipe);
    ret.spawn_failed = true;
    return ret;
  }
  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, 0);
    dup2(outpipe[1], 1);
    dup2(errpipe[1], 2);
    execvp(args[0], args.data());
    int err = errno;
    IGNORE_RETURN(write(execpipe[1], &err, sizeof(err)));
    _exit(127);
  }
  setpgid(pid, pid); // mirror the child's setpgid
  close(outpipe[1]), close(errpipe[1]), close(execpipe[1]);
  outpipe[1] = errpipe[1] = execpipe[1] = -1;

  // execpipe is closed on a successful exec
  int child_errno = 0;
  ssize_t n;
  while ((n = read(execpipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
  ClosePipe(execpipe);
  if (n == sizeof(child_errno)) {
    waitpid(pid, nullptr, 0);
    ClosePipe(outpipe), ClosePipe(errpipe);
    ret.spawn_failed = true;
    ret.err = fmt::format("{}: {}", argv[0], strerror(child_errno));
    spdlog::debug("Failed to spawn {}", ret.err);
    return ret;
  }

  Clock::time_point deadline = Clock::now() +
      std::chrono::milliseconds(static_cast<long>(opt.timeout * 1000));
  struct pollfd fds[2] = {{outpipe[0], POLLIN, 0}, {errpipe[0], POLLIN, 0}};
  std::string* bufs[2] = {&ret.out, &ret.err};
  int open_fds = 2;
  while (open_fds) {
    int wait_ms = -1;
    if (opt.timeout > 0) {
      long remain = RemainingMs(deadline);
      if (remain <= 0) {
        ret.timed_out = true;
        break;
      }
      wait_ms = remain;
    }
    int r = poll(fds, 2, wait_ms);
    if (r < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll error: {}", strerror(errno));
      break;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      char buf[4096];
      ssize_t len = read(fds[i].fd, buf, sizeof(buf));
      if (len > 0) {
        if (opt.capture_output) bufs[i]->append(buf, len);
        continue;
      }
      if (len < 0 && errno == EINTR) continue;
      close(fds[i].fd);
      fds[i].fd = -1;
      open_fds--;
    }
  }
  for (auto& i : fds) {
    if (i.fd >= 0) close(i.fd);
  }

  int status = 0;
  if (!ret.timed_out) {
    if (opt.timeout > 0) {
      // output closed, but the process may still be running
      while (true) {
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) break;
        if (RemainingMs(deadline) <= 0) {
          ret.timed_out = true;
          break;
        }
        usleep(kWaitPollMs * 1000);
      }
    } else {
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
    }
  }
  if (ret.timed_out) {
    spdlog::warn("Command exceeded {}s, killing process group {}: {}",
                 opt.timeout, pid, FormatCommand(argv));
    status = KillGroup(pid);
  }
  DecodeStatus(status, ret);
  spdlog::debug("Command finished: {}", DescribeResult(ret));
  return ret;
}

std::string FormatCommand(const std::vector<std::string>& argv) {
  return fmt::format("{}", fmt::join(argv, " "));
}

std::string DescribeResult(const ProcessResult& res) {
  if (res.spawn_failed) return fmt::format("not spawned ({})", res.err);
  std::string ret = res.signaled ?
      fmt::format("killed by signal {}", res.exit_code - 128) :
      fmt::format("exit code {}", res.exit_code);
  if (res.timed_out) ret += ", timed out";
  if (!res.Success() && !res.err.empty()) {
    constexpr size_t kMaxErrLen = 400;
    ret += ": " + res.err.substr(0, kMaxErrLen);
  }
  return ret;
}
