#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <algorithm>
#include <unordered_set>
#include <mutex>
#include <condition_variable>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codebox/sandbox.h>
#include "utils.h"

int kMaxParallel = 4;

namespace {

constexpr int kPollIntervalMs = 20;
constexpr int kDrainTimeoutMs = 100;
constexpr size_t kReadChunk = 65536;

std::mutex slot_mtx;
std::condition_variable slot_cv;
int running_processes = 0;

class ProcessSlot {
 public:
  ProcessSlot() {
    std::unique_lock lck(slot_mtx);
    slot_cv.wait(lck, [] { return kMaxParallel <= 0 || running_processes < kMaxParallel; });
    running_processes++;
  }
  ~ProcessSlot() {
    {
      std::lock_guard lck(slot_mtx);
      running_processes--;
    }
    slot_cv.notify_one();
  }
};

struct Stream {
  int fd;
  std::string* buf;
  size_t limit; // bytes; 0 = unlimited
  bool truncated;
};

inline long ElapsedUs(const std::chrono::steady_clock::time_point& start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

// forked child; report errno through the status pipe
[[noreturn]] void ChildFail(int status_fd) {
  int err = errno;
  IGNORE_RETURN(write(status_fd, &err, sizeof(err)));
  _exit(127);
}

// false on EOF
bool ReadStream(Stream& s) {
  char tmp[kReadChunk];
  ssize_t n = read(s.fd, tmp, sizeof(tmp));
  if (n < 0) return errno == EINTR || errno == EAGAIN;
  if (n == 0) return false;
  size_t len = n;
  if (s.limit && s.buf->size() + len > s.limit) {
    len = s.limit > s.buf->size() ? s.limit - s.buf->size() : 0;
    if (!s.truncated) spdlog::debug("Output truncated at {} bytes", s.limit);
    s.truncated = true;
  }
  s.buf->append(tmp, len);
  return true;
}

// Also serves as a sleep if every stream is closed
int PollStreams(Stream (&streams)[2], int timeout_ms) {
  struct pollfd fds[2];
  Stream* owners[2];
  nfds_t nfds = 0;
  for (auto& s : streams) {
    if (s.fd < 0) continue;
    fds[nfds] = {s.fd, POLLIN, 0};
    owners[nfds++] = &s;
  }
  int ret = poll(fds, nfds, timeout_ms);
  if (ret <= 0) return ret;
  for (nfds_t i = 0; i < nfds; i++) {
    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
    if (!ReadStream(*owners[i])) CloseFd(owners[i]->fd);
  }
  return ret;
}

} // namespace

ProcessCtx::ProcessCtx(const ProcessOptions& opt) {
  for (auto& i : opt.command) argv_buf_.push_back(const_cast<char*>(i.c_str()));
  argv_buf_.push_back(nullptr);
  if (opt.preserve_env) {
    std::unordered_set<std::string> overridden;
    for (auto& i : opt.envs) overridden.insert(i.substr(0, i.find('=')));
    for (char** env = environ; env && *env; env++) {
      const char* eq = strchr(*env, '=');
      std::string name = eq ? std::string(*env, eq - *env) : std::string(*env);
      if (!overridden.count(name)) env_buf_.push_back(*env);
    }
  }
  for (auto& i : opt.envs) env_buf_.push_back(const_cast<char*>(i.c_str()));
  env_buf_.push_back(nullptr);
}

ProcessResult ProcessExec(const ProcessOptions& opt) {
  ProcessResult ret;
  if (opt.command.empty()) {
    ret.sys_errno = EINVAL;
    return ret;
  }
  ProcessSlot slot;
  ProcessCtx ctx(opt);
  int outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, statpipe[2] = {-1, -1};
  int devnull = -1;
  auto close_all = [&]() {
    for (int* fd : {&outpipe[0], &outpipe[1], &errpipe[0], &errpipe[1],
                    &statpipe[0], &statpipe[1], &devnull}) {
      CloseFd(*fd);
    }
  };
  auto fail = [&](const char* what) {
    ret.sys_errno = errno;
    spdlog::warn("ProcessExec {} error: errno={} {}", what, ret.sys_errno, strerror(ret.sys_errno));
    close_all();
    return ret;
  };
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
      pipe2(statpipe, O_CLOEXEC) < 0) {
    return fail("pipe");
  }
  if ((devnull = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0) return fail("open");

  spdlog::debug("ProcessExec command={} workdir={} wall_time={}",
                fmt::format("{}", opt.command), opt.workdir, opt.wall_time);
  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) return fail("fork");
  if (pid == 0) {
    // only async-signal-safe calls from here
    setpgid(0, 0);
    if (dup2(devnull, 0) < 0 || dup2(outpipe[1], 1) < 0 || dup2(errpipe[1], 2) < 0) {
      ChildFail(statpipe[1]);
    }
    if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) ChildFail(statpipe[1]);
    execvpe(ctx.Argv()[0], ctx.Argv(), ctx.Envp());
    ChildFail(statpipe[1]);
  }
  setpgid(pid, pid); // also done by the child; fails harmlessly after exec
  CloseFd(outpipe[1]);
  CloseFd(errpipe[1]);
  CloseFd(statpipe[1]);
  CloseFd(devnull);

  // EOF on the status pipe means exec succeeded
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(statpipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(statpipe[0]);
  if (n == (ssize_t)sizeof(child_errno)) {
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    close_all();
    ret.sys_errno = child_errno;
    ret.time_us = ElapsedUs(start);
    spdlog::warn("Failed to start {}: {}", opt.command[0], strerror(child_errno));
    return ret;
  }

  size_t limit = opt.max_output > 0 ? opt.max_output * 1024 : 0;
  Stream streams[2] = {
    {outpipe[0], &ret.output, limit, false},
    {errpipe[0], &ret.error, limit, false},
  };
  outpipe[0] = errpipe[0] = -1; // owned by streams now

  while (true) {
    int wait_ms = kPollIntervalMs;
    if (opt.wall_time > 0) {
      long remain = opt.wall_time - ElapsedUs(start);
      if (remain <= 0) {
        ret.timed_out = true;
        break;
      }
      wait_ms = std::min<long>(wait_ms, (remain + 999) / 1000);
    }
    // WNOWAIT keeps the process unreaped, so its pid still names the group below
    siginfo_t info = {};
    if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
      if (errno == EINTR) continue;
      ret.sys_errno = errno;
      spdlog::warn("waitid error: errno={} {}", errno, strerror(errno));
      break;
    }
    if (info.si_pid == pid) break;
    if (PollStreams(streams, wait_ms) < 0 && errno != EINTR) {
      ret.sys_errno = errno;
      spdlog::warn("poll error: errno={} {}", errno, strerror(errno));
      break;
    }
  }

  // kill the group: the main process on timeout, and anything it left behind
  kill(-pid, SIGKILL);
  // processes that left the group may still hold the pipes; don't wait for them
  while ((streams[0].fd >= 0 || streams[1].fd >= 0) && PollStreams(streams, kDrainTimeoutMs) > 0);
  for (auto& s : streams) CloseFd(s.fd);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  ret.time_us = ElapsedUs(start);
  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
  }
  spdlog::debug("ProcessExec pid={} exit_code={} signal={} timed_out={} time_us={}",
                pid, ret.exit_code, ret.signal, ret.timed_out, ret.time_us);
  return ret;
}

int RunningProcesses() {
  std::lock_guard lck(slot_mtx);
  return running_processes;
}
