#ifndef CODEBOX_PROCESS_H_
#define CODEBOX_PROCESS_H_

#include <string>
#include <vector>

class ProcessOptions;
// argv & envp arrays for exec, prepared before fork()
class ProcessCtx {
 private:
  std::vector<char*> argv_buf_;
  std::vector<char*> env_buf_;
 public:
  // points into the strings of opt; opt must outlive this and stay unmodified
  explicit ProcessCtx(const ProcessOptions& opt);
  ProcessCtx(const ProcessCtx&) = delete;
  ProcessCtx& operator=(const ProcessCtx&) = delete;

  char* const* Argv() const { return argv_buf_.data(); }
  char* const* Envp() const { return env_buf_.data(); }
};

class ProcessOptions {
 public:
  std::vector<std::string> command; // searched in PATH if command[0] has no '/'
  std::string workdir;
  bool preserve_env; // start from the current environment
  std::vector<std::string> envs; // NAME=value; overrides preserved ones
  long wall_time; // us; 0 = unlimited
  long max_output; // KiB per stream; 0 = unlimited

  ProcessOptions() :
      preserve_env(true),
      wall_time(0),
      max_output(0) {}
};

struct ProcessResult {
  int sys_errno; // nonzero if the process could not be started or supervised
  bool timed_out; // killed because wall_time was exceeded
  int exit_code;
  int signal; // 0 if exited normally
  long time_us;
  std::string output, error;

  ProcessResult() : sys_errno(0), timed_out(false), exit_code(0), signal(0), time_us(0) {}
};

// Runs the command in its own process group with stdin from /dev/null.
// Blocks until the process exits or wall_time expires; on expiry the whole
// process group is killed. Processes left in the group after the main
// process exits are killed as well.
// At most kMaxParallel calls run at the same time; others wait.
ProcessResult ProcessExec(const ProcessOptions&);

// number of ProcessExec calls currently running (not waiting for a slot)
int RunningProcesses();

#endif  // CODEBOX_PROCESS_H_
