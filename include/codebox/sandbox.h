#ifndef INCLUDE_CODEBOX_SANDBOX_H_
#define INCLUDE_CODEBOX_SANDBOX_H_

#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include "paths.h"

extern std::string kPythonExecutable; // used to build environments
extern int kMaxParallel; // concurrent subprocesses; 0 = no limit
// us
extern long kExecuteTimeout;
extern long kInstallTimeout;
extern long kSetupTimeout;
// KiB per captured stream; 0 = unlimited
extern long kMaxOutput;
// lowercase, with leading dot
extern std::vector<std::string> kImageExtensions;

extern const char kTimeoutMessage[];
extern const char kInstallErrorPrefix[];

#define ENUM_EXECUTION_STATUS_ \
  X(OK, "OK", "Exited normally") \
  X(RE, "RE", "Runtime Error (exited with nonzero status)") \
  X(SIG, "SIG", "Runtime Error (exited with signal)") \
  X(TLE, "TLE", "Execution timed out") \
  X(EE, "EE", "Execution Error")
enum class ExecutionStatus {
#define X(name, abr, desc) name,
  ENUM_EXECUTION_STATUS_
#undef X
};

#define ENUM_SANDBOX_STATE_ \
  X(UNINITIALIZED) \
  X(READY) \
  X(EXECUTING) /* install or execute in flight */ \
  X(DESTROYED)
enum class SandboxState {
#define X(name) name,
  ENUM_SANDBOX_STATE_
#undef X
};

// what the code generator hands over
struct CodeRequest {
  std::string code;
  std::vector<std::string> dependencies;
};

class ExecutionResult {
 public:
  ExecutionStatus status;
  int exit_code; // signal number if status == SIG
  long time_us;
  std::string output, error; // stdout & stderr
  std::vector<std::string> images; // base64
  ExecutionResult() : status(ExecutionStatus::OK), exit_code(0), time_us(0) {}
};

// The sandbox itself is unusable: the environment cannot be built,
// the id is invalid, or the sandbox was already destroyed.
// Failures of the executed code are never reported this way.
class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Sandbox {
  // keeps track of live instances for WipeStore
  struct InstanceCounter {
    InstanceCounter();
    ~InstanceCounter();
  };
  InstanceCounter counter_;
  std::string id_;
  fs::path root_, env_path_;
  std::shared_ptr<std::mutex> lock_; // shared by all objects with the same id
  std::atomic<SandboxState> state_;
  bool resumed_;

  void Setup();
  void CheckUsable(const char* operation) const;
  std::vector<std::string> EnvVars() const;
 public:
  // Resume the sandbox `id` if its environment exists; otherwise create it
  // (a new id is generated if empty). If `setup` is false, a missing
  // environment is not built and the sandbox stays UNINITIALIZED; such an
  // instance can only be cleaned up.
  // Throws SandboxError if the environment cannot be prepared.
  explicit Sandbox(const std::string& id = "", const fs::path& store_root = kStoreRoot,
                   bool setup = true);
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  const std::string& Id() const { return id_; }
  const fs::path& RootPath() const { return root_; }
  const fs::path& EnvPath() const { return env_path_; }
  SandboxState State() const { return state_; }
  bool Resumed() const { return resumed_; }

  // nullopt on success or if packages is empty; otherwise an error message
  std::optional<std::string> Install(const std::vector<std::string>& packages);
  // Script failures (nonzero exit, signal, timeout) are reported in the result
  ExecutionResult Execute(const std::string& code);
  // Remove the sandbox directory; idempotent
  void Cleanup();
};

// number of Sandbox objects currently alive in this process
long LiveSandboxCount();

#endif  // INCLUDE_CODEBOX_SANDBOX_H_
