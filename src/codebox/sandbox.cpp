#include <codebox/sandbox.h>

#include <cstdlib>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "state.h"
#include "process.h"
#include "artifacts.h"

std::string kPythonExecutable = "python3";
long kExecuteTimeout = 30L * 1'000'000;
long kInstallTimeout = 300L * 1'000'000;
long kSetupTimeout = 120L * 1'000'000;
long kMaxOutput = 0;

const char kTimeoutMessage[] = "Execution timed out.";
const char kInstallErrorPrefix[] = "Error installing dependencies: ";

namespace {

const std::string& ValidatedId(const std::string& id) {
  if (!IsValidSandboxId(id)) throw SandboxError(fmt::format("invalid sandbox id \"{}\"", id));
  return id;
}

inline std::string Seconds(long us) {
  return fmt::format("{:g}", us / 1e6);
}

} // namespace

Sandbox::Sandbox(const std::string& id, const fs::path& store_root, bool setup) :
    id_(ValidatedId(id.empty() ? GenerateSandboxId() : id)),
    root_(fs::absolute(SandboxRootPath(store_root, id_))),
    env_path_(SandboxEnvPath(root_)),
    lock_(sandbox_lock[id_]),
    state_(SandboxState::UNINITIALIZED),
    resumed_(false) {
  std::lock_guard lck(*lock_);
  std::error_code ec;
  if (!id.empty() && fs::is_directory(env_path_, ec)) {
    spdlog::info("Resuming existing sandbox: {}", id_);
    resumed_ = true;
  } else if (setup) {
    spdlog::info("Initializing sandbox: {} at {}", id_, root_.c_str());
    Setup();
  } else {
    spdlog::debug("Sandbox {} has no environment; not building it", id_);
    return;
  }
  state_ = SandboxState::READY;
}

void Sandbox::Setup() {
  std::error_code ec;
  if (fs::is_directory(env_path_, ec)) return;
  bool created_root = !fs::exists(root_, ec);
  if (!CreateDirs(root_)) {
    throw SandboxError(fmt::format("could not create sandbox directory {}", root_.c_str()));
  }

  spdlog::info("Creating virtual environment in {}...", env_path_.c_str());
  ProcessOptions opt;
  opt.command = {kPythonExecutable, "-m", "venv", env_path_.string()};
  opt.workdir = root_.string();
  opt.wall_time = kSetupTimeout;
  opt.max_output = kMaxOutput;
  ProcessResult res = ProcessExec(opt);
  std::string reason;
  if (res.sys_errno) {
    reason = fmt::format("cannot run {}: {}", kPythonExecutable, strerror(res.sys_errno));
  } else if (res.timed_out) {
    reason = fmt::format("timed out after {} seconds", Seconds(kSetupTimeout));
  } else if (res.signal) {
    reason = fmt::format("killed by signal {}", res.signal);
  } else if (res.exit_code != 0) {
    reason = fmt::format("exited with status {}: {}", res.exit_code, res.error);
  }
  if (reason.empty()) {
    spdlog::info("Virtual environment created.");
    return;
  }
  spdlog::error("Failed to create virtual environment for sandbox {}: {}", id_, reason);
  // never leave something behind that a later resume would accept
  RemoveAll(created_root ? root_ : env_path_);
  throw SandboxError("could not prepare execution environment: " + reason);
}

void Sandbox::CheckUsable(const char* operation) const {
  SandboxState state = state_;
  if (state == SandboxState::READY || state == SandboxState::EXECUTING) return;
  throw SandboxError(fmt::format("{} called on sandbox {} in state {}",
                                 operation, id_, SandboxStateName(state)));
}

std::vector<std::string> Sandbox::EnvVars() const {
  std::string path = EnvBinPath(env_path_).string();
  if (const char* orig = getenv("PATH")) path = path + ":" + orig;
  return {"VIRTUAL_ENV=" + env_path_.string(), "PATH=" + path};
}

std::optional<std::string> Sandbox::Install(const std::vector<std::string>& packages) {
  std::lock_guard lck(*lock_);
  CheckUsable("Install");
  if (packages.empty()) return std::nullopt;
  for (auto& i : packages) {
    if (i.empty() || i[0] == '-') {
      std::string msg = kInstallErrorPrefix + fmt::format("invalid package name \"{}\"", i);
      spdlog::error(msg);
      return msg;
    }
  }

  ProcessResult res;
  {
    ExecutingGuard executing(state_);
    spdlog::info("Installing dependencies: {}...", fmt::format("{}", packages));
    ProcessOptions opt;
    opt.command = {EnvInstaller(env_path_).string(), "install", "--no-input", "--disable-pip-version-check"};
    opt.command.insert(opt.command.end(), packages.begin(), packages.end());
    opt.workdir = root_.string();
    opt.envs = EnvVars();
    opt.wall_time = kInstallTimeout;
    opt.max_output = kMaxOutput;
    res = ProcessExec(opt);
  }

  std::string msg;
  if (res.sys_errno) {
    msg = fmt::format("cannot run pip: {}", strerror(res.sys_errno));
  } else if (res.timed_out) {
    msg = fmt::format("installation timed out after {} seconds", Seconds(kInstallTimeout));
  } else if (res.signal) {
    msg = fmt::format("pip killed by signal {}", res.signal);
  } else if (res.exit_code != 0) {
    msg = res.error;
  } else {
    spdlog::info("Dependencies installed successfully.");
    return std::nullopt;
  }
  msg = kInstallErrorPrefix + msg;
  spdlog::error(msg);
  return msg;
}

ExecutionResult Sandbox::Execute(const std::string& code) {
  std::lock_guard lck(*lock_);
  CheckUsable("Execute");
  ExecutingGuard executing(state_);
  ExecutionResult ret;
  spdlog::info("Preparing to run code in sandbox {}...", id_);

  fs::path script = SandboxScriptPath(root_);
  if (!WriteFile(script, code)) {
    ret.status = ExecutionStatus::EE;
    ret.error = fmt::format("could not write script file {}", script.c_str());
  } else {
    spdlog::info("Executing script: {}", script.c_str());
    ProcessOptions opt;
    opt.command = {EnvInterpreter(env_path_).string(), kScriptName};
    opt.workdir = root_.string();
    opt.envs = EnvVars();
    opt.wall_time = kExecuteTimeout;
    opt.max_output = kMaxOutput;
    ProcessResult res = ProcessExec(opt);
    ret.time_us = res.time_us;
    if (res.sys_errno) {
      ret.status = ExecutionStatus::EE;
      ret.error = strerror(res.sys_errno);
      spdlog::error("Execution failed: {}", ret.error);
    } else if (res.timed_out) {
      ret.status = ExecutionStatus::TLE;
      ret.error = kTimeoutMessage;
      spdlog::error("Execution timed out.");
    } else {
      if (res.signal) {
        ret.status = ExecutionStatus::SIG;
        ret.exit_code = res.signal;
      } else {
        ret.status = res.exit_code ? ExecutionStatus::RE : ExecutionStatus::OK;
        ret.exit_code = res.exit_code;
      }
      ret.output = std::move(res.output);
      ret.error = std::move(res.error);
      spdlog::info("Execution completed: {} ({}), time_us={}",
                   ExecutionStatusToAbr(ret.status), ret.exit_code, ret.time_us);
    }
  }

  ret.images = CollectImages(root_);
  if (ret.images.size()) spdlog::info("Captured {} images.", ret.images.size());
  return ret;
}

void Sandbox::Cleanup() {
  std::lock_guard lck(*lock_);
  std::error_code ec;
  if (fs::exists(root_, ec)) {
    spdlog::info("Cleaning up sandbox: {}", root_.c_str());
    RemoveAll(root_); // failure already logged
  }
  state_ = SandboxState::DESTROYED;
}
