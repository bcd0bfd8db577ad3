#include <fcntl.h>
#include <unistd.h>
#include <cctype>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/logger.h>
#include <codebox/session.h>
#include <codebox/store.h>
#include "server_io.h"

namespace {

bool to_lock = true;
bool to_wipe = true;

std::vector<std::string> ParseExtensions(const std::string& str) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (item.empty()) continue;
    for (auto& c : item) c = std::tolower((unsigned char)c);
    if (item[0] != '.') item = '.' + item;
    ret.push_back(item);
  }
  return ret;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string store_root = ini[""]["store_root"] | "";
  std::string python = ini[""]["python"] | "";
  std::string image_extensions = ini[""]["image_extensions"] | "";
  if (store_root.size()) kStoreRoot = store_root;
  if (python.size()) kPythonExecutable = python;
  if (image_extensions.size()) kImageExtensions = ParseExtensions(image_extensions);
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_request_queue_size"] | kMaxQueue;
  kExecuteTimeout = (ini[""]["execute_timeout_sec"] | (kExecuteTimeout / 1'000'000)) * 1'000'000;
  kInstallTimeout = (ini[""]["install_timeout_sec"] | (kInstallTimeout / 1'000'000)) * 1'000'000;
  kSetupTimeout = (ini[""]["setup_timeout_sec"] | (kSetupTimeout / 1'000'000)) * 1'000'000;
  kMaxOutput = (ini[""]["max_output_per_stream_mb"] | (kMaxOutput / 1024)) * 1024;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/codebox.conf"))
    .help("Path of configuration file; a missing default file is ignored");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel subprocesses");
  parser.add_argument("-s", "--store-root")
    .help("Directory holding the sandboxes");
  parser.add_argument("--python")
    .help("Python interpreter used to create environments");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other instances using the same store");
  parser.add_argument("--no-wipe")
    .default_value(false)
    .implicit_value(true)
    .help("Keep sandboxes left over from a previous run");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    if (parser.is_used("--config")) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(1);
    }
    spdlog::info("No configuration file {}; using defaults", std::string(config_file));
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present("--store-root")) {
    kStoreRoot = val.value();
  }
  if (auto val = parser.present("--python")) {
    kPythonExecutable = val.value();
  }
  to_lock = parser["--no-lock"] == false;
  to_wipe = parser["--no-wipe"] == false;
}

// held until the process exits
bool LockFile() {
  fs::path lock_file = kStoreRoot;
  lock_file += ".lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another instance is using the sandbox store {}.", kStoreRoot.c_str());
    return 1;
  }
  if (to_wipe && !WipeStore(kStoreRoot)) {
    spdlog::error("Failed to remove stale sandboxes in {}.", kStoreRoot.c_str());
    return 1;
  }
  spdlog::info("Serving requests; store={} parallel={} timeout={}us",
               kStoreRoot.c_str(), kMaxParallel, kExecuteTimeout);
  SessionBinder binder(kStoreRoot);
  ServerWorkLoop(std::cin, std::cout, binder);
}
