#include <codebox/store.h>

#include <atomic>

#include <spdlog/spdlog.h>
#include <codebox/sandbox.h>
#include "utils.h"

namespace {

std::atomic_long live_sandboxes = 0;

} // namespace

Sandbox::InstanceCounter::InstanceCounter() {
  ++live_sandboxes;
}
Sandbox::InstanceCounter::~InstanceCounter() {
  --live_sandboxes;
}

long LiveSandboxCount() {
  return live_sandboxes;
}

bool WipeStore(const fs::path& store_root) {
  if (long live = LiveSandboxCount(); live > 0) {
    spdlog::error("Refusing to wipe sandbox store {}: {} sandboxes are alive", store_root.c_str(), live);
    return false;
  }
  std::error_code ec;
  if (!fs::exists(store_root, ec)) {
    spdlog::debug("Sandbox store {} does not exist", store_root.c_str());
    return true;
  }
  spdlog::info("Removing stale sandbox store {}", store_root.c_str());
  return RemoveAll(store_root);
}
