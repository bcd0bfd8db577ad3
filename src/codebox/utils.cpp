#include "utils.h"

#include <mutex>
#include <random>
#include <fstream>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <iterator>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

std::mutex rng_mtx;
std::mt19937_64 rng{std::random_device{}()};

constexpr char kBase64Table[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr size_t kMaxSandboxIdLength = 64;

} // namespace

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG3(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusToDesc, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

static const char* kStatusAbrTable[] = {
#define X(name, abr, desc) abr,
  ENUM_EXECUTION_STATUS_
#undef X
};

const char* ExecutionStatusToAbr(ExecutionStatus status) {
  return kStatusAbrTable[(int)status];
}

ExecutionStatus AbrToExecutionStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kStatusAbrTable) / sizeof(kStatusAbrTable[0]); i++) {
    if (str == kStatusAbrTable[i]) return (ExecutionStatus)i;
  }
  return ExecutionStatus::EE;
}

#define X(...) X_RETURN_ARG1(SandboxState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SandboxStateName, SandboxState, ENUM_SANDBOX_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG3

std::string GenerateSandboxId() {
  uint64_t hi, lo;
  {
    std::lock_guard lck(rng_mtx);
    hi = rng();
    lo = rng();
  }
  hi = (hi & ~0xf000ULL) | 0x4000ULL; // version 4
  lo = (lo & ~(0xcULL << 60)) | (0x8ULL << 60); // variant 10xx
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                     lo >> 48, lo & 0xffffffffffffULL);
}

bool IsValidSandboxId(const std::string& id) {
  if (id.empty() || id.size() > kMaxSandboxIdLength) return false;
  for (char c : id) {
    if (!isalnum((unsigned char)c) && c != '-' && c != '_') return false;
  }
  return true;
}

std::string Base64Encode(const std::string& str) {
  std::string ret;
  ret.reserve((str.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 3 <= str.size(); i += 3) {
    unsigned char v[3] = {
      static_cast<unsigned char>(str[i]),
      static_cast<unsigned char>(str[i+1]),
      static_cast<unsigned char>(str[i+2])
    };
    ret += kBase64Table[v[0] >> 2];
    ret += kBase64Table[(v[0] & 0x03) << 4 | v[1] >> 4];
    ret += kBase64Table[(v[1] & 0x0f) << 2 | v[2] >> 6];
    ret += kBase64Table[v[2] & 0x3f];
  }
  if (i == str.size()) return ret;
  unsigned char v[2] = {static_cast<unsigned char>(str[i])};
  if (i + 1 < str.size()) v[1] = static_cast<unsigned char>(str[i+1]);
  ret += kBase64Table[v[0] >> 2];
  ret += kBase64Table[(v[0] & 0x03) << 4 | v[1] >> 4];
  ret += i + 1 < str.size() ? kBase64Table[(v[1] & 0x0f) << 2] : '=';
  ret += '=';
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (fout) fout.write(content.data(), content.size());
  if (fout) fout.close();
  if (!fout) {
    spdlog::warn("Failed writing {}", path.c_str());
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) goto err;
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  if (fin.bad()) goto err;
  return true;
err:
  spdlog::warn("Failed reading {}", path.c_str());
  return false;
}
