#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <chrono>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// restores a global setting when leaving the test
template <class T>
class ScopedSetting {
  T& ref_;
  T orig_;
 public:
  ScopedSetting(T& ref, T val) : ref_(ref), orig_(ref) { ref_ = val; }
  ~ScopedSetting() { ref_ = orig_; }
};

class Stopwatch {
  std::chrono::steady_clock::time_point start_;
 public:
  Stopwatch() : start_(std::chrono::steady_clock::now()) {}
  double Seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
  }
};

// fresh empty directory under the test store
fs::path MakeScratchDir(const std::string& name);
void WriteBinary(const fs::path& path, const std::string& content);

// bytes of a tiny (1x1) PNG
extern const std::string kTinyPng;
// the same bytes as a Python bytes literal
std::string PythonBytesLiteral(const std::string&);

#endif  // TEST_UTILS_H_
