#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);
bool ReadFile(const fs::path&, std::string& content);

#endif  // CODEBOX_UTILS_H_
