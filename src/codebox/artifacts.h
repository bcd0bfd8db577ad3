#ifndef CODEBOX_ARTIFACTS_H_
#define CODEBOX_ARTIFACTS_H_

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// extension matched case-insensitively against kImageExtensions
bool IsImageFile(const fs::path&);

// Base64 of every image file directly inside dir, in directory order.
// Subdirectories are not scanned.
std::vector<std::string> CollectImages(const fs::path& dir);

#endif  // CODEBOX_ARTIFACTS_H_
