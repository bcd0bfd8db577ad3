#include "artifacts.h"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>
#include <codebox/sandbox.h>
#include "utils.h"

std::vector<std::string> kImageExtensions = {".png", ".jpg", ".jpeg", ".gif", ".svg"};

bool IsImageFile(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (ext.empty()) return false;
  return std::find(kImageExtensions.begin(), kImageExtensions.end(), ext) != kImageExtensions.end();
}

std::vector<std::string> CollectImages(const fs::path& dir) {
  std::vector<std::string> ret;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    spdlog::warn("Cannot scan {} for images: {}", dir.c_str(), ec.message());
    return ret;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const fs::directory_entry& entry = *it;
    if (!entry.is_regular_file(ec) || !IsImageFile(entry.path())) continue;
    std::string content;
    if (!ReadFile(entry.path(), content)) continue; // already warned
    spdlog::debug("Collected image {}, size {}", entry.path().c_str(), content.size());
    ret.push_back(Base64Encode(content));
  }
  if (ec) spdlog::warn("Error while scanning {}: {}", dir.c_str(), ec.message());
  return ret;
}
