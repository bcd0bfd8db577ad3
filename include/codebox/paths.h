#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// base directory holding one subdirectory per sandbox
extern fs::path kStoreRoot;

fs::path SandboxRootPath(const fs::path& store_root, const std::string& id);
// paths inside a sandbox root
fs::path SandboxEnvPath(const fs::path& root);
fs::path SandboxScriptPath(const fs::path& root);

#endif  // INCLUDE_CODEBOX_PATHS_H_
