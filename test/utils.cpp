#include "utils.h"

#include <fstream>
#include <fmt/core.h>
#include <codebox/paths.h>

const std::string kTinyPng(
    "\x89PNG\r\n\x1a\n\0\0\0\rIHDR\0\0\0\x01\0\0\0\x01\x08\x06\0\0\0\x1f\x15\xc4\x89"
    "\0\0\0\rIDATx\x9c" "c\xf8\xff\xff?\0\x05\xfe\x02\xfe\xa7\x35\x81\x84"
    "\0\0\0\0IEND\xae" "B`\x82", 69);

fs::path MakeScratchDir(const std::string& name) {
  fs::path dir = kStoreRoot / "scratch" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void WriteBinary(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  fout.write(content.data(), content.size());
}

std::string PythonBytesLiteral(const std::string& str) {
  std::string ret = "b'";
  for (unsigned char c : str) ret += fmt::format("\\x{:02x}", c);
  return ret + "'";
}
