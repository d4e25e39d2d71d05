#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>

#include <stdlib.h>

// Fresh directory under the system temp dir, removed on destruction.
struct TempDir {
  std::filesystem::path path;

  TempDir() {
    std::random_device rd;
    path = std::filesystem::temp_directory_path() /
           ("pdf2md_test_" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(path);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
};

inline void writeFile(const std::filesystem::path& p, const std::string& content) {
  std::ofstream ofs(p, std::ios::binary);
  ofs << content;
}

inline std::string readFile(const std::filesystem::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Sets an environment variable for the lifetime of the guard.
struct EnvGuard {
  std::string name;
  std::string saved;
  bool hadValue;

  EnvGuard(const std::string& n, const std::string& value) : name(n) {
    const char* old = std::getenv(name.c_str());
    hadValue = old != nullptr;
    if (old) saved = old;
    ::setenv(name.c_str(), value.c_str(), 1);
  }

  ~EnvGuard() {
    if (hadValue) ::setenv(name.c_str(), saved.c_str(), 1);
    else ::unsetenv(name.c_str());
  }

  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;
};

// Changes the working directory for the lifetime of the guard.
struct CwdGuard {
  std::filesystem::path saved;

  explicit CwdGuard(const std::filesystem::path& dir) : saved(std::filesystem::current_path()) {
    std::filesystem::current_path(dir);
  }

  ~CwdGuard() {
    std::error_code ec;
    std::filesystem::current_path(saved, ec);
  }

  CwdGuard(const CwdGuard&) = delete;
  CwdGuard& operator=(const CwdGuard&) = delete;
};

inline void writeExecutable(const std::filesystem::path& p, const std::string& content) {
  writeFile(p, content);
  std::filesystem::permissions(p, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add);
}
