#include "cosmos/util/file_io.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cosmos {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned> g_temp_counter{0};

fs::path temp_sibling_path(const fs::path& target) {
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  for (int attempt = 0; attempt < 100; ++attempt) {
    const std::string name = target.filename().string() + ".tmp." + std::to_string(now) + "." +
                             std::to_string(g_temp_counter.fetch_add(1));
    fs::path candidate = target.has_parent_path() ? target.parent_path() / name : fs::path(name);
    std::error_code ec;
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }
  throw std::runtime_error("Failed to pick a temporary file name next to: " + target.string());
}

// Removes the temp file unless the rename succeeded.
struct TempFileGuard {
  fs::path path;
  bool armed{true};
  explicit TempFileGuard(fs::path p) : path(std::move(p)) {}
  ~TempFileGuard() {
    if (!armed) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(fs::path(path), std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
  }
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(fs::path(path), ec) && !ec;
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  TempFileGuard tmp(temp_sibling_path(target));
  {
    std::ofstream out(tmp.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path.string());
  }

  std::error_code ec;
  fs::rename(tmp.path, target, ec);
  if (ec) {
    // Some platforms refuse to rename over an existing file.
    std::error_code rm_ec;
    fs::remove(target, rm_ec);
    ec.clear();
    fs::rename(tmp.path, target, ec);
  }
  if (ec) throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  tmp.armed = false;
}

} // namespace cosmos
