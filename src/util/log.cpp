#include "cosmos/util/log.h"

#include <iostream>
#include <mutex>

#include "cosmos/util/strings.h"

namespace cosmos::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    default: return "";
  }
}

void emit(Level l, const std::string& msg) {
  if (l < g_level || g_level == Level::Off) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

bool parse_level(const std::string& raw, Level& out) {
  const std::string s = to_lower(trim_copy(raw));
  if (s == "debug") {
    out = Level::Debug;
    return true;
  }
  if (s == "info") {
    out = Level::Info;
    return true;
  }
  if (s == "warn" || s == "warning") {
    out = Level::Warn;
    return true;
  }
  if (s == "error" || s == "err") {
    out = Level::Error;
    return true;
  }
  if (s == "off" || s == "none") {
    out = Level::Off;
    return true;
  }
  return false;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace cosmos::log
