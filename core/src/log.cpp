#include "lcm/log.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lcm::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "lcm";
std::filesystem::path g_root_path;
Level g_level = Level::Info;

std::tm local_now() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

std::string timestamp_now() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string timestamp_for_filename() {
  const std::tm tm = local_now();
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
  }
  return "INFO";
}

void log_line(Level level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (static_cast<int>(level) < static_cast<int>(g_level)) {
    return;
  }
  const std::string line = "[" + timestamp_now() + "][" + level_name(level) + "] " + std::string(msg);
  if (level >= Level::Warn) {
    std::cerr << line << "\n";
  } else {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  init("lcm", std::filesystem::current_path());
}

void init(const std::string& app_name, const std::filesystem::path& root) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    g_root_path = root;
    const std::filesystem::path log_dir = g_root_path / "build" / "logs";
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (!ec) {
      const std::string file_name = g_app_name + "_" + timestamp_for_filename() + ".log";
      if (g_log_file.is_open()) {
        g_log_file.close();
      }
      g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
    }
  }
  log_line(Level::Info, "log init: " + app_name);
#ifdef LCM_DEBUG
  log_line(Level::Info, "build: debug");
#else
  log_line(Level::Info, "build: release");
#endif
}

void shutdown() {
  log_line(Level::Info, "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_level(Level level) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_level = level;
}

Level level() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  return g_level;
}

bool parse_level(std::string_view name, Level& out) {
  std::string lower(name);
  for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "debug") {
    out = Level::Debug;
  } else if (lower == "info") {
    out = Level::Info;
  } else if (lower == "warn" || lower == "warning") {
    out = Level::Warn;
  } else if (lower == "error") {
    out = Level::Error;
  } else {
    return false;
  }
  return true;
}

void debug(std::string_view msg) {
  log_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

void clear_recent() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_ring.clear();
}

} // namespace lcm::log
