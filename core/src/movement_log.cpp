#include "lcm/movement_log.h"

#include "lcm/log.h"

#include <fstream>
#include <mutex>
#include <string>

namespace lcm::movement_log {

namespace {
std::mutex g_mutex;
std::ofstream g_file;
size_t g_lines = 0;
} // namespace

void open(const std::filesystem::path& path, std::string_view header) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_file.is_open()) {
    g_file.close();
  }
  g_lines = 0;
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  g_file.open(path, std::ios::out | std::ios::trunc);
  if (!g_file.is_open()) {
    log::warn("movement_log: cannot open " + path.string());
    return;
  }
  if (!header.empty()) {
    g_file << "# " << header << "\n";
  }
}

size_t close() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_file.is_open()) {
    g_file.close();
  }
  return g_lines;
}

bool enabled() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_file.is_open();
}

void write(std::string_view line) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_file.is_open()) return;
  g_file << line << "\n";
  ++g_lines;
}

size_t lines_written() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_lines;
}

} // namespace lcm::movement_log
