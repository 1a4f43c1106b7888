#include "armgen/log.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace armgen::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "armgen";

std::tm local_now() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
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

void log_line(const char* level, std::string_view msg) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line = "[" + timestamp_now() + "][" + level + "] " + std::string(msg);
  std::cout << line << "\n";
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
  log_line("INFO", "log init");
}

void init(const std::string& app_name, const std::filesystem::path& root) {
  g_app_name = app_name;
  const std::filesystem::path log_dir = root / "build" / "logs";
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  if (!ec) {
    const std::string file_name = g_app_name + "_" + timestamp_for_filename() + ".log";
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
  }
  log_line("INFO", "log init");
  if (ec) {
    log_line("WARN", "log directory unavailable: " + log_dir.string());
  }
#ifdef ARMGEN_DEBUG
  log_line("INFO", "build: debug");
#else
  log_line("INFO", "build: release");
#endif
}

void shutdown() {
  log_line("INFO", "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void info(std::string_view msg) {
  log_line("INFO", msg);
}

void warn(std::string_view msg) {
  log_line("WARN", msg);
}

void error(std::string_view msg) {
  log_line("ERROR", msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

} // namespace armgen::log
