#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace armgen::log {

// Console + ring buffer only.
void init();
// Also appends to <root>/build/logs/<app_name>_<timestamp>.log.
void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace armgen::log
