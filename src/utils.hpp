// utils.hpp - Utility functions
#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace modulate {

// Logging
class Logger {
public:
  static Logger &getInstance();
  void init(bool verbose, const fs::path &log_path);
  void log(const std::string &level, const std::string &message);

private:
  Logger() = default;
  bool verbose_ = false;
  std::unique_ptr<std::ofstream> log_file_;
};

#define LOG_INFO(msg) Logger::getInstance().log("INFO", msg)
#define LOG_WARN(msg) Logger::getInstance().log("WARN", msg)
#define LOG_ERROR(msg) Logger::getInstance().log("ERROR", msg)
#define LOG_DEBUG(msg) Logger::getInstance().log("DEBUG", msg)

// File system utilities
bool ensure_dir_exists(const fs::path &path);
bool entry_exists(const fs::path &path);
bool is_empty_dir(const fs::path &path, std::error_code &ec);
void hard_link_file(const fs::path &from, const fs::path &to);

// Logical paths ("a/b/c", root is "")
std::string join_logical_path(const std::string &parent,
                              const std::string &name);
std::vector<std::string> split_logical_path(const std::string &path);

// Text helpers
std::string trim(const std::string &s, const char *chars = " \t");
std::string to_lower(std::string s);

} // namespace modulate
