// utils.cpp - Utility functions implementation
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>

namespace modulate {

// Logger implementation
Logger &Logger::getInstance() {
  static Logger instance;
  return instance;
}

void Logger::init(bool verbose, const fs::path &log_path) {
  verbose_ = verbose;

  if (!log_path.empty()) {
    if (log_path.has_parent_path()) {
      std::error_code ec;
      fs::create_directories(log_path.parent_path(), ec);
    }
    log_file_ = std::make_unique<std::ofstream>(log_path, std::ios::app);
  } else {
    log_file_.reset();
  }
}

void Logger::log(const std::string &level, const std::string &message) {
  // Skip DEBUG messages if not in verbose mode
  if (level == "DEBUG" && !verbose_) {
    return;
  }

  auto now = std::time(nullptr);
  char time_buf[64];
  std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                std::localtime(&now));

  std::string log_line =
      std::string("[") + time_buf + "] [" + level + "] " + message + "\n";

  if (log_file_ && log_file_->is_open()) {
    *log_file_ << log_line;
    log_file_->flush();
  }

  std::cerr << log_line;
}

// File system utilities
bool ensure_dir_exists(const fs::path &path) {
  try {
    if (!fs::exists(path)) {
      fs::create_directories(path);
    }
    return fs::is_directory(path);
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to create directory " + path.string() + ": " + e.what());
    return false;
  }
}

// True for anything occupying the path, dangling symlinks included.
bool entry_exists(const fs::path &path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path, ec));
}

bool is_empty_dir(const fs::path &path, std::error_code &ec) {
  fs::directory_iterator it(path, ec);
  if (ec) {
    return false;
  }
  return it == fs::directory_iterator();
}

void hard_link_file(const fs::path &from, const fs::path &to) {
  if (to.has_parent_path()) {
    fs::create_directories(to.parent_path());
  }
  fs::create_hard_link(from, to);
}

std::string join_logical_path(const std::string &parent,
                              const std::string &name) {
  if (parent.empty()) {
    return name;
  }
  return parent + "/" + name;
}

std::vector<std::string> split_logical_path(const std::string &path) {
  std::vector<std::string> parts;
  std::stringstream ss(path);
  std::string part;
  while (std::getline(ss, part, '/')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

std::string trim(const std::string &s, const char *chars) {
  auto start = s.find_first_not_of(chars);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(chars);
  return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace modulate
