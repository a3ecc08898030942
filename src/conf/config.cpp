// conf/config.cpp - Configuration implementation
#include "config.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include <fstream>
#include <stdexcept>

namespace modulate {

Config::Config()
    : working_dir(DEFAULT_WORKING_DIR), backup_dir(DEFAULT_BACKUP_DIR),
      mods_dir(DEFAULT_MODS_DIR), state_file(DEFAULT_STATE_FILE) {}

Config Config::load_default() {
  Config config;
  // Try to load from default location if exists
  fs::path default_path = CONFIG_FILENAME;
  if (fs::exists(default_path)) {
    try {
      return from_file(default_path);
    } catch (const std::exception &e) {
      LOG_WARN("Failed to load default config, using defaults: " +
               std::string(e.what()));
    }
  }
  return config;
}

Config Config::from_file(const fs::path &path) {
  Config config;

  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file " + path.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;

    auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos)
      continue;

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1), " \t\"");

    if (key == "working_dir")
      config.working_dir = value;
    else if (key == "backup_dir")
      config.backup_dir = value;
    else if (key == "mods_dir")
      config.mods_dir = value;
    else if (key == "state_file")
      config.state_file = value;
    else if (key == "log_file")
      config.log_file = value;
    else if (key == "verbose")
      config.verbose = (value == "true");
    else if (key == "conflict_policy") {
      if (!parse_conflict_policy(value, config.conflict_policy)) {
        throw std::runtime_error("Invalid conflict_policy '" + value +
                                 "' (expected reject, keep or override)");
      }
    } else
      LOG_WARN("Ignoring unknown config key: " + key);
  }

  return config;
}

bool Config::save_to_file(const fs::path &path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }

  file << "# modulate configuration\n";
  file << "working_dir = \"" << working_dir.string() << "\"\n";
  file << "backup_dir = \"" << backup_dir.string() << "\"\n";
  file << "mods_dir = \"" << mods_dir.string() << "\"\n";
  file << "state_file = \"" << state_file.string() << "\"\n";
  if (!log_file.empty()) {
    file << "log_file = \"" << log_file.string() << "\"\n";
  }
  file << "verbose = " << (verbose ? "true" : "false") << "\n";
  file << "# What to do when a path is a file in one source and a directory\n";
  file << "# in another: reject (fail the sync), keep (leave the lower priority\n";
  file << "# entry in place, nothing changes) or override (higher priority wins)\n";
  file << "conflict_policy = " << to_string(conflict_policy) << "\n";

  return file.good();
}

void Config::merge_with_cli(const fs::path &working_dir_override,
                            const fs::path &backup_dir_override,
                            const fs::path &mods_dir_override,
                            bool verbose_override) {
  if (!working_dir_override.empty()) {
    working_dir = working_dir_override;
  }
  if (!backup_dir_override.empty()) {
    backup_dir = backup_dir_override;
  }
  if (!mods_dir_override.empty()) {
    mods_dir = mods_dir_override;
  }
  if (verbose_override) {
    verbose = true;
  }
}

} // namespace modulate
