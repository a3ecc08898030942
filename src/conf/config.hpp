// conf/config.hpp - Configuration management
#pragma once

#include "../core/tree.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace modulate {

struct Config {
  fs::path working_dir;
  fs::path backup_dir;
  fs::path mods_dir;
  fs::path state_file;
  fs::path log_file;
  bool verbose = false;
  ConflictPolicy conflict_policy = ConflictPolicy::Reject;

  Config();

  static Config load_default();
  static Config from_file(const fs::path &path);
  bool save_to_file(const fs::path &path) const;

  void merge_with_cli(const fs::path &working_dir_override,
                      const fs::path &backup_dir_override,
                      const fs::path &mods_dir_override,
                      bool verbose_override);
};

} // namespace modulate
