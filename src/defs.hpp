// Constants and definitions
#pragma once

namespace modulate {

// Source layout
constexpr const char *METADATA_FILE_NAME = "mod.toml";

// Synthetic root of every merged tree, never materialized on disk
constexpr const char *ROOT_NODE_NAME = "root";

// Defaults, relative to the current directory
constexpr const char *CONFIG_FILENAME = "modulate.conf";
constexpr const char *DEFAULT_WORKING_DIR = "./working_dir";
constexpr const char *DEFAULT_BACKUP_DIR = "./.modulate/backup";
constexpr const char *DEFAULT_MODS_DIR = "./mods";
constexpr const char *DEFAULT_STATE_FILE = "./.modulate/state.json";

// Runtime state format
constexpr int STATE_VERSION = 1;

} // namespace modulate
