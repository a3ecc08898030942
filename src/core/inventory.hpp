// core/inventory.hpp - Source inventory
#pragma once

#include "node.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace modulate {

struct SourceMetadata {
  std::string name;
  std::string version;
  std::string uuid;
  std::string author = "";
  std::string description = "";
};

struct Source {
  SourceMetadata metadata;
  fs::path root;
  RawNode tree;
};

bool is_valid_version(const std::string &version);
bool is_valid_uuid(const std::string &uuid);

// Throws OverlayError(MetadataMissing / MetadataInvalid).
SourceMetadata parse_metadata(const fs::path &metadata_file);

// Loads metadata and scans the tree of one source directory.
Source load_source(const fs::path &dir);

// Every loadable source under mods_dir, sorted by directory name.
std::vector<Source> discover_sources(const fs::path &mods_dir);

} // namespace modulate
