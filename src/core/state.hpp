// core/state.hpp - Runtime state management
#pragma once

#include "handle.hpp"
#include "tree.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace modulate {

// One flattened tree entry. Directories leave `uuid` empty.
struct TreeEntry {
  NodeType type = NodeType::File;
  std::string path;
  std::string uuid;

  bool operator==(const TreeEntry &other) const {
    return type == other.type && path == other.path && uuid == other.uuid;
  }
};

using UuidOf = std::function<std::string(const SourceHandle &)>;
using HandleOf = std::function<SourceHandle(const std::string &)>;

std::vector<TreeEntry> flatten_tree(const ProvenancedNode &tree,
                                    const UuidOf &uuid_of);
ProvenancedNode build_tree(const std::vector<TreeEntry> &entries,
                           const HandleOf &handle_of);

struct RuntimeState {
  std::vector<std::string> active_sources; // uuids, lowest priority first
  std::vector<TreeEntry> deployed;
  // What an interrupted synchronization left on disk
  bool has_pending = false;
  std::vector<TreeEntry> pending_applied;

  bool save(const fs::path &path) const;
};

// A missing file yields an empty state; a malformed one throws
// OverlayError(StateInvalid).
RuntimeState load_runtime_state(const fs::path &path);

} // namespace modulate
