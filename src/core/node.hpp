// core/node.hpp - Raw source trees
#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace modulate {

enum class NodeType { File, Directory };

// One entry of a scanned source. Anything that is not a directory
// (symlinks included) is a File leaf.
struct RawNode {
  std::string name;
  NodeType type = NodeType::Directory;
  std::map<std::string, RawNode> children;

  bool is_dir() const { return type == NodeType::Directory; }
  size_t count_files() const;
};

// Throws OverlayError(SourceNotFound) if root is not a readable directory.
RawNode scan_tree(const fs::path &root);

} // namespace modulate
