// core/node.cpp - Raw source tree scanner
#include "node.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"

namespace modulate {

size_t RawNode::count_files() const {
  if (!is_dir()) {
    return 1;
  }
  size_t count = 0;
  for (const auto &[name, child] : children) {
    count += child.count_files();
  }
  return count;
}

static void collect_entries(RawNode &node, const fs::path &dir) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw OverlayError(ErrorKind::SourceNotFound,
                       "cannot read " + dir.string() + ": " + ec.message());
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const auto &entry = *it;
    std::string name = entry.path().filename().string();
    if (name == METADATA_FILE_NAME) {
      continue;
    }

    RawNode child;
    child.name = name;
    std::error_code type_ec;
    if (entry.symlink_status(type_ec).type() == fs::file_type::directory) {
      child.type = NodeType::Directory;
      collect_entries(child, entry.path());
    } else {
      child.type = NodeType::File;
    }
    node.children.emplace(name, std::move(child));
  }

  if (ec) {
    throw OverlayError(ErrorKind::SourceNotFound,
                       "cannot read " + dir.string() + ": " + ec.message());
  }
}

RawNode scan_tree(const fs::path &root) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw OverlayError(ErrorKind::SourceNotFound,
                       root.string() + " is not a directory");
  }

  RawNode node;
  node.name = root.lexically_normal().filename().string();
  if (node.name.empty()) {
    node.name = root.lexically_normal().parent_path().filename().string();
  }
  node.type = NodeType::Directory;
  collect_entries(node, root);

  LOG_DEBUG("Scanned " + root.string() + ": " +
            std::to_string(node.count_files()) + " files");
  return node;
}

} // namespace modulate
