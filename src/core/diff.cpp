// core/diff.cpp - Tree diffing implementation
#include "diff.hpp"
#include "../utils.hpp"

namespace modulate {

const char *to_string(OperationKind kind) {
  switch (kind) {
  case OperationKind::CreateDir:
    return "CreateDir";
  case OperationKind::RemoveDir:
    return "RemoveDir";
  case OperationKind::CreateFile:
    return "CreateFile";
  case OperationKind::RemoveFile:
    return "RemoveFile";
  case OperationKind::ChangeSource:
    return "ChangeSource";
  }
  return "Unknown";
}

std::string describe(const Operation &op) {
  std::string text = std::string(to_string(op.kind)) + " " + op.path;
  if (op.kind == OperationKind::CreateFile ||
      op.kind == OperationKind::ChangeSource) {
    text += " (" + to_string(op.source) + ")";
  }
  return text;
}

// Post-order: children go before the directory holding them.
static void ops_for_remove(const ProvenancedNode &node, const std::string &path,
                           std::vector<Operation> &ops) {
  if (!node.is_dir()) {
    ops.push_back({OperationKind::RemoveFile, path, {}});
    return;
  }
  for (const auto &[name, child] : node.children) {
    ops_for_remove(child, join_logical_path(path, name), ops);
  }
  ops.push_back({OperationKind::RemoveDir, path, {}});
}

// Pre-order: the directory goes before its children.
static void ops_for_create(const ProvenancedNode &node, const std::string &path,
                           std::vector<Operation> &ops) {
  if (!node.is_dir()) {
    ops.push_back({OperationKind::CreateFile, path, node.source});
    return;
  }
  ops.push_back({OperationKind::CreateDir, path, {}});
  for (const auto &[name, child] : node.children) {
    ops_for_create(child, join_logical_path(path, name), ops);
  }
}

static void diff_dirs(const ProvenancedNode &old_dir,
                      const ProvenancedNode &new_dir, const std::string &path,
                      std::vector<Operation> &ops) {
  for (const auto &[name, old_child] : old_dir.children) {
    if (new_dir.children.find(name) == new_dir.children.end()) {
      ops_for_remove(old_child, join_logical_path(path, name), ops);
    }
  }

  for (const auto &[name, old_child] : old_dir.children) {
    auto it = new_dir.children.find(name);
    if (it == new_dir.children.end()) {
      continue;
    }
    const ProvenancedNode &new_child = it->second;
    std::string child_path = join_logical_path(path, name);

    if (old_child.is_dir() && new_child.is_dir()) {
      diff_dirs(old_child, new_child, child_path, ops);
    } else if (!old_child.is_dir() && !new_child.is_dir()) {
      if (old_child.source != new_child.source) {
        ops.push_back(
            {OperationKind::ChangeSource, child_path, new_child.source});
      }
    } else {
      // The entry changed type: drop the old one entirely, then build the new
      LOG_DEBUG("Entry changes type: " + child_path);
      ops_for_remove(old_child, child_path, ops);
      ops_for_create(new_child, child_path, ops);
    }
  }

  for (const auto &[name, new_child] : new_dir.children) {
    if (old_dir.children.find(name) == old_dir.children.end()) {
      ops_for_create(new_child, join_logical_path(path, name), ops);
    }
  }
}

std::vector<Operation> diff_trees(const ProvenancedNode &old_tree,
                                  const ProvenancedNode &new_tree) {
  std::vector<Operation> ops;
  diff_dirs(old_tree, new_tree, "", ops);
  return ops;
}

static void apply_one(ProvenancedNode &root, const Operation &op) {
  std::vector<std::string> parts = split_logical_path(op.path);
  if (parts.empty()) {
    return;
  }

  // Missing parents are directories, whatever was recorded there before
  ProvenancedNode *dir = &root;
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    ProvenancedNode &child = dir->children[parts[i]];
    if (!child.is_dir() || child.name.empty()) {
      child = ProvenancedNode();
      child.name = parts[i];
    }
    dir = &child;
  }

  const std::string &name = parts.back();
  switch (op.kind) {
  case OperationKind::CreateDir: {
    ProvenancedNode &node = dir->children[name];
    if (!node.is_dir() || node.name.empty()) {
      node = ProvenancedNode();
      node.name = name;
    }
    break;
  }
  case OperationKind::RemoveDir:
  case OperationKind::RemoveFile:
    dir->children.erase(name);
    break;
  case OperationKind::CreateFile:
  case OperationKind::ChangeSource: {
    ProvenancedNode node;
    node.name = name;
    node.type = NodeType::File;
    node.source = op.source;
    dir->children[name] = std::move(node);
    break;
  }
  }
}

ProvenancedNode apply_to_tree(const ProvenancedNode &tree,
                              const std::vector<Operation> &ops, size_t count) {
  ProvenancedNode result = tree;
  for (size_t i = 0; i < count && i < ops.size(); ++i) {
    apply_one(result, ops[i]);
  }
  return result;
}

} // namespace modulate
