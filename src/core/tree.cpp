// core/tree.cpp - Provenanced trees and the merge engine implementation
#include "tree.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"

namespace modulate {

const char *to_string(ConflictPolicy policy) {
  switch (policy) {
  case ConflictPolicy::Reject:
    return "reject";
  case ConflictPolicy::Keep:
    return "keep";
  case ConflictPolicy::Override:
    return "override";
  }
  return "reject";
}

bool parse_conflict_policy(const std::string &value, ConflictPolicy &out) {
  std::string v = to_lower(trim(value));
  if (v == "reject")
    out = ConflictPolicy::Reject;
  else if (v == "keep")
    out = ConflictPolicy::Keep;
  else if (v == "override")
    out = ConflictPolicy::Override;
  else
    return false;
  return true;
}

ProvenancedNode ProvenancedNode::empty_root() {
  ProvenancedNode root;
  root.name = ROOT_NODE_NAME;
  root.type = NodeType::Directory;
  return root;
}

ProvenancedNode ProvenancedNode::from_raw(const RawNode &node,
                                          SourceHandle source) {
  ProvenancedNode result;
  result.name = node.name;
  result.type = node.type;
  if (node.is_dir()) {
    for (const auto &[name, child] : node.children) {
      result.children.emplace(name, from_raw(child, source));
    }
  } else {
    result.source = source;
  }
  return result;
}

void ProvenancedNode::overwrite_with(const RawNode &node, SourceHandle source,
                                     ConflictPolicy policy,
                                     const std::string &path) {
  if (is_dir() && node.is_dir()) {
    for (const auto &[name, child] : node.children) {
      auto it = children.find(name);
      if (it == children.end()) {
        children.emplace(name, from_raw(child, source));
      } else {
        it->second.overwrite_with(child, source, policy,
                                  join_logical_path(path, name));
      }
    }
    return;
  }

  if (!is_dir() && !node.is_dir()) {
    // Last writer wins
    this->source = source;
    return;
  }

  std::string existing =
      is_dir() ? "directory"
               : "file from " + modulate::to_string(this->source);
  std::string incoming = node.is_dir() ? "directory" : "file";
  std::string clash = "'" + path + "' is a " + existing + " but a " +
                      incoming + " in " + modulate::to_string(source);

  switch (policy) {
  case ConflictPolicy::Reject:
    throw OverlayError(ErrorKind::PathTypeConflict, clash);
  case ConflictPolicy::Keep:
    LOG_WARN("Type conflict, keeping lower priority entry: " + clash);
    return;
  case ConflictPolicy::Override: {
    LOG_WARN("Type conflict, higher priority entry wins: " + clash);
    std::string keep_name = name;
    *this = from_raw(node, source);
    name = keep_name;
    return;
  }
  }
}

const ProvenancedNode *ProvenancedNode::find(const std::string &path) const {
  const ProvenancedNode *current = this;
  for (const auto &part : split_logical_path(path)) {
    if (!current->is_dir()) {
      return nullptr;
    }
    auto it = current->children.find(part);
    if (it == current->children.end()) {
      return nullptr;
    }
    current = &it->second;
  }
  return current;
}

size_t ProvenancedNode::count_files() const {
  if (!is_dir()) {
    return 1;
  }
  size_t count = 0;
  for (const auto &[name, child] : children) {
    count += child.count_files();
  }
  return count;
}

void ProvenancedNode::print(std::ostream &out, int indent) const {
  out << std::string(indent * 2, ' ') << name;
  if (!is_dir()) {
    out << ": " << modulate::to_string(source);
  }
  out << "\n";
  for (const auto &[child_name, child] : children) {
    child.print(out, indent + 1);
  }
}

bool operator==(const ProvenancedNode &a, const ProvenancedNode &b) {
  if (a.name != b.name || a.type != b.type) {
    return false;
  }
  if (!a.is_dir()) {
    return a.source == b.source;
  }
  return a.children == b.children;
}

bool operator!=(const ProvenancedNode &a, const ProvenancedNode &b) {
  return !(a == b);
}

ProvenancedNode merge_sources(const std::vector<SourceTree> &sources,
                              ConflictPolicy policy) {
  ProvenancedNode tree = ProvenancedNode::empty_root();
  LOG_INFO("Calculating virtual tree from " + std::to_string(sources.size()) +
           " sources");
  for (const auto &[handle, raw] : sources) {
    if (raw == nullptr) {
      continue;
    }
    LOG_DEBUG(" - Adding source " + to_string(handle));
    tree.overwrite_with(*raw, handle, policy);
  }
  return tree;
}

} // namespace modulate
