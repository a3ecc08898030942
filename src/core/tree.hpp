// core/tree.hpp - Provenanced trees and the merge engine
#pragma once

#include "handle.hpp"
#include "node.hpp"
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace modulate {

enum class ConflictPolicy {
  Reject,   // file/directory clash is an error
  Keep,     // lower priority node stays
  Override, // higher priority node replaces it
};

const char *to_string(ConflictPolicy policy);
bool parse_conflict_policy(const std::string &value, ConflictPolicy &out);

// A merged tree node. Files remember which source currently owns them.
struct ProvenancedNode {
  std::string name;
  NodeType type = NodeType::Directory;
  std::map<std::string, ProvenancedNode> children;
  SourceHandle source;

  bool is_dir() const { return type == NodeType::Directory; }

  static ProvenancedNode empty_root();
  static ProvenancedNode from_raw(const RawNode &node, SourceHandle source);

  // Folds one source into this tree. The incoming tree is only read and
  // never aliased; every inserted subtree is a fresh copy.
  void overwrite_with(const RawNode &node, SourceHandle source,
                      ConflictPolicy policy, const std::string &path = "");

  const ProvenancedNode *find(const std::string &path) const;
  size_t count_files() const;

  void print(std::ostream &out, int indent = 0) const;
};

bool operator==(const ProvenancedNode &a, const ProvenancedNode &b);
bool operator!=(const ProvenancedNode &a, const ProvenancedNode &b);

using SourceTree = std::pair<SourceHandle, const RawNode *>;

// Sources are ordered lowest priority first; later ones win.
ProvenancedNode merge_sources(const std::vector<SourceTree> &sources,
                              ConflictPolicy policy = ConflictPolicy::Reject);

} // namespace modulate
