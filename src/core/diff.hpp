// core/diff.hpp - Tree diffing
#pragma once

#include "handle.hpp"
#include "tree.hpp"
#include <string>
#include <vector>

namespace modulate {

enum class OperationKind {
  CreateDir,
  RemoveDir,
  CreateFile,
  RemoveFile,
  ChangeSource,
};

const char *to_string(OperationKind kind);

struct Operation {
  OperationKind kind = OperationKind::CreateDir;
  std::string path; // relative to the working directory, "a/b/c"
  SourceHandle source; // CreateFile and ChangeSource only

  bool operator==(const Operation &other) const {
    return kind == other.kind && path == other.path && source == other.source;
  }
  bool operator!=(const Operation &other) const { return !(*this == other); }
};

std::string describe(const Operation &op);

// Operations turning `old_tree` into `new_tree`. A directory's CreateDir
// comes before anything below it; everything below a directory is removed
// before its RemoveDir.
std::vector<Operation> diff_trees(const ProvenancedNode &old_tree,
                                  const ProvenancedNode &new_tree);

// The tree `tree` becomes once ops[0, count) are applied to it. Used to
// describe the working directory after an interrupted run.
ProvenancedNode apply_to_tree(const ProvenancedNode &tree,
                              const std::vector<Operation> &ops, size_t count);

} // namespace modulate
