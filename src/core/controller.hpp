// core/controller.hpp - Overlay synchronization
#pragma once

#include "diff.hpp"
#include "executor.hpp"
#include "registry.hpp"
#include "tree.hpp"
#include <filesystem>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

namespace modulate {

struct SyncReport {
  // The run started from the working directory left by an interrupted one
  bool resumed = false;
  ExecutionReport execution;

  bool ok() const { return execution.ok(); }
  const std::optional<OperationFailure> &failure() const {
    return execution.failure;
  }
};

class OverlayController {
public:
  // Throws OverlayError(WorkingDirNotFound / BackupDirUnavailable).
  OverlayController(const SourceRegistry &registry, const fs::path &working_dir,
                    const fs::path &backup_dir,
                    ConflictPolicy policy = ConflictPolicy::Reject);

  // Merge the active sources, diff against what is on disk and apply. The
  // deployed tree only advances when every operation succeeded; after a
  // partial failure the next call diffs from the partially applied tree.
  SyncReport synchronize();

  // What synchronize() would do right now, without touching disk.
  std::vector<Operation> plan() const;

  const ProvenancedNode &deployed() const { return deployed_; }
  const fs::path &working_dir() const { return working_dir_; }
  const fs::path &backup_dir() const { return backup_dir_; }

  // What an interrupted synchronization left in the working directory.
  bool has_pending() const { return pending_.has_value(); }
  const ProvenancedNode *pending_applied() const;
  // Forgets the interrupted run, for when the disk was repaired by hand.
  void discard_pending();

  // Reinstates state saved by an earlier process.
  void restore(ProvenancedNode deployed,
               std::optional<ProvenancedNode> pending_applied);

private:
  ProvenancedNode build_tree() const;
  const ProvenancedNode &on_disk() const;
  ExecutionReport run(const std::vector<Operation> &ops);

  const SourceRegistry &registry_;
  fs::path working_dir_;
  fs::path backup_dir_;
  ConflictPolicy policy_;
  ProvenancedNode deployed_;
  std::optional<ProvenancedNode> pending_;
};

} // namespace modulate
