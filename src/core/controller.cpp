// core/controller.cpp - Overlay synchronization implementation
#include "controller.hpp"
#include "../utils.hpp"
#include "errors.hpp"

namespace modulate {

OverlayController::OverlayController(const SourceRegistry &registry,
                                     const fs::path &working_dir,
                                     const fs::path &backup_dir,
                                     ConflictPolicy policy)
    : registry_(registry), policy_(policy),
      deployed_(ProvenancedNode::empty_root()) {
  std::error_code ec;
  if (!fs::is_directory(working_dir, ec)) {
    throw OverlayError(ErrorKind::WorkingDirNotFound, working_dir.string());
  }
  working_dir_ = fs::canonical(working_dir, ec);
  if (ec) {
    throw OverlayError(ErrorKind::WorkingDirNotFound,
                       working_dir.string() + ": " + ec.message());
  }

  fs::create_directories(backup_dir, ec);
  if (ec || !fs::is_directory(backup_dir, ec)) {
    LOG_ERROR("Failed to create backup directory " + backup_dir.string());
    throw OverlayError(ErrorKind::BackupDirUnavailable,
                       backup_dir.string() + (ec ? ": " + ec.message() : ""));
  }
  backup_dir_ = fs::canonical(backup_dir, ec);
  if (ec) {
    throw OverlayError(ErrorKind::BackupDirUnavailable,
                       backup_dir.string() + ": " + ec.message());
  }
}

ProvenancedNode OverlayController::build_tree() const {
  return merge_sources(registry_.active_sources(), policy_);
}

const ProvenancedNode &OverlayController::on_disk() const {
  return pending_ ? *pending_ : deployed_;
}

std::vector<Operation> OverlayController::plan() const {
  return diff_trees(on_disk(), build_tree());
}

ExecutionReport OverlayController::run(const std::vector<Operation> &ops) {
  const SourceRegistry &registry = registry_;
  return execute_operations(
      ops, working_dir_, backup_dir_,
      [&registry](const SourceHandle &handle) {
        return registry.root_of(handle);
      });
}

SyncReport OverlayController::synchronize() {
  SyncReport report;

  // Merge first: a bad source set must not touch the disk at all
  ProvenancedNode target = build_tree();

  report.resumed = pending_.has_value();
  if (report.resumed) {
    LOG_INFO("Continuing from an interrupted synchronization");
  }

  std::vector<Operation> ops = diff_trees(on_disk(), target);
  if (ops.empty()) {
    LOG_INFO("Working directory already up to date");
    deployed_ = std::move(target);
    pending_.reset();
    return report;
  }

  report.execution = run(ops);
  if (report.execution.ok()) {
    LOG_INFO("Synchronized " + std::to_string(ops.size()) + " operations, " +
             std::to_string(target.count_files()) + " files deployed");
    deployed_ = std::move(target);
    pending_.reset();
  } else {
    LOG_ERROR("Synchronization stopped after " +
              std::to_string(report.execution.completed) + " of " +
              std::to_string(ops.size()) + " operations");
    // The failed operation left its path untouched
    pending_ = apply_to_tree(on_disk(), ops, report.execution.completed);
  }
  return report;
}

const ProvenancedNode *OverlayController::pending_applied() const {
  return pending_ ? &*pending_ : nullptr;
}

void OverlayController::discard_pending() {
  if (pending_) {
    LOG_WARN("Discarding interrupted synchronization, the working directory "
             "is assumed to match the last deployed tree");
    pending_.reset();
  }
}

void OverlayController::restore(ProvenancedNode deployed,
                                std::optional<ProvenancedNode> pending_applied) {
  deployed_ = std::move(deployed);
  pending_ = std::move(pending_applied);
}

} // namespace modulate
