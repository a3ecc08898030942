// core/executor.cpp - Operation execution implementation
#include "executor.hpp"
#include "../utils.hpp"
#include <algorithm>

namespace modulate {

static bool is_directory_entry(const fs::path &path) {
  std::error_code ec;
  return fs::symlink_status(path, ec).type() == fs::file_type::directory;
}

static fs::path resolve_source_file(const SourceRootLookup &lookup,
                                    const Operation &op) {
  std::optional<fs::path> root = lookup ? lookup(op.source) : std::nullopt;
  if (!root) {
    throw OverlayError(ErrorKind::SourceNotFound,
                       "no source registered for " + to_string(op.source));
  }
  return *root / op.path;
}

// Drops backup directories left empty by a restore, up to the backup root.
static void prune_backup_parents(fs::path dir, const fs::path &backup_dir) {
  while (!dir.empty() && dir != backup_dir &&
         dir.native().size() > backup_dir.native().size()) {
    std::error_code ec;
    if (!is_empty_dir(dir, ec) || ec) {
      return;
    }
    fs::remove(dir, ec);
    if (ec) {
      LOG_DEBUG("Could not prune backup dir " + dir.string() + ": " +
                ec.message());
      return;
    }
    dir = dir.parent_path();
  }
}

static void create_dir(const fs::path &working_file) {
  LOG_INFO("Creating dir: " + working_file.string());
  fs::create_directories(working_file);
}

static void remove_dir(const fs::path &working_file) {
  if (!entry_exists(working_file)) {
    LOG_DEBUG("Dir already gone: " + working_file.string());
    return;
  }
  if (!is_directory_entry(working_file)) {
    throw OverlayError(ErrorKind::PathTypeConflict,
                       working_file.string() + " is not a directory");
  }

  std::error_code ec;
  bool empty = is_empty_dir(working_file, ec);
  if (ec) {
    throw fs::filesystem_error("cannot read directory", working_file, ec);
  }
  if (!empty) {
    LOG_DEBUG("Leaving non-empty dir: " + working_file.string());
    return;
  }
  LOG_INFO("Removing dir: " + working_file.string());
  fs::remove(working_file);
}

// Link target for a file that is about to replace working_file. Lives in
// the same directory so the final rename stays on one filesystem.
static fs::path staging_path(const fs::path &working_file) {
  return working_file.parent_path() /
         ("." + working_file.filename().string() + ".modulate-tmp");
}

static void discard_entry(const fs::path &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG_WARN("Could not clean up " + path.string() + ": " + ec.message());
  }
}

// Puts a link to source_file at working_file. Either the new link is in
// place or the working file is left as it was.
static void place_file(const fs::path &working_file,
                       const fs::path &source_file,
                       const fs::path *backup_file,
                       const fs::path &backup_dir) {
  bool occupied = entry_exists(working_file);
  if (occupied && is_directory_entry(working_file)) {
    throw OverlayError(ErrorKind::PathTypeConflict,
                       working_file.string() + " is a directory");
  }
  // Already linked to this source, so there is nothing of the user's to keep
  std::error_code same_ec;
  if (occupied && fs::equivalent(working_file, source_file, same_ec)) {
    occupied = false;
  }

  fs::path staged = staging_path(working_file);
  if (entry_exists(staged)) {
    LOG_DEBUG(" - Removing stale staging link: " + staged.string());
    fs::remove(staged);
  }
  hard_link_file(source_file, staged);

  bool backed_up = false;
  try {
    if (occupied && backup_file != nullptr && !entry_exists(*backup_file)) {
      LOG_DEBUG(" - Creating backup: " + backup_file->string());
      hard_link_file(working_file, *backup_file);
      backed_up = true;
    }
    fs::rename(staged, working_file);
  } catch (const fs::filesystem_error &) {
    discard_entry(staged);
    if (backed_up) {
      discard_entry(*backup_file);
      prune_backup_parents(backup_file->parent_path(), backup_dir);
    }
    throw;
  }

  // rename() is a no-op when both names already share an inode
  if (entry_exists(staged)) {
    fs::remove(staged);
  }
}

static void create_file(const fs::path &working_file,
                        const fs::path &backup_file,
                        const fs::path &backup_dir,
                        const fs::path &source_file) {
  LOG_INFO("Creating file with hard link: " + source_file.string() + " -> " +
           working_file.string());
  place_file(working_file, source_file, &backup_file, backup_dir);
}

static void remove_file(const fs::path &working_file,
                        const fs::path &backup_file,
                        const fs::path &backup_dir) {
  LOG_INFO("Removing file: " + working_file.string());

  if (is_directory_entry(working_file)) {
    throw OverlayError(ErrorKind::PathTypeConflict,
                       working_file.string() + " is a directory");
  }
  fs::remove(working_file);

  if (entry_exists(backup_file)) {
    LOG_DEBUG(" - Restoring backup with hard link: " + backup_file.string() +
              " -> " + working_file.string());
    hard_link_file(backup_file, working_file);
    fs::remove(backup_file);
    prune_backup_parents(backup_file.parent_path(), backup_dir);
  }
}

static void change_source(const fs::path &working_file,
                          const fs::path &backup_dir,
                          const fs::path &source_file) {
  LOG_INFO("Changing source: " + working_file.string() + " -> " +
           source_file.string());
  place_file(working_file, source_file, nullptr, backup_dir);
}

static void apply_one(const Operation &op, const fs::path &working_dir,
                      const fs::path &backup_dir,
                      const SourceRootLookup &lookup) {
  fs::path working_file = working_dir / op.path;
  fs::path backup_file = backup_dir / op.path;

  switch (op.kind) {
  case OperationKind::CreateDir:
    create_dir(working_file);
    break;
  case OperationKind::RemoveDir:
    remove_dir(working_file);
    break;
  case OperationKind::CreateFile:
    create_file(working_file, backup_file, backup_dir,
                resolve_source_file(lookup, op));
    break;
  case OperationKind::RemoveFile:
    remove_file(working_file, backup_file, backup_dir);
    break;
  case OperationKind::ChangeSource:
    change_source(working_file, backup_dir, resolve_source_file(lookup, op));
    break;
  }
}

ExecutionReport execute_operations(const std::vector<Operation> &ops,
                                   const fs::path &working_dir,
                                   const fs::path &backup_dir,
                                   const SourceRootLookup &lookup,
                                   size_t first) {
  ExecutionReport report;
  report.first = std::min(first, ops.size());
  report.completed = report.first;
  report.total = ops.size();

  if (report.first == ops.size()) {
    return report;
  }

  std::error_code ec;
  if (!fs::is_directory(backup_dir, ec)) {
    OperationFailure failure;
    failure.index = report.first;
    failure.operation = ops[report.first];
    failure.kind = ErrorKind::BackupDirUnavailable;
    failure.code = ec;
    failure.message = "backup directory " + backup_dir.string() + " missing";
    LOG_ERROR(failure.message + ", refusing to deploy");
    report.failure = failure;
    return report;
  }

  LOG_INFO("Applying " + std::to_string(ops.size() - report.first) +
           " operations");

  for (size_t i = report.first; i < ops.size(); ++i) {
    const Operation &op = ops[i];
    OperationFailure failure;
    failure.index = i;
    failure.operation = op;

    try {
      apply_one(op, working_dir, backup_dir, lookup);
      report.completed = i + 1;
      continue;
    } catch (const OverlayError &e) {
      failure.kind = e.kind();
      failure.message = e.what();
    } catch (const fs::filesystem_error &e) {
      failure.kind = ErrorKind::FilesystemOperationFailed;
      failure.code = e.code();
      failure.message = e.what();
    }

    LOG_ERROR("Operation " + std::to_string(i) + " failed (" +
              describe(op) + "): " + failure.message);
    report.failure = failure;
    break;
  }

  return report;
}

} // namespace modulate
