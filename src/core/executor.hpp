// core/executor.hpp - Operation execution
#pragma once

#include "diff.hpp"
#include "errors.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace modulate {

using SourceRootLookup =
    std::function<std::optional<fs::path>(const SourceHandle &)>;

struct OperationFailure {
  size_t index = 0;
  Operation operation;
  ErrorKind kind = ErrorKind::FilesystemOperationFailed;
  std::error_code code;
  std::string message;
};

// Operations [first, completed) were applied. On failure, operation
// `completed` is the one that failed and nothing after it was attempted.
struct ExecutionReport {
  size_t first = 0;
  size_t completed = 0;
  size_t total = 0;
  std::optional<OperationFailure> failure;

  bool ok() const { return !failure.has_value(); }
  size_t applied() const { return completed - first; }
};

ExecutionReport execute_operations(const std::vector<Operation> &ops,
                                   const fs::path &working_dir,
                                   const fs::path &backup_dir,
                                   const SourceRootLookup &lookup,
                                   size_t first = 0);

} // namespace modulate
