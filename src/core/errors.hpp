// core/errors.hpp - Error kinds
#pragma once

#include <stdexcept>
#include <string>

namespace modulate {

enum class ErrorKind {
  SourceNotFound,
  MetadataMissing,
  MetadataInvalid,
  BackupDirUnavailable,
  FilesystemOperationFailed,
  PathTypeConflict,
  WorkingDirNotFound,
  InvalidHandle,
  InvalidOrder,
  SourceActive,
  DuplicateSource,
  StateInvalid,
};

const char *to_string(ErrorKind kind);

class OverlayError : public std::runtime_error {
public:
  OverlayError(ErrorKind kind, const std::string &message);

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace modulate
