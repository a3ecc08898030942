// core/errors.cpp - Error kinds implementation
#include "errors.hpp"

namespace modulate {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SourceNotFound:
    return "SourceNotFound";
  case ErrorKind::MetadataMissing:
    return "MetadataMissing";
  case ErrorKind::MetadataInvalid:
    return "MetadataInvalid";
  case ErrorKind::BackupDirUnavailable:
    return "BackupDirUnavailable";
  case ErrorKind::FilesystemOperationFailed:
    return "FilesystemOperationFailed";
  case ErrorKind::PathTypeConflict:
    return "PathTypeConflict";
  case ErrorKind::WorkingDirNotFound:
    return "WorkingDirNotFound";
  case ErrorKind::InvalidHandle:
    return "InvalidHandle";
  case ErrorKind::InvalidOrder:
    return "InvalidOrder";
  case ErrorKind::SourceActive:
    return "SourceActive";
  case ErrorKind::DuplicateSource:
    return "DuplicateSource";
  case ErrorKind::StateInvalid:
    return "StateInvalid";
  }
  return "Unknown";
}

OverlayError::OverlayError(ErrorKind kind, const std::string &message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message),
      kind_(kind) {}

} // namespace modulate
