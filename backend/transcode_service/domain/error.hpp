#pragma once
#include <string>
#include <string_view>

namespace transcode_service {

enum class ErrorKind {
  InvalidRequest,
  ObjectNotFound,
  StorageUnavailable,
  InvalidMedia,
  TranscodeFailed,
  NotFound,
  Internal,
  ServiceStopping,
};

struct Error {
  ErrorKind kind;
  std::string message;
};

inline std::string_view toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidRequest: return "InvalidRequest";
    case ErrorKind::ObjectNotFound: return "ObjectNotFound";
    case ErrorKind::StorageUnavailable: return "StorageUnavailable";
    case ErrorKind::InvalidMedia: return "InvalidMedia";
    case ErrorKind::TranscodeFailed: return "TranscodeFailed";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::Internal: return "Internal";
    case ErrorKind::ServiceStopping: return "ServiceStopping";
  }
  return "Unknown";
}

} // namespace transcode_service
