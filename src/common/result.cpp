#include "runbox/common/result.hpp"

namespace runbox::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::ImagePull:
    return "image_pull_error";
  case ErrorCode::ContainerStart:
    return "container_start_error";
  case ErrorCode::ArchiveFormat:
    return "archive_format_error";
  case ErrorCode::ExecutionTimeout:
    return "execution_timeout";
  case ErrorCode::SessionNotFound:
    return "session_not_found";
  case ErrorCode::SessionNotReady:
    return "session_not_ready";
  case ErrorCode::SessionExists:
    return "session_exists";
  case ErrorCode::UnsupportedLanguage:
    return "unsupported_language";
  case ErrorCode::RuntimeUnavailable:
    return "runtime_unavailable";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Internal:
    return "internal_error";
  }
  return "internal_error";
}

} // namespace runbox::common
