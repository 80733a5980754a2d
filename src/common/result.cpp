#include "nexarag/common/result.hpp"

namespace nexarag::common {

const char *error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::Internal:
    return "internal";
  case ErrorCode::Configuration:
    return "configuration";
  case ErrorCode::EmbeddingUnavailable:
    return "embedding_unavailable";
  case ErrorCode::GenerationFailed:
    return "generation_failed";
  case ErrorCode::IndexIncompatible:
    return "index_incompatible";
  case ErrorCode::UnsupportedFormat:
    return "unsupported_format";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::Io:
    return "io";
  case ErrorCode::Storage:
    return "storage";
  case ErrorCode::Timeout:
    return "timeout";
  case ErrorCode::Unavailable:
    return "unavailable";
  case ErrorCode::Cancelled:
    return "cancelled";
  }
  return "internal";
}

bool is_retryable(const ErrorCode code) {
  return code == ErrorCode::Timeout || code == ErrorCode::Unavailable;
}

} // namespace nexarag::common
