#include "storage/errors.h"

namespace chunkvault {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::InvalidInput:
    return "InvalidInput";
  case ErrorCode::InsufficientCapacity:
    return "InsufficientCapacity";
  case ErrorCode::WriteFailed:
    return "WriteFailed";
  case ErrorCode::IncompleteFile:
    return "IncompleteFile";
  case ErrorCode::IntegrityFailure:
    return "IntegrityFailure";
  case ErrorCode::CorruptChunk:
    return "CorruptChunk";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::NodeUnavailable:
    return "NodeUnavailable";
  case ErrorCode::StreamError:
    return "StreamError";
  }
  return "Unknown";
}

} // namespace chunkvault
