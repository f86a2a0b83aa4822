#pragma once

#include <string>
#include <string_view>

namespace storykb::store {

/*
  Adapter result codes.

  Adapters never throw across their interface; the coordinator drives its
  state machine from these values. Unavailable, DeadlineExceeded and
  Conflict are transient and may be retried.
*/
enum class StoreErrorCode {
  kOk = 0,
  kInvalidArgument,
  kUnavailable,
  kDeadlineExceeded,
  kConflict,
  kNotFound,
  kInternal,
};

constexpr std::string_view ToString(StoreErrorCode code) {
  switch (code) {
    case StoreErrorCode::kOk:
      return "OK";
    case StoreErrorCode::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case StoreErrorCode::kUnavailable:
      return "UNAVAILABLE";
    case StoreErrorCode::kDeadlineExceeded:
      return "DEADLINE_EXCEEDED";
    case StoreErrorCode::kConflict:
      return "CONFLICT";
    case StoreErrorCode::kNotFound:
      return "NOT_FOUND";
    case StoreErrorCode::kInternal:
      return "INTERNAL";
  }
  return "UNKNOWN";
}

struct StoreStatus {
  StoreErrorCode code = StoreErrorCode::kOk;
  std::string    message;

  static StoreStatus Ok() {
    return {};
  }

  static StoreStatus Err(StoreErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool IsTransient() const {
    return code == StoreErrorCode::kUnavailable || code == StoreErrorCode::kDeadlineExceeded || code == StoreErrorCode::kConflict;
  }

  std::string ToString() const {
    auto text = std::string(store::ToString(code));
    if (!message.empty()) text += ": " + message;
    return text;
  }

  explicit operator bool() const {
    return code == StoreErrorCode::kOk;
  }
};

} // namespace storykb::store
