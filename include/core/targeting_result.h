#pragma once

#include <string>
#include <sstream>
#include "peck_types.h"

// Outcome classification for one targeting run.
// Every stage-local failure maps to exactly one of these.
enum class TargetingStatus {
  OK,                        // Click was performed

  CAPTURE_UNAVAILABLE,       // No capturable surface, or the capture call failed
  QUERY_FAILED,              // Vision model transport or API failure
  TARGET_NOT_FOUND,          // Model reported no match, or reply had no usable label
  COORDINATE_OUT_OF_RANGE,   // Decoded or transformed point outside capture/display bounds
  ACTION_FAILED,             // Input injector rejected the point or raised an error

  INVALID_PARAMETER,         // Run was started with an unusable grid spec or goal

  UNKNOWN
};

// Pipeline states. One run moves strictly forward through these.
enum class TargetingState {
  IDLE,
  CAPTURED,
  OVERLAID,
  QUERIED,
  PARSED,
  TRANSFORMED,
  ACTED,
  FAILED
};

inline const char* TargetingStateToString(TargetingState state) {
  switch (state) {
    case TargetingState::IDLE: return "idle";
    case TargetingState::CAPTURED: return "captured";
    case TargetingState::OVERLAID: return "overlaid";
    case TargetingState::QUERIED: return "queried";
    case TargetingState::PARSED: return "parsed";
    case TargetingState::TRANSFORMED: return "transformed";
    case TargetingState::ACTED: return "acted";
    case TargetingState::FAILED: return "failed";
    default: return "unknown";
  }
}

inline const char* TargetingStatusToCode(TargetingStatus status) {
  switch (status) {
    case TargetingStatus::OK: return "ok";
    case TargetingStatus::CAPTURE_UNAVAILABLE: return "capture_unavailable";
    case TargetingStatus::QUERY_FAILED: return "query_failed";
    case TargetingStatus::TARGET_NOT_FOUND: return "target_not_found";
    case TargetingStatus::COORDINATE_OUT_OF_RANGE: return "coordinate_out_of_range";
    case TargetingStatus::ACTION_FAILED: return "action_failed";
    case TargetingStatus::INVALID_PARAMETER: return "invalid_parameter";
    default: return "unknown";
  }
}

inline const char* TargetingStatusToMessage(TargetingStatus status) {
  switch (status) {
    case TargetingStatus::OK: return "Target clicked";
    case TargetingStatus::CAPTURE_UNAVAILABLE: return "Screen capture unavailable";
    case TargetingStatus::QUERY_FAILED: return "Vision model query failed";
    case TargetingStatus::TARGET_NOT_FOUND: return "No coordinate label found in model reply";
    case TargetingStatus::COORDINATE_OUT_OF_RANGE: return "Target coordinate out of bounds";
    case TargetingStatus::ACTION_FAILED: return "Input injection failed";
    case TargetingStatus::INVALID_PARAMETER: return "Invalid parameter value";
    default: return "Unknown error";
  }
}

// Terminal result of one PeckTargetingPipeline::Run.
// Intermediate values are filled in as far as the run got.
struct TargetingResult {
  bool success;
  TargetingStatus status;
  TargetingState state;        // ACTED or FAILED
  TargetingState failed_at;    // Last state reached before failing (IDLE when successful)
  std::string message;         // Stage plus reason, e.g. "parse: no coordinate label found"
  bool retriable;              // Set for QUERY_FAILED; retry policy belongs to the caller

  GridLayout layout;
  std::string reply;           // Raw model reply
  bool has_label;
  CoordinateLabel label;
  TargetPoint target;
  ActionPoint action;
  double elapsed_ms;

  TargetingResult()
      : success(false), status(TargetingStatus::UNKNOWN), state(TargetingState::IDLE),
        failed_at(TargetingState::IDLE), retriable(false), has_label(false),
        elapsed_ms(0.0) {}

  static TargetingResult Failure(TargetingStatus status, TargetingState failed_at,
                                 const std::string& detail) {
    TargetingResult r;
    r.success = false;
    r.status = status;
    r.state = TargetingState::FAILED;
    r.failed_at = failed_at;
    r.message = detail.empty() ? TargetingStatusToMessage(status) : detail;
    r.retriable = (status == TargetingStatus::QUERY_FAILED);
    return r;
  }

  // Single-line summary for logs and the CLI
  std::string ToString() const {
    std::ostringstream oss;
    oss << "status=" << TargetingStatusToCode(status)
        << " state=" << TargetingStateToString(state);
    if (!success) {
      oss << " failed_at=" << TargetingStateToString(failed_at);
      if (retriable) oss << " retriable=true";
    }
    if (has_label) {
      oss << " label=" << label.ToString();
    }
    if (success) {
      oss << " click=(" << action.logical_x << "," << action.logical_y << ")";
    }
    oss << " message=\"" << message << "\"";
    return oss.str();
  }
};
