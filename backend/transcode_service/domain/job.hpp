#pragma once
#include "error.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace transcode_service {

// Queued -> Fetching -> Inspecting -> Transcoding -> Publishing -> Completed,
// or Failed from any non-terminal state.
enum class JobState {
  Queued,
  Fetching,
  Inspecting,
  Transcoding,
  Publishing,
  Completed,
  Failed,
};

inline std::string_view toString(JobState state) {
  switch (state) {
    case JobState::Queued: return "queued";
    case JobState::Fetching: return "fetching";
    case JobState::Inspecting: return "inspecting";
    case JobState::Transcoding: return "transcoding";
    case JobState::Publishing: return "publishing";
    case JobState::Completed: return "completed";
    case JobState::Failed: return "failed";
  }
  return "unknown";
}

inline bool isTerminal(JobState state) {
  return state == JobState::Completed || state == JobState::Failed;
}

struct ObjectLocation {
  std::string bucket;
  std::string key;
};

// Everything except state and error is fixed at submission.
struct Job {
  std::string id;
  uint64_t sequence{0};
  ObjectLocation source;
  std::string output_prefix;
  std::chrono::system_clock::time_point created_at;
  JobState state{JobState::Queued};
  std::optional<Error> error;  // set only in Failed
};

struct JobStatus {
  std::string id;
  JobState state;
  std::optional<size_t> position;  // 1-based, only while queued
  std::optional<Error> error;
};

struct SubmitResult {
  std::string job_id;
  size_t position;  // 0 when the job started right away
};

struct SchedulerStats {
  size_t queue_length{0};
  bool busy{false};
  std::optional<std::string> current_job_id;
};

} // namespace transcode_service
