#pragma once
#include "error.hpp"
#include "variant_plan.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>

namespace transcode_service {

#define MASTER_MANIFEST_NAME "master.m3u8"

struct TranscodeRequest {
  std::filesystem::path input_path;
  std::filesystem::path output_dir;
  VariantPlan plan;
  double duration_seconds{0};  // used only to scale progress
  std::chrono::seconds timeout{0};  // 0 waits forever
};

// Writes {i}.m3u8 and {i}_segment{n}.ts per variant plus MASTER_MANIFEST_NAME
// into output_dir.
class TranscodeExecutor {
public:
  using ProgressCallback = std::function<void(float)>;
  virtual ~TranscodeExecutor() = default;
  virtual std::expected<void, Error> execute(
    const TranscodeRequest& request,
    ProgressCallback progress_callback = nullptr
  ) = 0;
};
}
