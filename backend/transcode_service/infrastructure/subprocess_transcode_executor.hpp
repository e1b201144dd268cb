// subprocess_transcode_executor.hpp
#pragma once

#include "domain/transcode_executor.hpp"

#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace transcode_service {

struct FfmpegSettings {
  std::string ffmpeg_path{"ffmpeg"};
  std::string preset{"slow"};
  int gop_size{48};
  int audio_bitrate_kbps{128};
};

// ffmpeg runs with "-progress pipe:1" and stderr merged into the same pipe.
// Progress key=value lines become callbacks, everything else is kept as
// diagnostics (the last few lines only).
class FfmpegOutputParser {
public:
  FfmpegOutputParser(double duration_seconds, TranscodeExecutor::ProgressCallback progress_callback);

  void feed(std::string_view chunk);
  void finish();
  std::string diagnostics() const;

private:
  void handleLine(std::string_view line);

  double duration_seconds_;
  TranscodeExecutor::ProgressCallback progress_callback_;
  std::string pending_;
  std::deque<std::string> tail_;
};

class SubprocessTranscodeExecutor : public TranscodeExecutor {
public:
  explicit SubprocessTranscodeExecutor(FfmpegSettings settings);

  std::expected<void, Error> execute(
    const TranscodeRequest& request,
    ProgressCallback progress_callback = nullptr
  ) override;

  // argv for the HLS ladder, argv[0] being the ffmpeg binary.
  std::vector<std::string> buildArguments(const TranscodeRequest& request) const;

private:
  FfmpegSettings settings_;
};

} // namespace transcode_service
