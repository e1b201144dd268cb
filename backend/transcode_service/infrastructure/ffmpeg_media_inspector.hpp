#pragma once

// project
#include "domain/media_inspector.hpp"

// ffmpeg
extern "C" {
  #include <libavformat/avformat.h>
  #include <libavutil/log.h>
}

namespace transcode_service {
// Probes a local file in-process through libavformat.
class FfmpegMediaInspector : public MediaInspector {
public:
  // AV_LOG_QUIET   = -8
  // AV_LOG_PANIC   =  0
  // AV_LOG_FATAL   =  8
  // AV_LOG_ERROR   = 16
  // AV_LOG_WARNING = 24
  // AV_LOG_INFO    = 32
  explicit FfmpegMediaInspector(int loglevel = AV_LOG_ERROR);

  std::expected<MediaInfo, Error> inspect(const std::filesystem::path& media_path) override;

  void setLogLevel(int loglevel);

private:
  struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
  };

  static std::string describe(int averror);
};
}
