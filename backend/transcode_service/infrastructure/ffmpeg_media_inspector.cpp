#include "ffmpeg_media_inspector.hpp"
#include <memory>
#include <string>

extern "C" {
  #include <libavutil/error.h>
}

namespace transcode_service {

FfmpegMediaInspector::FfmpegMediaInspector(int loglevel) {
  setLogLevel(loglevel);
}

void FfmpegMediaInspector::setLogLevel(int loglevel) {
  av_log_set_level(loglevel);
}

std::string FfmpegMediaInspector::describe(int averror) {
  char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(averror, buffer, sizeof(buffer));
  return buffer;
}

std::expected<MediaInfo, Error> FfmpegMediaInspector::inspect(const std::filesystem::path& media_path) {
  AVFormatContext* raw_ctx = nullptr;
  if (int ret = avformat_open_input(&raw_ctx, media_path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected(Error{ErrorKind::InvalidMedia,
      "Could not open input file " + media_path.string() + ": " + describe(ret)});
  }
  std::unique_ptr<AVFormatContext, FormatContextCloser> ctx{raw_ctx};

  if (int ret = avformat_find_stream_info(ctx.get(), nullptr); ret < 0) {
    return std::unexpected(Error{ErrorKind::InvalidMedia, "Could not find stream info: " + describe(ret)});
  }

  const int video_stream_idx = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    return std::unexpected(Error{ErrorKind::InvalidMedia, "Could not find video stream"});
  }
  const AVStream* video_stream = ctx->streams[video_stream_idx];

  MediaInfo info;
  info.width = video_stream->codecpar->width;
  info.height = video_stream->codecpar->height;

  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    info.duration_seconds = static_cast<double>(ctx->duration) / AV_TIME_BASE;
  } else if (video_stream->duration != AV_NOPTS_VALUE && video_stream->duration > 0) {
    info.duration_seconds = video_stream->duration * av_q2d(video_stream->time_base);
  }

  info.has_audio = av_find_best_stream(ctx.get(), AVMEDIA_TYPE_AUDIO, -1, video_stream_idx, nullptr, 0) >= 0;
  return info;
}

}
