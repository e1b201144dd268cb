#pragma once
#include "error.hpp"
#include <expected>
#include <filesystem>

namespace transcode_service {

struct MediaInfo {
  int width{0};
  int height{0};
  double duration_seconds{0};  // 0 when the container does not say
  bool has_audio{false};
};

class MediaInspector {
public:
  virtual ~MediaInspector() = default;
  virtual std::expected<MediaInfo, Error> inspect(const std::filesystem::path& media_path) = 0;
};
}
