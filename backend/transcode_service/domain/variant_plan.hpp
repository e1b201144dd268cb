#pragma once
#include <vector>

namespace transcode_service {

struct Variant {
  int bitrate_kbps{0};
  int width{0};
  int height{0};
};

// Derived per job from the probed media, never persisted.
struct VariantPlan {
  std::vector<Variant> variants;  // ascending bitrate
  int segment_seconds{2};
  bool include_audio{false};
};

} // namespace transcode_service
