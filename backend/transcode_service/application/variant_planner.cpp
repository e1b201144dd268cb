#include "variant_planner.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace transcode_service {

namespace {

struct Tier {
  int bitrate_kbps;
  int max_height;  // 0 = native
};

constexpr std::array<Tier, 3> kLadder{{
  {400, 360},
  {1000, 720},
  {2000, 0},
}};

constexpr double kLongVideoSeconds = 300.0;

int evenFloor(long long value) {
  return static_cast<int>(std::max(2LL, value - (value % 2)));
}

size_t tierCount(int native_height) {
  if (native_height <= 360) return 1;
  if (native_height <= 720) return 2;
  return 3;
}

}

std::expected<VariantPlan, Error> planVariants(
  int native_width,
  int native_height,
  double duration_seconds,
  bool has_audio
) {
  if (native_width < 2 || native_height < 2) {
    return std::unexpected(Error{ErrorKind::InvalidMedia,
      "invalid source resolution " + std::to_string(native_width) + "x" + std::to_string(native_height)});
  }
  if (!std::isfinite(duration_seconds) || duration_seconds < 0) {
    return std::unexpected(Error{ErrorKind::InvalidMedia,
      "invalid source duration " + std::to_string(duration_seconds)});
  }

  VariantPlan plan;
  plan.segment_seconds = duration_seconds < kLongVideoSeconds ? 2 : 4;
  plan.include_audio = has_audio;

  const int max_width = evenFloor(native_width);
  const size_t count = tierCount(native_height);
  for (size_t i = 0; i < count; ++i) {
    const auto& tier = kLadder[i];
    const int height = evenFloor(tier.max_height == 0 ? native_height
                                                      : std::min(tier.max_height, native_height));
    const long long scaled = static_cast<long long>(native_width) * height / native_height;
    plan.variants.push_back(Variant{
      .bitrate_kbps = tier.bitrate_kbps,
      .width = std::min(evenFloor(scaled), max_width),
      .height = height,
    });
  }
  return plan;
}

}
