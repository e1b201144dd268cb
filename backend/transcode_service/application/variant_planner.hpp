#pragma once

#include "domain/error.hpp"
#include "domain/variant_plan.hpp"
#include <expected>

namespace transcode_service {

// Resolution-tier ladder. A source gets every tier whose height cap it
// exceeds, plus the tier that covers its own height.
//   height <= 360  -> 400k
//   height <= 720  -> 400k, 1000k
//   otherwise      -> 400k, 1000k, 2000k at native size
// Widths keep the source aspect ratio and are never upscaled.
// Segments are 2s for videos shorter than five minutes, 4s otherwise.
std::expected<VariantPlan, Error> planVariants(
  int native_width,
  int native_height,
  double duration_seconds,
  bool has_audio
);

}
