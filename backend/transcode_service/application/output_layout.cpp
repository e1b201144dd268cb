#include "output_layout.hpp"
#include "domain/transcode_executor.hpp"
#include <algorithm>

namespace transcode_service {

std::string_view contentTypeFor(const std::filesystem::path& file) {
  const auto extension = file.extension();
  if (extension == ".m3u8") {
    return MANIFEST_CONTENT_TYPE;
  }
  if (extension == ".ts") {
    return SEGMENT_CONTENT_TYPE;
  }
  return DEFAULT_CONTENT_TYPE;
}

std::string_view trimPrefix(std::string_view output_prefix) {
  while (!output_prefix.empty() && output_prefix.back() == '/') {
    output_prefix.remove_suffix(1);
  }
  return output_prefix;
}

std::string objectKeyFor(std::string_view output_prefix, const std::filesystem::path& file) {
  return std::string(trimPrefix(output_prefix)) + "/" + file.filename().string();
}

void orderForPublishing(std::vector<std::filesystem::path>& files) {
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
    const bool a_master = a.filename() == MASTER_MANIFEST_NAME;
    const bool b_master = b.filename() == MASTER_MANIFEST_NAME;
    if (a_master != b_master) {
      return b_master;
    }
    return a.filename() < b.filename();
  });
}

}
