#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace transcode_service {

#define MANIFEST_CONTENT_TYPE "application/x-mpegURL"
#define SEGMENT_CONTENT_TYPE "video/MP2T"
#define DEFAULT_CONTENT_TYPE "application/octet-stream"

std::string_view contentTypeFor(const std::filesystem::path& file);

// Output prefix without trailing slashes. Empty means there is no usable
// prefix at all.
std::string_view trimPrefix(std::string_view output_prefix);

// "<prefix>/<filename>", without doubling a trailing slash on the prefix.
std::string objectKeyFor(std::string_view output_prefix, const std::filesystem::path& file);

// Name order, with the master manifest moved to the end so that it is
// published only after everything it references.
void orderForPublishing(std::vector<std::filesystem::path>& files);

}
