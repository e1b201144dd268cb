#pragma once
#include "error.hpp"
#include "job.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace transcode_service {
class StorageGateway {
public:
  virtual ~StorageGateway() = default;
  // Fails with ObjectNotFound for a missing key, StorageUnavailable otherwise.
  virtual std::expected<void, Error> download(
    const ObjectLocation& source,
    const std::filesystem::path& local_path
  ) = 0;
  virtual std::expected<void, Error> upload(
    const ObjectLocation& target,
    const std::filesystem::path& local_path,
    const std::string& content_type
  ) = 0;
};
}
