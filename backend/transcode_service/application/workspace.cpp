#include "workspace.hpp"
#include <iostream>
#include <system_error>

namespace transcode_service {

namespace fs = std::filesystem;

Workspace::Workspace(fs::path directory, fs::path input_path, fs::path output_dir)
  : directory_(std::move(directory)),
    input_path_(std::move(input_path)),
    output_dir_(std::move(output_dir)) {}

Workspace::Workspace(Workspace&& other) noexcept
  : directory_(std::move(other.directory_)),
    input_path_(std::move(other.input_path_)),
    output_dir_(std::move(other.output_dir_)),
    removed_(other.removed_) {
  other.removed_ = true;
}

Workspace::~Workspace() {
  if (!removed_) {
    if (auto result = remove(); !result) {
      std::cerr << result.error().message << std::endl;
    }
  }
}

std::expected<Workspace, Error> Workspace::create(
  const fs::path& root,
  const std::string& job_id,
  const std::string& source_key
) {
  auto directory = root / job_id;
  auto input_path = directory / ("input" + fs::path(source_key).extension().string());
  auto output_dir = directory / "output";

  std::error_code ec;
  if (fs::exists(directory, ec)) {
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "workspace already exists: " + directory.string()});
  }
  fs::create_directories(output_dir, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove_all(directory, ignored);
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "Failed to create workspace " + directory.string() + ": " + ec.message()});
  }

  return Workspace(std::move(directory), std::move(input_path), std::move(output_dir));
}

std::expected<void, Error> Workspace::remove() {
  removed_ = true;
  std::error_code ec;
  fs::remove_all(directory_, ec);
  if (ec) {
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "Failed to remove workspace " + directory_.string() + ": " + ec.message()});
  }
  return {};
}

std::expected<void, Error> withCleanup(std::expected<void, Error> outcome,
                                       const std::expected<void, Error>& cleanup) {
  if (cleanup) {
    return outcome;
  }
  if (outcome) {
    return std::unexpected(cleanup.error());
  }
  auto error = outcome.error();
  error.message += "; " + cleanup.error().message;
  return std::unexpected(std::move(error));
}

}
