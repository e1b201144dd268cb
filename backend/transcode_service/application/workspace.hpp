#pragma once

#include "domain/error.hpp"
#include <expected>
#include <filesystem>
#include <string>

namespace transcode_service {

// Job-scoped staging area:
//   {root}/{job_id}/input{ext}
//   {root}/{job_id}/output/
// The directory tree is removed by remove() or, failing that, by the
// destructor.
class Workspace {
public:
  static std::expected<Workspace, Error> create(
    const std::filesystem::path& root,
    const std::string& job_id,
    const std::string& source_key
  );

  Workspace(Workspace&& other) noexcept;
  Workspace& operator=(Workspace&&) = delete;
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  ~Workspace();

  const std::filesystem::path& directory() const { return directory_; }
  const std::filesystem::path& inputPath() const { return input_path_; }
  const std::filesystem::path& outputDir() const { return output_dir_; }

  std::expected<void, Error> remove();

private:
  Workspace(std::filesystem::path directory, std::filesystem::path input_path,
            std::filesystem::path output_dir);

  std::filesystem::path directory_;
  std::filesystem::path input_path_;
  std::filesystem::path output_dir_;
  bool removed_{false};
};

// Outcome of a job once its workspace is gone. A cleanup failure fails a
// job that would otherwise have completed (StorageUnavailable); a job that
// already failed keeps its kind and gets the cleanup error appended.
std::expected<void, Error> withCleanup(std::expected<void, Error> outcome,
                                       const std::expected<void, Error>& cleanup);

}
