#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "domain/job.hpp"
#include "domain/media_inspector.hpp"
#include "domain/storage_gateway.hpp"
#include "domain/transcode_executor.hpp"

namespace transcode_service {

class Workspace;

struct SchedulerOptions {
  std::filesystem::path workspace_root;
  size_t retained_jobs{256};  // finished jobs kept for status queries
  std::chrono::seconds transcode_timeout{0};
};

// FIFO admission in front of a single execution lane.
//
// Scenario: many producers (HTTP threads) call submit(), one consumer (the
// lane thread) runs jobs one at a time. Queue, busy flag, current slot and
// job states are only touched under mtx_; downloads, the transcoder and
// uploads run with the lock released.
class JobScheduler {
public:
  JobScheduler(std::shared_ptr<StorageGateway> storage,
               std::shared_ptr<MediaInspector> inspector,
               std::shared_ptr<TranscodeExecutor> executor,
               SchedulerOptions options);
  ~JobScheduler();

  JobScheduler(const JobScheduler&) = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  std::expected<SubmitResult, Error> submit(const ObjectLocation& source,
                                            const std::string& output_prefix);

  std::expected<JobStatus, Error> queryStatus(const std::string& job_id) const;

  SchedulerStats stats() const;

  // Blocks until the queue is empty and no job is running.
  void waitIdle();

  // Lets the running job finish, fails whatever is still queued and joins
  // the lane. Later submissions are rejected.
  void stop();

private:
  void loop();
  void runNext();
  std::expected<void, Error> runJob(const std::shared_ptr<Job>& job);
  std::expected<void, Error> runStages(Job& job, const Workspace& workspace);
  std::expected<void, Error> publish(const Job& job, const std::filesystem::path& output_dir);
  void transition(Job& job, JobState state);
  void finish(const std::shared_ptr<Job>& job, const std::expected<void, Error>& outcome);
  void retire(const std::shared_ptr<Job>& job);
  std::string nextJobId();

  std::shared_ptr<StorageGateway> storage_;
  std::shared_ptr<MediaInspector> inspector_;
  std::shared_ptr<TranscodeExecutor> executor_;
  SchedulerOptions options_;

  mutable std::mutex mtx_;
  std::condition_variable condition_;
  std::condition_variable idle_condition_;
  std::deque<std::shared_ptr<Job>> queue_;
  std::shared_ptr<Job> current_;
  bool busy_{false};
  bool stop_{false};
  std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;
  std::deque<std::string> finished_;  // oldest first
  uint64_t next_sequence_{1};

  std::jthread lane_;
};

}
