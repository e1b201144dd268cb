#include "job_scheduler.hpp"
#include "application/output_layout.hpp"
#include "application/variant_planner.hpp"
#include "application/workspace.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <vector>
#include <uuid/uuid.h>

namespace transcode_service {

namespace fs = std::filesystem;

namespace {

std::string logTag(const Job& job) {
  return "[job " + job.id + "] ";
}

}

JobScheduler::JobScheduler(std::shared_ptr<StorageGateway> storage,
                           std::shared_ptr<MediaInspector> inspector,
                           std::shared_ptr<TranscodeExecutor> executor,
                           SchedulerOptions options)
  : storage_(std::move(storage)),
    inspector_(std::move(inspector)),
    executor_(std::move(executor)),
    options_(std::move(options)) {
  if (options_.retained_jobs < 1) {
    options_.retained_jobs = 1;
  }
  lane_ = std::jthread([this]() { loop(); });
}

JobScheduler::~JobScheduler() {
  stop();
}

std::expected<SubmitResult, Error> JobScheduler::submit(const ObjectLocation& source,
                                                        const std::string& output_prefix) {
  if (source.bucket.empty() || source.key.empty() || trimPrefix(output_prefix).empty()) {
    return std::unexpected(Error{ErrorKind::InvalidRequest,
      "Missing required parameters: bucket, key and outputPrefix are required"});
  }

  SubmitResult result;
  {
    std::lock_guard<std::mutex> lock{mtx_};
    if (stop_) {
      return std::unexpected(Error{ErrorKind::ServiceStopping, "Service is shutting down"});
    }

    auto job = std::make_shared<Job>();
    job->id = nextJobId();
    job->sequence = next_sequence_++;
    job->source = source;
    job->output_prefix = output_prefix;
    job->created_at = std::chrono::system_clock::now();

    jobs_.emplace(job->id, job);
    queue_.push_back(job);

    // The queue is always empty while idle, so an idle lane starts this job.
    result = SubmitResult{job->id, busy_ ? queue_.size() : 0};
    std::cout << logTag(*job) << "queued " << source.bucket << "/" << source.key
              << " -> " << output_prefix << ", position " << result.position << std::endl;

    if (!busy_) {
      runNext();
    }
  }
  condition_.notify_one();
  return result;
}

std::expected<JobStatus, Error> JobScheduler::queryStatus(const std::string& job_id) const {
  std::lock_guard<std::mutex> lock{mtx_};
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return std::unexpected(Error{ErrorKind::NotFound, "Job not found: " + job_id});
  }

  const auto& job = it->second;
  JobStatus status{job->id, job->state, std::nullopt, job->error};
  if (job->state == JobState::Queued) {
    auto pos = std::find(queue_.begin(), queue_.end(), job);
    if (pos != queue_.end()) {
      status.position = static_cast<size_t>(std::distance(queue_.begin(), pos)) + 1;
    }
  }
  return status;
}

SchedulerStats JobScheduler::stats() const {
  std::lock_guard<std::mutex> lock{mtx_};
  SchedulerStats stats;
  stats.queue_length = queue_.size();
  stats.busy = busy_;
  if (current_) {
    stats.current_job_id = current_->id;
  }
  return stats;
}

void JobScheduler::waitIdle() {
  std::unique_lock<std::mutex> lock{mtx_};
  idle_condition_.wait(lock, [this]() { return !busy_ && queue_.empty(); });
}

void JobScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock{mtx_};
    stop_ = true;
  }
  condition_.notify_all();
  if (lane_.joinable() && lane_.get_id() != std::this_thread::get_id()) {
    lane_.join();
  }
}

void JobScheduler::loop() {
  std::unique_lock<std::mutex> lock{mtx_};
  while (true) {
    condition_.wait(lock, [this]() { return stop_ || current_ != nullptr; });
    if (!current_) {
      break;
    }

    auto job = current_;
    lock.unlock();
    auto outcome = runJob(job);
    lock.lock();

    finish(job, outcome);
    current_.reset();
    runNext();
  }
}

// Requires mtx_. Dequeue and the busy flag change together here and nowhere
// else, so at most one job is ever past Queued and not yet terminal.
void JobScheduler::runNext() {
  if (stop_) {
    for (auto& job : queue_) {
      job->state = JobState::Failed;
      job->error = Error{ErrorKind::ServiceStopping, "Service stopped before the job started"};
      std::cerr << logTag(*job) << "dropped, service is stopping" << std::endl;
      retire(job);
    }
    queue_.clear();
  }

  if (queue_.empty()) {
    busy_ = false;
    idle_condition_.notify_all();
    return;
  }

  current_ = queue_.front();
  queue_.pop_front();
  busy_ = true;
  current_->state = JobState::Fetching;
  std::cout << logTag(*current_) << toString(current_->state) << " "
            << current_->source.bucket << "/" << current_->source.key << std::endl;
}

std::expected<void, Error> JobScheduler::runJob(const std::shared_ptr<Job>& job) {
  auto workspace = Workspace::create(options_.workspace_root, job->id, job->source.key);
  if (!workspace) {
    return std::unexpected(workspace.error());
  }

  std::expected<void, Error> outcome;
  try {
    outcome = runStages(*job, *workspace);
  } catch (const std::exception& e) {
    outcome = std::unexpected(Error{ErrorKind::Internal, std::string("Unexpected error: ") + e.what()});
  }

  auto removed = workspace->remove();
  if (!removed) {
    std::cerr << logTag(*job) << removed.error().message << std::endl;
  }
  return withCleanup(std::move(outcome), removed);
}

std::expected<void, Error> JobScheduler::runStages(Job& job, const Workspace& workspace) {
  if (auto fetched = storage_->download(job.source, workspace.inputPath()); !fetched) {
    return std::unexpected(fetched.error());
  }

  transition(job, JobState::Inspecting);
  auto media = inspector_->inspect(workspace.inputPath());
  if (!media) {
    return std::unexpected(media.error());
  }
  std::cout << logTag(job) << "source " << media->width << "x" << media->height << ", "
            << media->duration_seconds << "s, " << (media->has_audio ? "with" : "no") << " audio"
            << std::endl;

  auto plan = planVariants(media->width, media->height, media->duration_seconds, media->has_audio);
  if (!plan) {
    return std::unexpected(plan.error());
  }

  transition(job, JobState::Transcoding);
  TranscodeRequest request{
    .input_path = workspace.inputPath(),
    .output_dir = workspace.outputDir(),
    .plan = std::move(*plan),
    .duration_seconds = media->duration_seconds,
    .timeout = options_.transcode_timeout,
  };
  int reported = 0;
  auto progress = [&job, &reported](float fraction) {
    int step = static_cast<int>(fraction * 10);
    if (step > reported) {
      reported = step;
      std::cout << logTag(job) << "transcoding " << step * 10 << "%" << std::endl;
    }
  };
  if (auto transcoded = executor_->execute(request, progress); !transcoded) {
    return std::unexpected(transcoded.error());
  }

  transition(job, JobState::Publishing);
  return publish(job, workspace.outputDir());
}

std::expected<void, Error> JobScheduler::publish(const Job& job, const fs::path& output_dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it{output_dir, ec}, end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "Failed to list " + output_dir.string() + ": " + ec.message()});
  }
  if (files.empty()) {
    return std::unexpected(Error{ErrorKind::TranscodeFailed, "Transcoder produced no output files"});
  }

  orderForPublishing(files);
  for (const auto& file : files) {
    ObjectLocation target{job.source.bucket, objectKeyFor(job.output_prefix, file)};
    if (auto uploaded = storage_->upload(target, file, std::string(contentTypeFor(file))); !uploaded) {
      return std::unexpected(uploaded.error());
    }
    std::cout << logTag(job) << "uploaded " << target.bucket << "/" << target.key << std::endl;
  }
  return {};
}

void JobScheduler::transition(Job& job, JobState state) {
  std::lock_guard<std::mutex> lock{mtx_};
  job.state = state;
  std::cout << logTag(job) << toString(state) << std::endl;
}

// Requires mtx_.
void JobScheduler::finish(const std::shared_ptr<Job>& job, const std::expected<void, Error>& outcome) {
  if (outcome) {
    job->state = JobState::Completed;
    std::cout << logTag(*job) << toString(job->state) << std::endl;
  } else {
    job->state = JobState::Failed;
    job->error = outcome.error();
    std::cerr << logTag(*job) << "failed (" << toString(outcome.error().kind) << "): "
              << outcome.error().message << std::endl;
  }
  retire(job);
}

// Requires mtx_.
void JobScheduler::retire(const std::shared_ptr<Job>& job) {
  finished_.push_back(job->id);
  while (finished_.size() > options_.retained_jobs) {
    jobs_.erase(finished_.front());
    finished_.pop_front();
  }
}

// Requires mtx_.
std::string JobScheduler::nextJobId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse_lower(uuid, uuid_str);
  return "job_" + std::to_string(next_sequence_) + "_" + std::string(uuid_str, 8);
}

}
