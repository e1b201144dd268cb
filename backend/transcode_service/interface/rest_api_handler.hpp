#pragma once
#include "application/job_scheduler.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <string_view>
#include <nlohmann/json.hpp>

namespace transcode_service {

// POST /process-video   {bucket, key, outputPrefix} -> 202 {jobId, position}
// GET  /job/{jobId}     -> 200 {jobId, state, position?, error?} | 404
// GET  /health          -> 200 {status, queueLength, busy}
// GET  /status          -> 200 {queueLength, isProcessing, currentJobId?}
class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<JobScheduler> scheduler);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body,
                    http::basic_fields<std::allocator<char>>> &&req) override;

private:
  std::shared_ptr<JobScheduler> scheduler_;

  http::response<http::string_body> handleProcessVideo(const std::string &body);
  http::response<http::string_body> handleGetJob(std::string_view job_id);
  http::response<http::string_body> handleHealth();
  http::response<http::string_body> handleStatus();
};

} // namespace transcode_service
