#include "rest_api_handler.hpp"
#include <stdexcept>

namespace transcode_service {

namespace {

constexpr std::string_view kJobRoute = "/job/";

// Empty when the field is missing or not a string.
std::string stringField(const nlohmann::json &body, const char *name) {
  auto it = body.find(name);
  if (it == body.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

http::status statusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidRequest: return http::status::bad_request;
    case ErrorKind::NotFound: return http::status::not_found;
    case ErrorKind::ServiceStopping: return http::status::service_unavailable;
    default: return http::status::internal_server_error;
  }
}

}

RestApiHandler::RestApiHandler(std::shared_ptr<JobScheduler> scheduler)
    : scheduler_(std::move(scheduler)) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body,
                  http::basic_fields<std::allocator<char>>> &&req) {
  std::string_view target = targetPath({req.target().data(), req.target().size()});

  if (target == "/process-video" && req.method() == http::verb::post) {
    return handleProcessVideo(req.body());
  } else if (target.starts_with(kJobRoute) && req.method() == http::verb::get) {
    return handleGetJob(target.substr(kJobRoute.size()));
  } else if (target == "/health" && req.method() == http::verb::get) {
    return handleHealth();
  } else if (target == "/status" && req.method() == http::verb::get) {
    return handleStatus();
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

http::response<http::string_body>
RestApiHandler::handleProcessVideo(const std::string &body) {
  nlohmann::json json;
  try {
    json = parseRequestBody(body);
  } catch (const std::invalid_argument &e) {
    return createErrorResponse(http::status::bad_request, e.what());
  }
  if (!json.is_object()) {
    return createErrorResponse(http::status::bad_request, "Missing required parameters");
  }

  ObjectLocation source{stringField(json, "bucket"), stringField(json, "key")};
  auto result = scheduler_->submit(source, stringField(json, "outputPrefix"));
  if (!result) {
    return createErrorResponse(statusFor(result.error().kind), result.error().message);
  }

  nlohmann::json response_json = {{"message", "Video queued for processing"},
                                  {"jobId", result->job_id},
                                  {"position", result->position},
                                  {"status", "queued"}};
  return createJsonResponse(http::status::accepted, response_json);
}

http::response<http::string_body>
RestApiHandler::handleGetJob(std::string_view job_id) {
  if (job_id.empty() || job_id.find('/') != std::string_view::npos) {
    return createErrorResponse(http::status::not_found, "Job not found");
  }

  auto status = scheduler_->queryStatus(std::string(job_id));
  if (!status) {
    return createErrorResponse(statusFor(status.error().kind), status.error().message);
  }

  nlohmann::json response_json = {{"jobId", status->id},
                                  {"state", std::string(toString(status->state))}};
  if (status->position) {
    response_json["position"] = *status->position;
  }
  if (status->error) {
    response_json["error"] = {{"kind", std::string(toString(status->error->kind))},
                              {"message", status->error->message}};
  }
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body> RestApiHandler::handleHealth() {
  auto stats = scheduler_->stats();
  nlohmann::json response_json = {{"status", "ok"},
                                  {"queueLength", stats.queue_length},
                                  {"busy", stats.busy}};
  return createJsonResponse(http::status::ok, response_json);
}

http::response<http::string_body> RestApiHandler::handleStatus() {
  auto stats = scheduler_->stats();
  nlohmann::json response_json = {{"queueLength", stats.queue_length},
                                  {"isProcessing", stats.busy}};
  if (stats.current_job_id) {
    response_json["currentJobId"] = *stats.current_job_id;
  }
  return createJsonResponse(http::status::ok, response_json);
}

} // namespace transcode_service
