#include "rest_api_handler_base.hpp"
#include <stdexcept>

namespace common {

http::response<http::string_body> RestApiHandlerBase::createJsonResponse(
  http::status status, const nlohmann::json& json) {

  http::response<http::string_body> res{status, 11};
  res.set(http::field::content_type, "application/json");
  // ffmpeg diagnostics end up in error messages and are not always UTF-8
  res.body() = json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> RestApiHandlerBase::createErrorResponse(
  http::status status, const std::string& message) {

  nlohmann::json error_json = {
    {"success", false},
    {"error", message}
  };
  return createJsonResponse(status, error_json);
}

nlohmann::json RestApiHandlerBase::parseRequestBody(const std::string& body) {
  try {
    if (body.empty()) {
        return nlohmann::json{};
    }
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("Invalid JSON in request body: " + std::string(e.what()));
  }
}

std::string_view RestApiHandlerBase::targetPath(std::string_view target) {
  auto query = target.find('?');
  if (query != std::string_view::npos) {
    target = target.substr(0, query);
  }
  return target;
}

}
