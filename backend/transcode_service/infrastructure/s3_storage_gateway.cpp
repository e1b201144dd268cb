#include "s3_storage_gateway.hpp"
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace transcode_service {

namespace fs = std::filesystem;

S3StorageGateway::S3StorageGateway(S3Credentials credentials)
  : credentials_(std::move(credentials)) {
  while (!credentials_.endpoint_url.empty() && credentials_.endpoint_url.back() == '/') {
    credentials_.endpoint_url.pop_back();
  }
  user_pwd_ = credentials_.access_key + ":" + credentials_.secret_key;
  sigv4_ = "aws:amz:" + credentials_.region + ":s3";

  curl_global_init(CURL_GLOBAL_DEFAULT);
  curl_ = curl_easy_init();
  if (!curl_) {
    curl_global_cleanup();
    throw std::runtime_error("Failed to initialize CURL");
  }
}

S3StorageGateway::~S3StorageGateway() {
  curl_easy_cleanup(curl_);
  curl_global_cleanup();
}

std::expected<void, Error> S3StorageGateway::download(
  const ObjectLocation& source,
  const fs::path& local_path
) {
  std::lock_guard<std::mutex> lock{mtx_};

  std::ofstream file(local_path, std::ios::binary);
  if (!file) {
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "Failed to open output file " + local_path.string()});
  }

  prepareRequest(objectUrl(source));
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &file);

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "x-amz-content-sha256: UNSIGNED-PAYLOAD");
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

  auto res = curl_easy_perform(curl_);
  curl_slist_free_all(headers);

  long http_code = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
  file.close();

  if (res != CURLE_OK || http_code != 200 || file.fail()) {
    std::error_code ec;
    fs::remove(local_path, ec);
    if (res == CURLE_OK && http_code == 200) {
      return std::unexpected(Error{ErrorKind::StorageUnavailable,
        "Failed to write " + local_path.string()});
    }
    return std::unexpected(errorFor(source, res, http_code));
  }
  return {};
}

std::expected<void, Error> S3StorageGateway::upload(
  const ObjectLocation& target,
  const fs::path& local_path,
  const std::string& content_type
) {
  std::lock_guard<std::mutex> lock{mtx_};

  std::error_code ec;
  const auto size = fs::file_size(local_path, ec);
  if (ec) {
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "Failed to stat " + local_path.string() + ": " + ec.message()});
  }
  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    return std::unexpected(Error{ErrorKind::StorageUnavailable,
      "Failed to open " + local_path.string()});
  }

  prepareRequest(objectUrl(target));
  curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readCallback);
  curl_easy_setopt(curl_, CURLOPT_READDATA, &file);
  curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, ("Content-Type: " + content_type).c_str());
  headers = curl_slist_append(headers, "x-amz-content-sha256: UNSIGNED-PAYLOAD");
  headers = curl_slist_append(headers, "Expect:");
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

  auto res = curl_easy_perform(curl_);
  curl_slist_free_all(headers);

  long http_code = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
  if (res != CURLE_OK || http_code != 200) {
    return std::unexpected(errorFor(target, res, http_code));
  }
  return {};
}

std::string S3StorageGateway::objectUrl(const ObjectLocation& location) const {
  std::string url = credentials_.endpoint_url + "/" + escapeSegment(location.bucket);
  size_t start = 0;
  while (start <= location.key.size()) {
    auto slash = location.key.find('/', start);
    if (slash == std::string::npos) {
      slash = location.key.size();
    }
    url += "/" + escapeSegment(location.key.substr(start, slash - start));
    start = slash + 1;
  }
  return url;
}

void S3StorageGateway::prepareRequest(const std::string& url) {
  curl_easy_reset(curl_);
  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl_, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(credentials_.connect_timeout.count()));
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
  if (!credentials_.access_key.empty()) {
    curl_easy_setopt(curl_, CURLOPT_USERPWD, user_pwd_.c_str());
    curl_easy_setopt(curl_, CURLOPT_AWS_SIGV4, sigv4_.c_str());
  }
}

std::string S3StorageGateway::escapeSegment(const std::string& segment) const {
  char* escaped = curl_easy_escape(curl_, segment.c_str(), static_cast<int>(segment.size()));
  if (!escaped) {
    throw std::runtime_error("Failed to escape object key segment");
  }
  std::string result{escaped};
  curl_free(escaped);
  return result;
}

Error S3StorageGateway::errorFor(const ObjectLocation& location, CURLcode res, long http_code) {
  const std::string where = location.bucket + "/" + location.key;
  if (res == CURLE_HTTP_RETURNED_ERROR && http_code == 404) {
    return Error{ErrorKind::ObjectNotFound, "Object not found: " + where};
  }
  if (res != CURLE_OK && res != CURLE_HTTP_RETURNED_ERROR) {
    return Error{ErrorKind::StorageUnavailable, where + ": " + curl_easy_strerror(res)};
  }
  return Error{ErrorKind::StorageUnavailable, where + ": HTTP error: " + std::to_string(http_code)};
}

size_t S3StorageGateway::writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* file = static_cast<std::ofstream*>(userdata);
  file->write(static_cast<char*>(ptr), static_cast<std::streamsize>(size * nmemb));
  return file->good() ? size * nmemb : 0;
}

size_t S3StorageGateway::readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* file = static_cast<std::ifstream*>(userdata);
  file->read(buffer, static_cast<std::streamsize>(size * nitems));
  if (file->bad()) {
    return CURL_READFUNC_ABORT;
  }
  return static_cast<size_t>(file->gcount());
}
}
