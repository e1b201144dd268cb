#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <curl/curl.h>
#include "domain/storage_gateway.hpp"

namespace transcode_service {

struct S3Credentials {
  std::string endpoint_url;  // scheme://host:port, no trailing slash
  std::string region;
  std::string access_key;
  std::string secret_key;
  std::chrono::seconds connect_timeout{10};
};

// S3 REST client for MinIO and friends: path-style URLs, SigV4 signing done
// by libcurl.
class S3StorageGateway : public StorageGateway {
public:
  explicit S3StorageGateway(S3Credentials credentials);
  ~S3StorageGateway() override;

  S3StorageGateway(const S3StorageGateway&) = delete;
  S3StorageGateway& operator=(const S3StorageGateway&) = delete;

  std::expected<void, Error> download(
    const ObjectLocation& source,
    const std::filesystem::path& local_path
  ) override;

  std::expected<void, Error> upload(
    const ObjectLocation& target,
    const std::filesystem::path& local_path,
    const std::string& content_type
  ) override;

  std::string objectUrl(const ObjectLocation& location) const;

private:
  static size_t writeCallback(void* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata);

  void prepareRequest(const std::string& url);
  std::string escapeSegment(const std::string& segment) const;
  static Error errorFor(const ObjectLocation& location, CURLcode res, long http_code);

  S3Credentials credentials_;
  std::string user_pwd_;
  std::string sigv4_;
  CURL* curl_;
  std::mutex mtx_;  // one handle, one transfer at a time
};
}
