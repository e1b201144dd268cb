#pragma once

#include <cstddef>
#include <string>
#include <chrono>

namespace config {

struct HttpConfig {
  std::string host;
  unsigned short port;
  int threads;
  std::chrono::seconds read_timeout;
};

// S3-compatible object storage (MinIO in production)
struct ObjectStorageConfig {
  std::string endpoint;  // host name, or a full URL with scheme
  unsigned int port;
  bool use_ssl;
  std::string region;
  std::string access_key;
  std::string secret_key;
  std::chrono::seconds connect_timeout;
};

struct TranscodeConfig {
  std::string ffmpeg_path;
  std::string preset;
  int gop_size;
  int audio_bitrate_kbps;
  std::chrono::seconds timeout;  // 0 disables the deadline
};

struct SchedulerConfig {
  std::string workspace_root;
  size_t retained_jobs;
};

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const HttpConfig& getHttp() const { return http_; }
const ObjectStorageConfig& getObjectStorage() const { return storage_; }
const TranscodeConfig& getTranscode() const { return transcode_; }
const SchedulerConfig& getScheduler() const { return scheduler_; }
std::string getObjectStorageUrl() const;
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

private:
  Config();
  void loadEnvironment();

  HttpConfig http_;
  ObjectStorageConfig storage_;
  TranscodeConfig transcode_;
  SchedulerConfig scheduler_;
};

} // namespace config
