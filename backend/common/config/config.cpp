#include "config.hpp"
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <string_view>

namespace config {

namespace {

std::string envString(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return value;
}

template <typename T>
T envNumber(const char* name, T fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  std::string_view text{value};
  T parsed{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    std::cerr << "Ignoring malformed " << name << "=" << text
              << ", using " << fallback << std::endl;
    return fallback;
  }
  return parsed;
}

bool envFlag(const char* name, bool fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  std::string_view text{value};
  return text == "true" || text == "1" || text == "yes";
}

}

  Config::Config() {
    http_ = {
      .host = "0.0.0.0",
      .port = 3001,
      .threads = 2,
      .read_timeout = std::chrono::seconds(30)
    };

    storage_ = {
      .endpoint = "localhost",
      .port = 9000,
      .use_ssl = false,
      .region = "us-east-1",
      .access_key = "",
      .secret_key = "",
      .connect_timeout = std::chrono::seconds(10)
    };

    transcode_ = {
      .ffmpeg_path = "ffmpeg",
      .preset = "slow",
      .gop_size = 48,
      .audio_bitrate_kbps = 128,
      .timeout = std::chrono::seconds(0)
    };

    scheduler_ = {
      .workspace_root = "/tmp/transcode_service",
      .retained_jobs = 256
    };

    loadEnvironment();
  }

  void Config::loadEnvironment() {
    http_.host = envString("HTTP_HOST", http_.host);
    http_.port = envNumber<unsigned short>("PORT", http_.port);
    http_.threads = envNumber<int>("HTTP_THREADS", http_.threads);
    if (http_.threads < 1) {
      http_.threads = 1;
    }

    storage_.endpoint = envString("MINIO_ENDPOINT", storage_.endpoint);
    storage_.port = envNumber<unsigned int>("MINIO_PORT", storage_.port);
    storage_.use_ssl = envFlag("MINIO_USE_SSL", storage_.use_ssl);
    storage_.region = envString("MINIO_REGION", storage_.region);
    storage_.access_key = envString("MINIO_ACCESS_KEY", storage_.access_key);
    storage_.secret_key = envString("MINIO_SECRET_KEY", storage_.secret_key);

    transcode_.ffmpeg_path = envString("FFMPEG_PATH", transcode_.ffmpeg_path);
    transcode_.preset = envString("FFMPEG_PRESET", transcode_.preset);
    transcode_.timeout = std::chrono::seconds(
      envNumber<long>("TRANSCODE_TIMEOUT_SECONDS", transcode_.timeout.count()));

    scheduler_.workspace_root = envString("WORKSPACE_ROOT", scheduler_.workspace_root);
    scheduler_.retained_jobs = envNumber<size_t>("RETAINED_JOBS", scheduler_.retained_jobs);
  }

  std::string Config::getObjectStorageUrl() const {
    if (storage_.endpoint.find("://") != std::string::npos) {
      return storage_.endpoint;
    }
    return std::string(storage_.use_ssl ? "https://" : "http://") +
      storage_.endpoint + ":" + std::to_string(storage_.port);
  }
}
