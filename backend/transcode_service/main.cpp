#include "application/job_scheduler.hpp"
#include "infrastructure/ffmpeg_media_inspector.hpp"
#include "infrastructure/s3_storage_gateway.hpp"
#include "infrastructure/subprocess_transcode_executor.hpp"
#include "interface/rest_api_handler.hpp"
#include "common/config/config.hpp"
#include "common/restful/http_server.hpp"
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

int main() {
  try {
    const auto& cfg = config::Config::getInstance();

    const auto& scheduler_config = cfg.getScheduler();
    std::filesystem::create_directories(scheduler_config.workspace_root);

    const auto& storage_config = cfg.getObjectStorage();
    std::shared_ptr<transcode_service::StorageGateway> storage =
      std::make_shared<transcode_service::S3StorageGateway>(transcode_service::S3Credentials{
        .endpoint_url = cfg.getObjectStorageUrl(),
        .region = storage_config.region,
        .access_key = storage_config.access_key,
        .secret_key = storage_config.secret_key,
        .connect_timeout = storage_config.connect_timeout,
      });

    std::shared_ptr<transcode_service::MediaInspector> inspector =
      std::make_shared<transcode_service::FfmpegMediaInspector>();

    const auto& transcode_config = cfg.getTranscode();
    std::shared_ptr<transcode_service::TranscodeExecutor> executor =
      std::make_shared<transcode_service::SubprocessTranscodeExecutor>(transcode_service::FfmpegSettings{
        .ffmpeg_path = transcode_config.ffmpeg_path,
        .preset = transcode_config.preset,
        .gop_size = transcode_config.gop_size,
        .audio_bitrate_kbps = transcode_config.audio_bitrate_kbps,
      });

    auto scheduler = std::make_shared<transcode_service::JobScheduler>(
      storage, inspector, executor,
      transcode_service::SchedulerOptions{
        .workspace_root = scheduler_config.workspace_root,
        .retained_jobs = scheduler_config.retained_jobs,
        .transcode_timeout = transcode_config.timeout,
      });

    // Start REST API server
    const auto& http_config = cfg.getHttp();
    boost::asio::io_context ioc{http_config.threads};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host), http_config.port
    };

    auto api_handler = std::make_shared<transcode_service::RestApiHandler>(scheduler);
    common::HttpServer http_server{ioc, http_endpoint, api_handler, http_config.read_timeout};

    // Handled on the acceptor's strand so stop() can close it in place
    boost::asio::signal_set signals{http_server.executor(), SIGINT, SIGTERM};
    signals.async_wait([&ioc, &http_server](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "Received signal " << signal_number << ", shutting down" << std::endl;
      http_server.stop();
      ioc.stop();
    });

    http_server.run();
    std::cout << "Video processing service listening on " << cfg.getHttpIpPort()
              << ", storage " << cfg.getObjectStorageUrl()
              << ", workspace " << scheduler_config.workspace_root << std::endl;

    std::vector<std::thread> http_threads;
    http_threads.reserve(http_config.threads - 1);
    for (int i = 1; i < http_config.threads; ++i) {
      http_threads.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();

    for (auto& thread : http_threads) {
      thread.join();
    }

    // Let the running job finish and fail whatever is still queued
    scheduler->stop();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
