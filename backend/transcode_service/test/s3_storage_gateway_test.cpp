#include "infrastructure/s3_storage_gateway.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unistd.h>

using namespace transcode_service;

namespace fs = std::filesystem;
namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {

// Answers a fixed list of requests on 127.0.0.1, one connection each, and
// records what it was sent.
class LoopbackObjectStore {
public:
  struct Reply {
    http::status status;
    std::string body;
  };

  struct Received {
    std::string method;
    std::string target;
    std::string content_type;
    std::string authorization;
    std::string body;
  };

  explicit LoopbackObjectStore(std::vector<Reply> replies)
    : acceptor_(ioc_, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0}),
      replies_(std::move(replies)),
      thread_([this]() { serve(); }) {}

  ~LoopbackObjectStore() {
    // wake the acceptor for replies nobody asked for
    for (size_t i = servedCount(); i < replies_.size(); ++i) {
      net::io_context ioc;
      tcp::socket socket{ioc};
      beast::error_code ec;
      socket.connect(acceptor_.local_endpoint(), ec);
    }
    thread_.join();
  }

  std::string endpoint() const {
    return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port());
  }

  std::vector<Received> received() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return received_;
  }

private:
  size_t servedCount() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return served_;
  }

  void serve() {
    for (const auto& reply : replies_) {
      beast::error_code ec;
      tcp::socket socket{ioc_};
      acceptor_.accept(socket, ec);
      if (ec) {
        return;
      }

      beast::flat_buffer buffer;
      http::request<http::string_body> req;
      http::read(socket, buffer, req, ec);
      if (!ec) {
        std::lock_guard<std::mutex> lock{mtx_};
        received_.push_back(Received{
          std::string(req.method_string()),
          std::string(req.target()),
          std::string(req[http::field::content_type]),
          std::string(req[http::field::authorization]),
          req.body(),
        });
      }

      http::response<http::string_body> res{reply.status, 11};
      res.set(http::field::content_type, "application/xml");
      res.body() = reply.body;
      res.keep_alive(false);
      res.prepare_payload();
      http::write(socket, res, ec);
      socket.shutdown(tcp::socket::shutdown_both, ec);

      std::lock_guard<std::mutex> lock{mtx_};
      ++served_;
    }
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::vector<Reply> replies_;
  mutable std::mutex mtx_;
  std::vector<Received> received_;
  size_t served_{0};
  std::thread thread_;
};

std::string
ReadFile(const fs::path& path)
{
  std::ifstream file(path, std::ios::binary);
  std::stringstream content;
  content << file.rdbuf();
  return content.str();
}

class S3StorageGatewayLoopback : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
      ("s3_storage_gateway_test_" + std::to_string(getpid()) + "_" +
       ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  static S3Credentials Credentials(const LoopbackObjectStore& store) {
    return S3Credentials{
      .endpoint_url = store.endpoint(),
      .region = "us-east-1",
      .access_key = "minio",
      .secret_key = "minio123",
      .connect_timeout = std::chrono::seconds(2),
    };
  }

  fs::path dir_;
};

}

TEST(S3StorageGateway, PathStyleUrls)
{
  S3StorageGateway gateway{S3Credentials{.endpoint_url = "http://minio:9000/", .region = "us-east-1"}};

  EXPECT_EQ(gateway.objectUrl({"media", "uploads/clip.mp4"}), "http://minio:9000/media/uploads/clip.mp4");
  EXPECT_EQ(gateway.objectUrl({"media", "uploads/my clip+final.mp4"}),
            "http://minio:9000/media/uploads/my%20clip%2Bfinal.mp4");
  EXPECT_EQ(gateway.objectUrl({"media", "a/b/c/0_segment1.ts"}), "http://minio:9000/media/a/b/c/0_segment1.ts");
}

TEST_F(S3StorageGatewayLoopback, Download)
{
  LoopbackObjectStore store{{
    {http::status::ok, "0123456789 video bytes"},
    {http::status::not_found, "<Error><Code>NoSuchKey</Code></Error>"},
    {http::status::internal_server_error, "<Error><Code>InternalError</Code></Error>"},
    {http::status::forbidden, "<Error><Code>AccessDenied</Code></Error>"},
  }};
  S3StorageGateway gateway{Credentials(store)};

  const auto input = dir_ / "input.mp4";
  auto downloaded = gateway.download({"media", "uploads/clip.mp4"}, input);
  ASSERT_TRUE(downloaded.has_value()) << downloaded.error().message;
  EXPECT_EQ(ReadFile(input), "0123456789 video bytes");

  const auto missing = dir_ / "missing.mp4";
  downloaded = gateway.download({"media", "uploads/missing.mp4"}, missing);
  ASSERT_FALSE(downloaded.has_value());
  EXPECT_EQ(downloaded.error().kind, ErrorKind::ObjectNotFound);
  EXPECT_FALSE(fs::exists(missing));

  const auto broken = dir_ / "broken.mp4";
  downloaded = gateway.download({"media", "uploads/broken.mp4"}, broken);
  ASSERT_FALSE(downloaded.has_value());
  EXPECT_EQ(downloaded.error().kind, ErrorKind::StorageUnavailable);
  EXPECT_NE(downloaded.error().message.find("500"), std::string::npos);
  EXPECT_FALSE(fs::exists(broken));

  const auto denied = dir_ / "denied.mp4";
  downloaded = gateway.download({"media", "uploads/denied.mp4"}, denied);
  ASSERT_FALSE(downloaded.has_value());
  EXPECT_EQ(downloaded.error().kind, ErrorKind::StorageUnavailable);
  EXPECT_FALSE(fs::exists(denied));

  const auto requests = store.received();
  ASSERT_EQ(requests.size(), 4u);
  EXPECT_EQ(requests[0].method, "GET");
  EXPECT_EQ(requests[0].target, "/media/uploads/clip.mp4");
  EXPECT_TRUE(requests[0].authorization.starts_with("AWS4-HMAC-SHA256")) << requests[0].authorization;
  EXPECT_EQ(requests[1].target, "/media/uploads/missing.mp4");
}

TEST_F(S3StorageGatewayLoopback, Upload)
{
  LoopbackObjectStore store{{
    {http::status::ok, ""},
    {http::status::ok, ""},
    {http::status::service_unavailable, "<Error><Code>SlowDown</Code></Error>"},
  }};
  S3StorageGateway gateway{Credentials(store)};

  const auto manifest = dir_ / "master.m3u8";
  std::ofstream(manifest) << "#EXTM3U\n#EXT-X-STREAM-INF:BANDWIDTH=400000\n0.m3u8\n";
  const auto segment = dir_ / "0_segment0.ts";
  std::ofstream(segment, std::ios::binary) << std::string("\x47\x40\x00\x10", 4) << "payload";

  auto uploaded = gateway.upload({"media", "hls/clip/master.m3u8"}, manifest, "application/x-mpegURL");
  ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;
  uploaded = gateway.upload({"media", "hls/clip/0_segment0.ts"}, segment, "video/MP2T");
  ASSERT_TRUE(uploaded.has_value()) << uploaded.error().message;

  uploaded = gateway.upload({"media", "hls/clip/1.m3u8"}, manifest, "application/x-mpegURL");
  ASSERT_FALSE(uploaded.has_value());
  EXPECT_EQ(uploaded.error().kind, ErrorKind::StorageUnavailable);

  const auto requests = store.received();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0].method, "PUT");
  EXPECT_EQ(requests[0].target, "/media/hls/clip/master.m3u8");
  EXPECT_EQ(requests[0].content_type, "application/x-mpegURL");
  EXPECT_EQ(requests[0].body, ReadFile(manifest));
  EXPECT_EQ(requests[1].method, "PUT");
  EXPECT_EQ(requests[1].target, "/media/hls/clip/0_segment0.ts");
  EXPECT_EQ(requests[1].content_type, "video/MP2T");
  EXPECT_EQ(requests[1].body, ReadFile(segment));
}

TEST(S3StorageGateway, UnreachableEndpoint)
{
  const auto dir = fs::temp_directory_path() / ("s3_storage_gateway_test_" + std::to_string(getpid()));
  fs::create_directories(dir);

  // nothing listens on port 1
  S3StorageGateway gateway{S3Credentials{
    .endpoint_url = "http://127.0.0.1:1",
    .region = "us-east-1",
    .access_key = "minio",
    .secret_key = "minio123",
    .connect_timeout = std::chrono::seconds(2),
  }};

  const auto input = dir / "input.mp4";
  auto downloaded = gateway.download({"media", "clip.mp4"}, input);
  ASSERT_FALSE(downloaded.has_value());
  EXPECT_EQ(downloaded.error().kind, ErrorKind::StorageUnavailable);
  EXPECT_FALSE(fs::exists(input));

  const auto manifest = dir / "master.m3u8";
  std::ofstream(manifest) << "#EXTM3U\n";
  auto uploaded = gateway.upload({"media", "hls/master.m3u8"}, manifest, "application/x-mpegURL");
  ASSERT_FALSE(uploaded.has_value());
  EXPECT_EQ(uploaded.error().kind, ErrorKind::StorageUnavailable);

  auto missing = gateway.upload({"media", "hls/0.m3u8"}, dir / "missing.m3u8", "application/x-mpegURL");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().kind, ErrorKind::StorageUnavailable);

  std::error_code ec;
  fs::remove_all(dir, ec);
}
