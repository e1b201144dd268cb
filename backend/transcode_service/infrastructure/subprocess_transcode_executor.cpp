// subprocess_transcode_executor.cpp
#include "subprocess_transcode_executor.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace transcode_service {

namespace {

constexpr size_t kDiagnosticLines = 20;

bool isProgressKey(std::string_view key) {
  return !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
  });
}

std::string errnoMessage(const char* what) {
  return std::string(what) + " failed: " + std::strerror(errno);
}

}

FfmpegOutputParser::FfmpegOutputParser(double duration_seconds,
                                       TranscodeExecutor::ProgressCallback progress_callback)
  : duration_seconds_(duration_seconds), progress_callback_(std::move(progress_callback)) {}

void FfmpegOutputParser::feed(std::string_view chunk) {
  pending_.append(chunk);
  size_t start = 0;
  for (auto newline = pending_.find('\n', start); newline != std::string::npos;
       newline = pending_.find('\n', start)) {
    handleLine(std::string_view(pending_).substr(start, newline - start));
    start = newline + 1;
  }
  pending_.erase(0, start);
}

void FfmpegOutputParser::finish() {
  if (!pending_.empty()) {
    handleLine(pending_);
    pending_.clear();
  }
}

std::string FfmpegOutputParser::diagnostics() const {
  std::string text;
  for (const auto& line : tail_) {
    if (!text.empty()) {
      text += "\n";
    }
    text += line;
  }
  return text;
}

void FfmpegOutputParser::handleLine(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  if (line.empty()) {
    return;
  }

  auto eq = line.find('=');
  if (eq != std::string_view::npos && isProgressKey(line.substr(0, eq))) {
    auto key = line.substr(0, eq);
    auto value = line.substr(eq + 1);
    if (!progress_callback_) {
      return;
    }
    // out_time_ms carries microseconds as well, older builds only print that one.
    if ((key == "out_time_us" || key == "out_time_ms") && duration_seconds_ > 0) {
      long long micros = 0;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), micros);
      if (ec == std::errc{} && micros >= 0) {
        double fraction = static_cast<double>(micros) / 1e6 / duration_seconds_;
        progress_callback_(static_cast<float>(std::min(fraction, 1.0)));
      }
    } else if (key == "progress" && value == "end") {
      progress_callback_(1.0f);
    }
    return;
  }

  tail_.emplace_back(line);
  if (tail_.size() > kDiagnosticLines) {
    tail_.pop_front();
  }
}

SubprocessTranscodeExecutor::SubprocessTranscodeExecutor(FfmpegSettings settings)
  : settings_(std::move(settings)) {}

std::vector<std::string> SubprocessTranscodeExecutor::buildArguments(const TranscodeRequest& request) const {
  const auto& plan = request.plan;
  std::vector<std::string> args{
    settings_.ffmpeg_path,
    "-hide_banner", "-nostdin", "-nostats",
    "-loglevel", "error",
    "-progress", "pipe:1",
    "-y", "-i", request.input_path.string(),
    "-preset", settings_.preset,
    "-g", std::to_string(settings_.gop_size),
    "-sc_threshold", "0",
  };

  for (size_t i = 0; i < plan.variants.size(); ++i) {
    args.insert(args.end(), {"-map", "0:v:0"});
    if (plan.include_audio) {
      args.insert(args.end(), {"-map", "0:a:0"});
    }
  }

  std::string stream_map;
  for (size_t i = 0; i < plan.variants.size(); ++i) {
    const auto& variant = plan.variants[i];
    const auto index = std::to_string(i);
    args.insert(args.end(), {
      "-c:v:" + index, "libx264",
      "-b:v:" + index, std::to_string(variant.bitrate_kbps) + "k",
      "-filter:v:" + index, "scale=" + std::to_string(variant.width) + ":" + std::to_string(variant.height),
    });
    if (!stream_map.empty()) {
      stream_map += " ";
    }
    stream_map += "v:" + index;
    if (plan.include_audio) {
      stream_map += ",a:" + index;
    }
  }

  if (plan.include_audio) {
    args.insert(args.end(), {
      "-c:a", "aac",
      "-b:a", std::to_string(settings_.audio_bitrate_kbps) + "k",
      "-ac", "2",
    });
  }

  args.insert(args.end(), {
    "-var_stream_map", stream_map,
    "-master_pl_name", MASTER_MANIFEST_NAME,
    "-f", "hls",
    "-hls_time", std::to_string(plan.segment_seconds),
    "-hls_list_size", "0",
    "-hls_segment_filename", (request.output_dir / "%v_segment%d.ts").string(),
    (request.output_dir / "%v.m3u8").string(),
  });
  return args;
}

std::expected<void, Error> SubprocessTranscodeExecutor::execute(
    const TranscodeRequest& request,
    ProgressCallback progress_callback) {
  if (request.plan.variants.empty()) {
    return std::unexpected(Error{ErrorKind::TranscodeFailed, "Variant plan is empty"});
  }

  // argv is prepared before fork(), the child only calls async-signal-safe functions
  const auto args = buildArguments(request);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  int output_fds[2];
  if (pipe2(output_fds, O_CLOEXEC) < 0) {
    return std::unexpected(Error{ErrorKind::TranscodeFailed, errnoMessage("pipe()")});
  }

  const pid_t pid = fork();
  if (pid < 0) {
    auto message = errnoMessage("fork()");
    close(output_fds[0]);
    close(output_fds[1]);
    return std::unexpected(Error{ErrorKind::TranscodeFailed, message});
  }

  if (pid == 0) {
    /* in the transcoder process */
    dup2(output_fds[1], STDOUT_FILENO);
    dup2(output_fds[1], STDERR_FILENO);
    execvp(argv[0], argv.data());
    static const char message[] = "execvp() failed, is ffmpeg installed?\n";
    (void)!write(STDERR_FILENO, message, sizeof(message) - 1);
    _exit(127);
  }

  close(output_fds[1]);

  FfmpegOutputParser parser{request.duration_seconds, std::move(progress_callback)};
  const bool has_deadline = request.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + request.timeout;
  bool timed_out = false;
  std::string io_error;
  char buffer[4096];

  while (true) {
    int wait_ms = -1;
    if (has_deadline) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
      if (remaining <= 0) {
        timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(remaining, INT_MAX));
    }

    pollfd pfd{output_fds[0], POLLIN, 0};
    int ready = poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      io_error = errnoMessage("poll()");
      break;
    }
    if (ready == 0) {
      continue;
    }

    ssize_t n = read(output_fds[0], buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      io_error = errnoMessage("read()");
      break;
    }
    if (n == 0) {
      break;
    }
    parser.feed(std::string_view(buffer, static_cast<size_t>(n)));
  }
  parser.finish();

  if (timed_out || !io_error.empty()) {
    kill(pid, SIGKILL);
  }
  close(output_fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return std::unexpected(Error{ErrorKind::TranscodeFailed, errnoMessage("waitpid()")});
    }
  }

  std::string reason;
  if (timed_out) {
    reason = "ffmpeg timed out after " + std::to_string(request.timeout.count()) + "s";
  } else if (!io_error.empty()) {
    reason = "Lost ffmpeg output: " + io_error;
  } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    return {};
  } else if (WIFEXITED(status)) {
    reason = "ffmpeg exited with code " + std::to_string(WEXITSTATUS(status));
  } else if (WIFSIGNALED(status)) {
    reason = "ffmpeg killed by signal " + std::to_string(WTERMSIG(status));
  } else {
    reason = "ffmpeg failed";
  }

  if (auto diagnostics = parser.diagnostics(); !diagnostics.empty()) {
    reason += ": " + diagnostics;
  }
  return std::unexpected(Error{ErrorKind::TranscodeFailed, reason});
}

} // namespace transcode_service
