#define HITL_LOG_COMPONENT "proxy"

#include "hitl/proxy/stdio_server.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>

#include <cstring>

#include "hitl/core/error.h"
#include "hitl/logging/log_macros.h"

namespace hitl {
namespace proxy {

namespace {

constexpr size_t kReadChunk = 64 * 1024;

}  // namespace

StdioServer::StdioServer() : StdioServer(Options()) {}

StdioServer::StdioServer(const Options& options) : options_(options) {
  if (::pipe(wake_pipe_) == -1) {
    throw HitlError(ErrorCode::NETWORK_ERROR,
                    std::string("Failed to create wake pipe: ") +
                        std::strerror(errno));
  }
  ::fcntl(wake_pipe_[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(wake_pipe_[1], F_SETFD, FD_CLOEXEC);
}

StdioServer::~StdioServer() {
  stop();
  if (reader_.joinable()) {
    reader_.join();
  }
  ::close(wake_pipe_[0]);
  ::close(wake_pipe_[1]);
}

void StdioServer::start(LineHandler on_line) {
  on_line_ = std::move(on_line);
  reader_ = std::thread([this]() { readLoop(); });
}

void StdioServer::wait() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  done_cv_.wait(lock, [this]() { return done_; });
}

void StdioServer::stop() {
  char byte = 1;
  ssize_t rc;
  do {
    rc = ::write(wake_pipe_[1], &byte, 1);
  } while (rc == -1 && errno == EINTR);
}

void StdioServer::finish() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    done_ = true;
  }
  done_cv_.notify_all();
}

bool StdioServer::writeLine(const std::string& line) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (output_closed_) {
    return false;
  }

  std::string framed = line;
  framed.push_back('\n');

  size_t written = 0;
  while (written < framed.size()) {
    ssize_t rc = ::write(options_.output_fd, framed.data() + written,
                         framed.size() - written);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      HITL_LOG(Warning, "Client output closed: {}", std::strerror(errno));
      output_closed_ = true;
      return false;
    }
    written += static_cast<size_t>(rc);
  }
  return true;
}

void StdioServer::readLoop() {
  std::string pending;
  bool discarding = false;
  char buffer[kReadChunk];

  auto deliver = [this](std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      return;
    }
    on_line_(std::move(line));
  };

  for (;;) {
    struct pollfd fds[2];
    fds[0].fd = options_.input_fd;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = wake_pipe_[0];
    fds[1].events = POLLIN;
    fds[1].revents = 0;

    int ready = ::poll(fds, 2, -1);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      HITL_LOG(Error, "poll on client input failed: {}", std::strerror(errno));
      break;
    }
    if (fds[1].revents & POLLIN) {
      HITL_LOG(Debug, "Reader stopped");
      break;
    }
    if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
      continue;
    }

    ssize_t n = ::read(options_.input_fd, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      HITL_LOG(Error, "Read from client failed: {}", std::strerror(errno));
      eof_ = true;
      break;
    }
    if (n == 0) {
      if (!discarding) {
        deliver(std::move(pending));
      }
      HITL_LOG(Info, "Client input closed");
      eof_ = true;
      break;
    }

    size_t start = 0;
    for (size_t i = 0; i < static_cast<size_t>(n); ++i) {
      if (buffer[i] != '\n') {
        continue;
      }
      if (!discarding) {
        pending.append(buffer + start, i - start);
        if (pending.size() > options_.max_line_bytes) {
          HITL_LOG(Warning, "Dropping client message over {} bytes",
                   options_.max_line_bytes);
        } else {
          deliver(std::move(pending));
        }
      }
      pending.clear();
      discarding = false;
      start = i + 1;
    }
    if (!discarding) {
      pending.append(buffer + start, static_cast<size_t>(n) - start);
      if (pending.size() > options_.max_line_bytes) {
        HITL_LOG(Warning, "Dropping client message over {} bytes",
                 options_.max_line_bytes);
        pending.clear();
        discarding = true;
      }
    }
  }

  finish();
}

}  // namespace proxy
}  // namespace hitl
