#define DEEPRESEARCH_LOG_COMPONENT "transport"

#include "deepresearch/transport/stdio_transport.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cstring>
#include <exception>
#include <string>

#include "deepresearch/logging/log_macros.h"

namespace deepresearch {
namespace transport {

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

}  // namespace

StdioTransport::StdioTransport(event::Dispatcher& dispatcher,
                               int in_fd,
                               int out_fd)
    : dispatcher_(dispatcher), in_fd_(in_fd), out_fd_(out_fd) {}

StdioTransport::~StdioTransport() { stop(); }

bool StdioTransport::start() {
  if (input_open_) {
    return true;
  }

  saved_in_flags_ = fcntl(in_fd_, F_GETFL);
  if (saved_in_flags_ < 0) {
    DEEPRESEARCH_LOG(Error, "Cannot read flags of fd {}: {}", in_fd_,
                     std::strerror(errno));
    return false;
  }
  if (fcntl(in_fd_, F_SETFL, saved_in_flags_ | O_NONBLOCK) < 0) {
    DEEPRESEARCH_LOG(Error, "Cannot make fd {} non-blocking: {}", in_fd_,
                     std::strerror(errno));
    saved_in_flags_ = -1;
    return false;
  }

  try {
    read_event_ = dispatcher_.createFileEvent(
        in_fd_, [this](uint32_t) { onReadReady(); },
        static_cast<uint32_t>(event::FileReadyType::Read));
  } catch (const std::exception& e) {
    DEEPRESEARCH_LOG(Error, "Cannot watch fd {}: {}", in_fd_, e.what());
    fcntl(in_fd_, F_SETFL, saved_in_flags_);
    saved_in_flags_ = -1;
    return false;
  }

  input_open_ = true;
  output_open_ = true;
  disconnect_reported_ = false;
  DEEPRESEARCH_LOG(Debug, "Stdio transport started (in={}, out={})", in_fd_,
                   out_fd_);
  if (connection_callback_) {
    connection_callback_(true);
  }
  return true;
}

void StdioTransport::stop() {
  closeInput();
  output_open_ = false;
  read_event_.reset();
}

// Leaves read_event_ allocated; this may run inside its own callback
void StdioTransport::closeInput() {
  if (!input_open_) {
    return;
  }
  input_open_ = false;
  if (read_event_) {
    read_event_->setEnabled(0);
  }
  if (saved_in_flags_ >= 0) {
    fcntl(in_fd_, F_SETFL, saved_in_flags_);
    saved_in_flags_ = -1;
  }
}

void StdioTransport::send(const std::string& data) {
  if (!output_open_) {
    DEEPRESEARCH_LOG(Warning, "Dropping {} byte frame: output closed",
                     data.size());
    return;
  }

  const char* ptr = data.data();
  size_t remaining = data.size();

  while (remaining > 0) {
    ssize_t n = write(out_fd_, ptr, remaining);
    if (n > 0) {
      ptr += n;
      remaining -= static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && waitWritable()) {
      continue;
    }

    std::string reason = std::string("write failed: ") + std::strerror(errno);
    output_open_ = false;
    closeInput();
    notifyDisconnected(reason);
    return;
  }
}

bool StdioTransport::waitWritable() {
  struct pollfd pfd;
  pfd.fd = out_fd_;
  pfd.events = POLLOUT;
  pfd.revents = 0;

  for (;;) {
    int rc = poll(&pfd, 1, -1);
    if (rc < 0 && errno == EINTR) {
      continue;
    }
    return rc > 0 && (pfd.revents & POLLOUT) != 0;
  }
}

void StdioTransport::onReadReady() {
  char buffer[kReadChunkSize];

  while (input_open_) {
    ssize_t n = read(in_fd_, buffer, sizeof(buffer));
    if (n > 0) {
      if (data_callback_) {
        data_callback_(std::string(buffer, static_cast<size_t>(n)));
      }
      continue;
    }
    if (n == 0) {
      closeInput();
      notifyDisconnected("end of stream");
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }

    std::string reason = std::string("read failed: ") + std::strerror(errno);
    closeInput();
    notifyDisconnected(reason);
    return;
  }
}

void StdioTransport::notifyDisconnected(const std::string& reason) {
  if (disconnect_reported_) {
    return;
  }
  disconnect_reported_ = true;
  DEEPRESEARCH_LOG(Info, "Stdio transport closed: {}", reason);
  if (connection_callback_) {
    connection_callback_(false);
  }
}

}  // namespace transport
}  // namespace deepresearch
