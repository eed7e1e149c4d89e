#include "network/tcp_session.hpp"

#include "ctrl_errors.hpp"
#include "observability/logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace netctrl {
namespace network {

namespace {

std::string errnoText(int err) {
  return std::string(std::strerror(err));
}

bool setBlocking(int fd, bool blocking) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
  return fcntl(fd, F_SETFL, flags) == 0;
}

// Wait for fd to become ready; returns 0 on timeout, <0 on error.
int waitFor(int fd, short events, int timeout_ms) {
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;

  int rc;
  do {
    rc = poll(&pfd, 1, timeout_ms);
  } while (rc < 0 && errno == EINTR);
  return rc;
}

}  // namespace

TCPSession::TCPSession() : socket_(-1) {}

TCPSession::~TCPSession() {
  close();
}

void TCPSession::connect(const std::string& host, uint16_t port, int timeout_ms) {
  close();

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* results = nullptr;
  std::string service = std::to_string(port);
  int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    throw ConnectionError("cannot resolve " + host + ": " + gai_strerror(rc));
  }

  std::string target = host + ":" + service;
  bool timed_out = false;
  std::string last_error = "no usable address";

  // One deadline covers every address getaddrinfo returned
  using Clock = std::chrono::steady_clock;
  const bool bounded = timeout_ms >= 0;
  const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

  for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int wait_ms = -1;
    if (bounded) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
      if (left.count() <= 0) {
        timed_out = true;
        last_error = "timed out after " + std::to_string(timeout_ms) + " ms";
        break;
      }
      wait_ms = static_cast<int>(left.count());
    }

    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      timed_out = false;
      last_error = errnoText(errno);
      continue;
    }

    if (!setBlocking(fd, false)) {
      timed_out = false;
      last_error = errnoText(errno);
      ::close(fd);
      continue;
    }

    int err = 0;
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
      if (errno != EINPROGRESS) {
        err = errno;
      } else {
        int ready = waitFor(fd, POLLOUT, wait_ms);
        if (ready == 0) {
          timed_out = true;
          last_error = "timed out after " + std::to_string(timeout_ms) + " ms";
          ::close(fd);
          continue;
        }
        if (ready < 0) {
          err = errno;
        } else {
          socklen_t len = sizeof(err);
          if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
          }
        }
      }
    }

    if (err != 0) {
      timed_out = false;
      last_error = errnoText(err);
      ::close(fd);
      continue;
    }

    if (!setBlocking(fd, true)) {
      timed_out = false;
      last_error = errnoText(errno);
      ::close(fd);
      continue;
    }

    socket_ = fd;
    peer_ = target;
    break;
  }

  freeaddrinfo(results);

  if (socket_ < 0) {
    if (timed_out) {
      throw TimeoutError("connect to " + target + " " + last_error);
    }
    throw ConnectionError("failed to connect to " + target + ": " + last_error);
  }

  LOG_BUILDER(observability::LogLevel::INFO, "Connected").field("peer", peer_);
}

void TCPSession::write(const std::string& data) {
  if (socket_ < 0) {
    throw IoError("write on closed session");
  }

  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(socket_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw IoError("write to " + peer_ + " failed: " + errnoText(errno));
    }
    sent += static_cast<size_t>(n);
  }
}

std::string TCPSession::readAvailable(size_t max_bytes, ReadMode mode, int timeout_ms) {
  if (socket_ < 0) {
    throw IoError("read on closed session");
  }

  if (mode == ReadMode::Blocking) {
    int ready = waitFor(socket_, POLLIN, timeout_ms);
    if (ready == 0) {
      throw TimeoutError("no data from " + peer_ + " within " +
                         std::to_string(timeout_ms) + " ms");
    }
    if (ready < 0) {
      throw IoError("poll on " + peer_ + " failed: " + errnoText(errno));
    }
  }

  if (max_bytes == 0) return std::string();

  std::vector<char> buffer(max_bytes);
  int flags = mode == ReadMode::NonBlocking ? MSG_DONTWAIT : 0;

  ssize_t n;
  do {
    n = recv(socket_, buffer.data(), buffer.size(), flags);
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    if (mode == ReadMode::NonBlocking && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return std::string();
    }
    throw IoError("read from " + peer_ + " failed: " + errnoText(errno));
  }
  if (n == 0) {
    throw IoError("connection closed by " + peer_);
  }
  return std::string(buffer.data(), static_cast<size_t>(n));
}

void TCPSession::close() {
  if (socket_ < 0) return;

  shutdown(socket_, SHUT_RDWR);
  ::close(socket_);
  socket_ = -1;

  LOG_BUILDER(observability::LogLevel::INFO, "Disconnected").field("peer", peer_);
}

}  // namespace network
}  // namespace netctrl
