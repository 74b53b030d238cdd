#include "mercury-itc/transport/TcpStream.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace mercuryitc {
namespace transport {

namespace {

std::string errno_text(const char *what) {
  return std::string(what) + ": " + std::strerror(errno);
}

void set_timeout(int fd, int option, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) != 0) {
    throw TransportError(errno_text("setsockopt"));
  }
}

} // namespace

TcpStream::TcpStream(const std::string &host, uint16_t port,
                     std::chrono::milliseconds io_timeout)
    : host_(host), port_(port), io_timeout_(io_timeout) {}

TcpStream::~TcpStream() { close(); }

std::string TcpStream::describe() const {
  return host_ + ":" + std::to_string(port_);
}

void TcpStream::open() {
  if (fd_ >= 0) {
    return;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *result = nullptr;
  std::string service = std::to_string(port_);
  int rc = getaddrinfo(host_.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw TransportError("Cannot resolve " + host_ + ": " + gai_strerror(rc));
  }

  std::string last_error = "no address for " + host_;
  for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = errno_text("socket");
      continue;
    }

    try {
      set_timeout(fd, SO_RCVTIMEO, io_timeout_);
      set_timeout(fd, SO_SNDTIMEO, io_timeout_);
    } catch (const TransportError &ex) {
      last_error = ex.what();
      ::close(fd);
      continue;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    last_error = errno_text("connect");
    ::close(fd);
  }
  freeaddrinfo(result);

  if (fd_ < 0) {
    throw TransportError("Failed to connect to " + describe() + ": " +
                         last_error);
  }
  rx_buffer_.clear();
  LOG_TRACE("TCP", "OPEN", "Connected to {}", describe());
}

void TcpStream::write(const std::string &data) {
  if (fd_ < 0) {
    throw TransportError("send on closed socket " + describe());
  }

  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t w = ::send(fd_, data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL);
    if (w > 0) {
      sent += static_cast<size_t>(w);
    } else if (w < 0 && errno == EINTR) {
      continue;
    } else {
      throw TransportError(errno_text("send"));
    }
  }
}

std::string TcpStream::read_some(size_t max_bytes) {
  if (fd_ < 0) {
    throw TransportError("recv on closed socket " + describe());
  }

  if (!rx_buffer_.empty()) {
    std::string out = rx_buffer_.substr(0, max_bytes);
    rx_buffer_.erase(0, out.size());
    return out;
  }

  std::string out(max_bytes, '\0');
  ssize_t r;
  do {
    r = ::recv(fd_, &out[0], max_bytes, 0);
  } while (r < 0 && errno == EINTR);

  if (r < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      throw TransportError("recv timeout from " + describe());
    }
    throw TransportError(errno_text("recv"));
  }
  out.resize(static_cast<size_t>(r));
  return out;
}

std::optional<std::string>
TcpStream::read_line(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw TransportError("recv on closed socket " + describe());
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buf[1024];

  while (true) {
    while (!rx_buffer_.empty() && rx_buffer_.front() == '\r') {
      rx_buffer_.erase(0, 1);
    }
    auto pos = rx_buffer_.find('\n');
    if (pos != std::string::npos) {
      std::string line = rx_buffer_.substr(0, pos);
      rx_buffer_.erase(0, pos + 1);
      return line;
    }

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (ms_left.count() <= 0) {
      return std::nullopt;
    }

    pollfd pfd{fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      throw TransportError(errno_text("poll"));
    }
    if (rc == 0) {
      return std::nullopt;
    }

    ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
    if (r > 0) {
      rx_buffer_.append(buf, static_cast<size_t>(r));
    } else if (r == 0) {
      throw TransportError("connection closed by " + describe());
    } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
      throw TransportError(errno_text("recv"));
    }
  }
}

void TcpStream::flush() { rx_buffer_.clear(); }

void TcpStream::close() {
  if (fd_ >= 0) {
    shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
  }
  fd_ = -1;
  rx_buffer_.clear();
}

} // namespace transport
} // namespace mercuryitc
