#include "mercury-itc/transport/SerialStream.hpp"
#include "mercury-itc/Errors.hpp"
#include "mercury-itc/Logger.hpp"

#include <cerrno>
#include <cstring>

// Linux headers
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace mercuryitc {
namespace transport {

namespace {

struct BaudEntry {
  int rate;
  speed_t speed;
};

const BaudEntry BAUD_TABLE[] = {
    {1200, B1200},     {2400, B2400},     {4800, B4800},
    {9600, B9600},     {19200, B19200},   {38400, B38400},
    {57600, B57600},   {115200, B115200}, {230400, B230400},
    {460800, B460800},
};

std::string errno_text(const char *what) {
  return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

SerialStream::SerialStream(const SerialSettings &settings)
    : settings_(settings) {}

SerialStream::~SerialStream() { close(); }

bool SerialStream::baud_to_speed(int baud, speed_t &speed) {
  for (const auto &entry : BAUD_TABLE) {
    if (entry.rate == baud) {
      speed = entry.speed;
      return true;
    }
  }
  return false;
}

std::string SerialStream::describe() const {
  return settings_.device + "@" + std::to_string(settings_.baud);
}

void SerialStream::open() {
  if (fd_ >= 0) {
    return;
  }

  speed_t speed;
  if (!baud_to_speed(settings_.baud, speed)) {
    throw TransportError("Unsupported baud rate " +
                         std::to_string(settings_.baud));
  }

  // non-blocking, don't become controlling tty
  fd_ = ::open(settings_.device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    throw TransportError(errno_text(("open " + settings_.device).c_str()));
  }

  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::string err = errno_text("tcgetattr");
    close();
    throw TransportError(err);
  }

  cfmakeraw(&tty);
  tty.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS);
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::string err = errno_text("tcsetattr");
    close();
    throw TransportError(err);
  }

  rx_buffer_.clear();
  LOG_DEBUG("SERIAL", "OPEN", "Opened {}", describe());
}

void SerialStream::write(const std::string &data) {
  if (fd_ < 0) {
    throw TransportError("write on closed serial port " + settings_.device);
  }

  size_t total = 0;
  while (total < data.size()) {
    ssize_t written = ::write(fd_, data.data() + total, data.size() - total);
    if (written > 0) {
      total += static_cast<size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue;
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{fd_, POLLOUT, 0};
      int ms = static_cast<int>(settings_.read_timeout.count());
      int rc = ::poll(&pfd, 1, ms);
      if (rc == 0) {
        throw TransportError("write timeout on " + settings_.device);
      }
      if (rc < 0 && errno != EINTR) {
        throw TransportError(errno_text("poll"));
      }
    } else {
      throw TransportError(errno_text("write"));
    }
  }
}

bool SerialStream::wait_readable(std::chrono::milliseconds timeout) {
  pollfd pfd{fd_, POLLIN, 0};
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (ms_left.count() < 0) {
      return false;
    }
    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      throw TransportError(errno_text("poll"));
    }
    if (rc == 0) {
      return false;
    }
    if (pfd.revents & POLLIN) {
      return true;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      throw TransportError("serial line hung up: " + settings_.device);
    }
  }
}

std::optional<std::string>
SerialStream::read_line(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw TransportError("read on closed serial port " + settings_.device);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char temp[256];

  while (true) {
    // A '\n\r' terminated line leaves its '\r' at the front of the buffer
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
    if (ms_left.count() <= 0 || !wait_readable(ms_left)) {
      return std::nullopt; // timeout/partial
    }

    ssize_t n = ::read(fd_, temp, sizeof(temp));
    if (n > 0) {
      rx_buffer_.append(temp, static_cast<size_t>(n));
    } else if (n == 0) {
      close();
      throw TransportError("serial line closed: " + settings_.device);
    } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
      throw TransportError(errno_text("read"));
    }
  }
}

std::string SerialStream::read_some(size_t max_bytes) {
  if (fd_ < 0) {
    throw TransportError("read on closed serial port " + settings_.device);
  }

  if (!rx_buffer_.empty()) {
    std::string out = rx_buffer_.substr(0, max_bytes);
    rx_buffer_.erase(0, out.size());
    return out;
  }

  if (!wait_readable(settings_.read_timeout)) {
    return {};
  }

  std::string out(max_bytes, '\0');
  ssize_t n = ::read(fd_, &out[0], max_bytes);
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      return {};
    }
    throw TransportError(errno_text("read"));
  }
  out.resize(static_cast<size_t>(n));
  return out;
}

void SerialStream::flush() {
  rx_buffer_.clear();
  if (fd_ < 0) {
    return;
  }
  if (tcdrain(fd_) != 0 || tcflush(fd_, TCIFLUSH) != 0) {
    throw TransportError(errno_text("flush"));
  }
}

void SerialStream::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    LOG_DEBUG("SERIAL", "CLOSE", "Closed {}", settings_.device);
  }
  fd_ = -1;
  rx_buffer_.clear();
}

} // namespace transport
} // namespace mercuryitc
