#include "SerialPort.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

namespace {
  bool speedFor(uint32_t baud, speed_t& out) {
    switch (baud) {
      case 9600:   out = B9600;   return true;
      case 19200:  out = B19200;  return true;
      case 38400:  out = B38400;  return true;
      case 57600:  out = B57600;  return true;
      case 115200: out = B115200; return true;
      case 230400: out = B230400; return true;
      case 460800: out = B460800; return true;
      case 921600: out = B921600; return true;
    }
    return false;
  }
}

bool SerialPort::open(const char* path, uint32_t baud, std::string& err) {
  close();
  speed_t speed;
  if (!speedFor(baud, speed)) {
    err = "unsupported baud " + std::to_string(baud);
    return false;
  }

  int fd = ::open(path, O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd < 0) {
    err = std::string(path) + ": " + strerror(errno);
    return false;
  }

  termios tio;
  if (tcgetattr(fd, &tio) != 0) {
    err = std::string("tcgetattr: ") + strerror(errno);
    ::close(fd);
    return false;
  }
  cfmakeraw(&tio);
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  if (tcsetattr(fd, TCSANOW, &tio) != 0) {
    err = std::string("tcsetattr: ") + strerror(errno);
    ::close(fd);
    return false;
  }
  tcflush(fd, TCIOFLUSH);

  _fd = fd;
  _pending.clear();
  _overflow = false;
  return true;
}

void SerialPort::close() {
  if (_fd >= 0) ::close(_fd);
  _fd = -1;
}

SerialPort::Read SerialPort::readLine(std::string& line, int timeoutMs, size_t maxLine) {
  if (_fd < 0) return Read::Closed;

  while (true) {
    size_t nl = _pending.find('\n');
    if (nl != std::string::npos) {
      bool drop = _overflow;
      _overflow = false;
      line.assign(_pending, 0, nl);
      _pending.erase(0, nl + 1);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!drop && line.size() <= maxLine) return Read::Line;
      continue;
    }
    if (_pending.size() > maxLine) {       // keep discarding until the newline
      _pending.clear();
      _overflow = true;
    }

    pollfd pfd = { _fd, POLLIN, 0 };
    int rc = poll(&pfd, 1, timeoutMs);
    if (rc < 0) {
      if (errno == EINTR) return Read::Timeout;
      return Read::Closed;
    }
    if (rc == 0) return Read::Timeout;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) return Read::Closed;

    char buf[256];
    ssize_t n = read(_fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      return Read::Closed;
    }
    if (n == 0) return Read::Closed;       // device went away
    _pending.append(buf, (size_t)n);
  }
}

bool SerialPort::writeLine(const char* buf, size_t len) {
  if (_fd < 0) return false;
  std::string frame(buf, len);
  frame.push_back('\n');
  size_t off = 0;
  while (off < frame.size()) {
    ssize_t n = write(_fd, frame.data() + off, frame.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += (size_t)n;
  }
  return true;
}
