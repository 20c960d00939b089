// File Overview: Raw termios serial port with line-oriented reads, for the host end of
// the knob link (USB CDC shows up as /dev/ttyACM*, a UART bridge as /dev/ttyUSB*).
#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

class SerialPort {
public:
  enum class Read : uint8_t { Line, Timeout, Closed };

  SerialPort() = default;
  ~SerialPort() { close(); }
  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  bool open(const char* path, uint32_t baud, std::string& err);
  void close();
  bool isOpen() const { return _fd >= 0; }

  // One line without "\r\n". Lines longer than maxLine are dropped whole.
  Read readLine(std::string& line, int timeoutMs, size_t maxLine);
  bool writeLine(const char* buf, size_t len);

private:
  int _fd = -1;
  std::string _pending;
  bool _overflow = false;
};
