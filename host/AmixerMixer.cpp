#include "AmixerMixer.hpp"
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

AmixerMixer::AmixerMixer(const char* control) : _control(control ? control : "") {}

bool AmixerMixer::parseLevel(const std::string& output, int& pct, bool& muted) {
  size_t end = output.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) return false;
  size_t start = output.rfind('\n', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  const std::string last = output.substr(start, end - start + 1);

  size_t open = last.find('[');
  if (open == std::string::npos) return false;
  size_t percent = last.find('%', open);
  if (percent == std::string::npos || percent == open + 1) return false;

  const std::string digits = last.substr(open + 1, percent - open - 1);
  char* tail = nullptr;
  long v = strtol(digits.c_str(), &tail, 10);
  if (!tail || *tail != '\0' || v < 0 || v > 100) return false;
  pct = (int)v;

  size_t lo = last.rfind('[');
  size_t hi = last.rfind(']');
  muted = (hi != std::string::npos && hi > lo && last.compare(lo + 1, hi - lo - 1, "off") == 0);
  return true;
}

// fork/exec without a shell so the control name never reaches one
bool AmixerMixer::run(const std::vector<std::string>& args, std::string& output) {
  output.clear();
  if (_control.empty() || _control[0] == '-') {
    _lastError = "bad control name";
    return false;
  }

  int fds[2];
  if (pipe(fds) != 0) {
    _lastError = std::string("pipe: ") + strerror(errno);
    return false;
  }

  pid_t pid = fork();
  if (pid < 0) {
    _lastError = std::string("fork: ") + strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  if (pid == 0) {
    dup2(fds[1], STDOUT_FILENO);
    ::close(fds[0]);
    ::close(fds[1]);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("amixer"));
    for (const std::string& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    execvp("amixer", argv.data());
    _exit(127);
  }

  ::close(fds[1]);
  char buf[512];
  ssize_t n;
  while ((n = read(fds[0], buf, sizeof(buf))) != 0) {
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    output.append(buf, (size_t)n);
  }
  ::close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      _lastError = std::string("waitpid: ") + strerror(errno);
      return false;
    }
  }
  if (!WIFEXITED(status)) {
    _lastError = "amixer killed";
    return false;
  }
  int code = WEXITSTATUS(status);
  if (code == 127) {
    _lastError = "amixer not found";
    return false;
  }
  if (code != 0) {
    _lastError = "amixer exited with " + std::to_string(code) + " (control '" + _control + "')";
    return false;
  }
  return true;
}

bool AmixerMixer::runAndParse(const std::vector<std::string>& args) {
  std::string out;
  if (!run(args, out)) return false;
  if (!parseLevel(out, _volume, _muted)) {
    _lastError = "unreadable amixer output";
    return false;
  }
  return true;
}

bool AmixerMixer::getVolume(int& pct) {
  if (!runAndParse({"get", _control})) return false;
  pct = _volume;
  return true;
}

bool AmixerMixer::setVolume(int pct) {
  if (pct < 0 || pct > 100) {
    _lastError = "volume out of range";
    return false;
  }
  return runAndParse({"set", _control, std::to_string(pct) + "%"});
}

bool AmixerMixer::setMute(bool on) {
  if (!runAndParse({"set", _control, on ? "mute" : "unmute"})) return false;
  if (_muted != on) {
    _lastError = "control has no playback switch";
    return false;
  }
  return true;
}
