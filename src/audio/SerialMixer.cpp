#include "SerialMixer.hpp"
#include <esp_log.h>
#include <string.h>

namespace {
  const char* kTag = "KNOB-HOST";
}

SerialMixer::SerialMixer(Stream& io, const char* control, uint32_t timeoutMs)
  : _io(io), _control(control ? control : ""), _timeoutMs(timeoutMs) {}

void SerialMixer::setError(const char* msg) {
  strncpy(_lastError, msg, sizeof(_lastError) - 1);
  _lastError[sizeof(_lastError) - 1] = '\0';
}

// Leftovers belong to requests that already timed out
void SerialMixer::drainInput() {
  while (_io.available() > 0) _io.read();
}

bool SerialMixer::readLine(char* buf, size_t cap, size_t& len, uint32_t deadlineMs) {
  len = 0;
  bool overflow = false;
  while ((int32_t)(millis() - deadlineMs) < 0) {
    if (_io.available() <= 0) { delay(1); continue; }
    int c = _io.read();
    if (c < 0) continue;
    if (c == '\r') continue;
    if (c == '\n') {
      if (overflow) { len = 0; overflow = false; continue; }   // drop oversized line
      buf[len] = '\0';
      return true;
    }
    if (len + 1 < cap) buf[len++] = (char)c;
    else overflow = true;
  }
  return false;
}

bool SerialMixer::transact(HostLink::Op op, int value, HostLink::Reply& reply) {
  char frame[HostLink::kFrameCap];
  const uint32_t id = _nextId++;
  size_t n = HostLink::encodeRequest(id, op, value, _control.c_str(), frame, sizeof(frame));
  if (n == 0) {
    setError("request too large");
    return false;
  }

  drainInput();
  _io.write(reinterpret_cast<const uint8_t*>(frame), n);
  _io.write('\n');
  _io.flush();

  const uint32_t deadline = millis() + _timeoutMs;
  char line[HostLink::kFrameCap];
  size_t len = 0;
  while (readLine(line, sizeof(line), len, deadline)) {
    if (!HostLink::parseReply(line, len, reply)) continue;   // host log chatter
    if (reply.id != id) {
      ESP_LOGD(kTag, "Stale reply id=%u (waiting for %u)", (unsigned)reply.id, (unsigned)id);
      continue;
    }
    if (!reply.ok) {
      setError(reply.error[0] ? reply.error : "rejected");
      return false;
    }
    return true;
  }
  setError("timeout");
  return false;
}

bool SerialMixer::getVolume(int& pct) {
  HostLink::Reply reply;
  if (!transact(HostLink::Op::Get, 0, reply)) return false;
  if (!reply.hasVolume) {
    setError("reply without volume");
    return false;
  }
  pct = reply.volume;
  return true;
}

bool SerialMixer::setVolume(int pct) {
  HostLink::Reply reply;
  return transact(HostLink::Op::Set, pct, reply);
}

bool SerialMixer::setMute(bool on) {
  HostLink::Reply reply;
  if (!transact(HostLink::Op::Mute, on ? 1 : 0, reply)) return false;
  // The host echoes the switch state it read back after applying
  if (reply.hasMuted && reply.muted != on) {
    setError(on ? "host still unmuted" : "host still muted");
    return false;
  }
  return true;
}
