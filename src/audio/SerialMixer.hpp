// File Overview: Mixer adapter for a host computer reached over a serial stream. Each
// call is one HostLink request/reply exchange bounded by a timeout.
#pragma once
#include <Arduino.h>
#include <string>

#include "audio/Mixer.hpp"
#include "audio/HostLink.hpp"

class SerialMixer : public Mixer {
public:
  SerialMixer(Stream& io, const char* control, uint32_t timeoutMs);

  bool getVolume(int& pct) override;
  bool setVolume(int pct) override;
  bool setMute(bool on) override;
  const char* name() const override { return "serial"; }

  const char* lastError() const override { return _lastError; }

private:
  bool transact(HostLink::Op op, int value, HostLink::Reply& reply);
  bool readLine(char* buf, size_t cap, size_t& len, uint32_t deadlineMs);
  void drainInput();
  void setError(const char* msg);

  Stream& _io;
  std::string _control;
  uint32_t _timeoutMs;
  uint32_t _nextId = 1;
  char _lastError[48] = {0};
};
