// File Overview: Abstract mixer adapter. Concrete adapters talk to whatever actually
// applies the volume (host over serial, PT2258 over I2C). All calls are synchronous
// and best effort; false means the mixer rejected or never acknowledged the request.
#pragma once

class Mixer {
public:
  virtual ~Mixer() {}

  virtual bool getVolume(int& pct) = 0;
  virtual bool setVolume(int pct) = 0;
  virtual bool setMute(bool on) = 0;
  virtual const char* name() const = 0;
  // Reason for the most recent failure, "" if the adapter can't tell.
  virtual const char* lastError() const { return ""; }
};
