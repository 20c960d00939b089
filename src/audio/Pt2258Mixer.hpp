// File Overview: Mixer adapter for a PT2258 6-channel electronic volume IC on I2C.
// The chip is write-only, so getVolume() always reports unavailable.
#pragma once
#include <Arduino.h>
#include "audio/Mixer.hpp"

class Pt2258Mixer : public Mixer {
public:
  explicit Pt2258Mixer(uint8_t addr = 0x44) : _addr(addr) {}

  // Brings up the bus and clears the chip. False if nothing ACKs at the address.
  bool begin(int sda, int scl);

  bool getVolume(int& pct) override;
  bool setVolume(int pct) override;
  bool setMute(bool on) override;
  const char* name() const override { return "pt2258"; }
  const char* lastError() const override { return _lastError; }

  // 100% -> 0 dB, 0% -> 79 dB attenuation, rounded to the nearest dB.
  static uint8_t attenuationFor(int pct);

private:
  bool write(const uint8_t* bytes, size_t n);

  uint8_t _addr;
  const char* _lastError = "";
};
