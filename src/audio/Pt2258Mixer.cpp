#include "Pt2258Mixer.hpp"
#include <Wire.h>
#include <esp_log.h>

// ===== PT2258 command bytes =====
static constexpr uint8_t CMD_CLEAR      = 0xC0;
static constexpr uint8_t CMD_MASTER_10  = 0xD0;   // | tens of dB (0..7)
static constexpr uint8_t CMD_MASTER_1   = 0xE0;   // | units of dB (0..9)
static constexpr uint8_t CMD_MUTE       = 0xF8;   // | 1 = mute
static constexpr uint8_t MAX_ATTEN_DB   = 79;

static const char* kTag = "KNOB-PT2258";

bool Pt2258Mixer::write(const uint8_t* bytes, size_t n) {
  Wire.beginTransmission(_addr);
  Wire.write(bytes, n);
  uint8_t rc = Wire.endTransmission(true);
  if (rc != 0) {
    _lastError = (rc == 2) ? "address NACK" : "I2C error";
    ESP_LOGD(kTag, "I2C write to 0x%02x failed (%u)", _addr, rc);
    return false;
  }
  return true;
}

bool Pt2258Mixer::begin(int sda, int scl) {
  pinMode(sda, INPUT_PULLUP);
  pinMode(scl, INPUT_PULLUP);
  Wire.begin(sda, scl, 100000);   // PT2258 tops out at 100 kHz
  Wire.setTimeOut(50);
  delay(200);                     // datasheet: wait after power-up before first command

  const uint8_t clear = CMD_CLEAR;
  bool present = write(&clear, 1);
  if (!present) ESP_LOGW(kTag, "No PT2258 at 0x%02x", _addr);
  return present;
}

uint8_t Pt2258Mixer::attenuationFor(int pct) {
  if (pct < 0) pct = 0;
  if (pct > 100) pct = 100;
  return (uint8_t)(((100 - pct) * MAX_ATTEN_DB + 50) / 100);
}

bool Pt2258Mixer::getVolume(int& pct) {
  (void)pct;
  _lastError = "write-only device";
  return false;
}

bool Pt2258Mixer::setVolume(int pct) {
  uint8_t att = attenuationFor(pct);
  uint8_t cmd[2] = {
    (uint8_t)(CMD_MASTER_10 | (att / 10)),
    (uint8_t)(CMD_MASTER_1  | (att % 10)),
  };
  return write(cmd, sizeof(cmd));
}

bool Pt2258Mixer::setMute(bool on) {
  const uint8_t cmd = CMD_MUTE | (on ? 1 : 0);
  return write(&cmd, 1);
}
