#include "KnobConfig.hpp"
#include <string.h>

VolumeLimits KnobConfig::limits() const {
  VolumeLimits l;
  l.minVolume = minVolume;
  l.maxVolume = maxVolume;
  l.step      = step;
  return l;
}

static bool pinValid(int pin) { return pin >= 0 && pin <= KNOB_MAX_GPIO; }

// Pins the board already drives: status LED always, the I2C pair when the PT2258 is used.
static bool pinReserved(const KnobConfig& cfg, int pin) {
  if (pin == PIN_STATUS_LED) return true;
  if (cfg.mixerKind == MixerKind::Pt2258 && (pin == PIN_I2C_SDA || pin == PIN_I2C_SCL))
    return true;
  return false;
}

bool linkBaudSupported(uint32_t baud) {
  static const uint32_t kRates[] = { 9600, 19200, 38400, 57600, 115200, 230400, 460800, 921600 };
  for (uint32_t r : kRates) if (r == baud) return true;
  return false;
}

static bool fail(const char** why, const char* msg) {
  if (why) *why = msg;
  return false;
}

bool validateConfig(const KnobConfig& cfg, const char** why) {
  if (!pinValid(cfg.pinA) || !pinValid(cfg.pinB))
    return fail(why, "encoder pin out of range");
  if (cfg.pinA == cfg.pinB)
    return fail(why, "encoder phases share a pin");
  if (pinReserved(cfg, cfg.pinA) || pinReserved(cfg, cfg.pinB))
    return fail(why, "encoder pin collides with the status LED or I2C bus");
  if (cfg.hasButton()) {
    if (!pinValid(cfg.pinButton)) return fail(why, "button pin out of range");
    if (cfg.pinButton == cfg.pinA || cfg.pinButton == cfg.pinB)
      return fail(why, "button pin collides with an encoder phase");
    if (pinReserved(cfg, cfg.pinButton))
      return fail(why, "button pin collides with the status LED or I2C bus");
  } else if (cfg.pinButton != -1) {
    return fail(why, "button pin out of range");
  }

  if (cfg.minVolume < KNOB_VOLUME_FLOOR || cfg.minVolume > KNOB_VOLUME_CEIL)
    return fail(why, "min_volume must be 1..100");
  if (cfg.maxVolume < KNOB_VOLUME_FLOOR || cfg.maxVolume > KNOB_VOLUME_CEIL)
    return fail(why, "max_volume must be 1..100");
  if (cfg.minVolume > cfg.maxVolume)
    return fail(why, "min_volume > max_volume");
  if (cfg.step <= 0)
    return fail(why, "step must be positive");
  if (cfg.debounceMs == 0 || cfg.debounceMs > KNOB_DEBOUNCE_MAX_MS)
    return fail(why, "debounce_ms must be 1..1000");
  if (cfg.mixerTimeoutMs == 0)
    return fail(why, "mixer timeout must be positive");
  if (cfg.mixerKind == MixerKind::HostSerial && cfg.mixerControl.empty())
    return fail(why, "mixer control name is empty");
  if (cfg.mixerKind == MixerKind::HostSerial && !linkBaudSupported(cfg.linkBaud))
    return fail(why, "unsupported host link baud rate");

  if (why) *why = nullptr;
  return true;
}

const char* mixerKindName(MixerKind kind) {
  switch (kind) {
    case MixerKind::HostSerial: return "serial";
    case MixerKind::Pt2258:     return "pt2258";
  }
  return "?";
}

bool mixerKindFromName(const char* name, MixerKind& out) {
  if (!name) return false;
  if (strcmp(name, "serial") == 0) { out = MixerKind::HostSerial; return true; }
  if (strcmp(name, "pt2258") == 0) { out = MixerKind::Pt2258;     return true; }
  return false;
}
