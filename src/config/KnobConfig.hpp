// File Overview: Immutable startup configuration for the knob (pins, volume bounds,
// debounce window, mixer selection) and the validation that gates startup.
#pragma once
#include <stdint.h>
#include <string>

#include "pins.hpp"
#include "audio/VolumeController.hpp"

enum class MixerKind : uint8_t { HostSerial = 0, Pt2258 = 1 };

struct KnobConfig {
  int pinA = PIN_ENC_A;
  int pinB = PIN_ENC_B;
  int pinButton = PIN_ENC_BTN;  // -1 = no button, press handling disabled

  int minVolume = 60;
  int maxVolume = 96;
  int step = 1;
  int defaultVolume = 60;       // used when the mixer can't report a level

  uint32_t debounceMs = 30;
  bool reversed = false;        // swap CW/CCW for encoders wired the other way
  bool buttonActiveLow = true;  // pull-up input, switch to ground

  MixerKind   mixerKind = MixerKind::HostSerial;
  uint32_t    mixerTimeoutMs = 250;
  std::string mixerControl = "Master";
  uint32_t    linkBaud = 115200;    // host link port when it isn't the USB console

  bool hasButton() const { return pinButton >= 0; }
  VolumeLimits limits() const;
};

static constexpr int      KNOB_MAX_GPIO        = 48;    // ESP32-S3
static constexpr int      KNOB_VOLUME_FLOOR    = 1;
static constexpr int      KNOB_VOLUME_CEIL     = 100;
static constexpr uint32_t KNOB_DEBOUNCE_MAX_MS = 1000;

// Rates accepted for the host link UART.
bool linkBaudSupported(uint32_t baud);

// Returns false and points why at a static message if the config would break an invariant.
bool validateConfig(const KnobConfig& cfg, const char** why);

const char* mixerKindName(MixerKind kind);
bool mixerKindFromName(const char* name, MixerKind& out);
