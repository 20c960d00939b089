// File Overview: Declares the helper that brings a mixer in line with an absolute
// VolumeCommand, sending only what changed since the last successful apply.
#pragma once
#include <stdint.h>
#include "audio/Mixer.hpp"
#include "audio/VolumeController.hpp"

// Each mixer call is retried once. A field that still fails is marked unknown,
// so the next command re-sends it and the mixer catches up.
class MixerSync {
public:
  bool apply(Mixer& mixer, const VolumeCommand& cmd);

  // Forget what the mixer holds (e.g. after reconnecting); next apply sends everything.
  void invalidate();

  uint32_t failures() const { return _failures; }
  bool volumeKnown() const { return _knownVolume; }
  bool muteKnown() const { return _knownMute; }
  int  appliedVolume() const { return _appliedVolume; }
  bool appliedMuted() const { return _appliedMuted; }

private:
  bool pushVolume(Mixer& mixer, int pct);
  bool pushMute(Mixer& mixer, bool on);

  bool _knownVolume = false;
  bool _knownMute   = false;
  int  _appliedVolume = 0;
  bool _appliedMuted  = false;
  uint32_t _failures = 0;
};
