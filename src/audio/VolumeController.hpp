// File Overview: Declares the volume/mute state machine that turns detent and button
// events into absolute commands for the mixer. Holds no hardware handles.
#pragma once
#include <stdint.h>
#include "input/QuadratureDecoder.hpp"

// Absolute target for the mixer (newest one wins).
struct VolumeCommand {
  int  volume = 0;     // percent
  bool muted  = false;
};

struct VolumeLimits {
  int minVolume = 1;
  int maxVolume = 100;
  int step      = 1;
};

// Active --press--> Muted, Muted --press--> Active (restores pre-mute volume),
// Active --step--> Active, Muted --step--> Active (un-mute, then step).
// current always stays within [minVolume, maxVolume].
class VolumeController {
public:
  void begin(const VolumeLimits& limits, int initialVolume);

  // Returns false only for Direction::None.
  bool onStep(Direction dir, VolumeCommand& out);
  VolumeCommand onButtonPress();

  int  current() const { return _current; }
  bool muted() const { return _muted; }
  int  preMuteVolume() const { return _preMute; }
  const VolumeLimits& limits() const { return _limits; }
  VolumeCommand snapshot() const;

private:
  int constrain(int v) const;

  VolumeLimits _limits{};
  int  _current = 1;
  int  _preMute = 1;   // only meaningful while muted
  bool _muted   = false;
};
