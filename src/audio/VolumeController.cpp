#include "VolumeController.hpp"

void VolumeController::begin(const VolumeLimits& limits, int initialVolume) {
  _limits  = limits;
  _current = constrain(initialVolume);
  _preMute = _current;
  _muted   = false;
}

// Step sizes that don't divide the range stop at the nearest boundary.
int VolumeController::constrain(int v) const {
  if (v < _limits.minVolume) return _limits.minVolume;
  if (v > _limits.maxVolume) return _limits.maxVolume;
  return v;
}

bool VolumeController::onStep(Direction dir, VolumeCommand& out) {
  if (dir == Direction::None) return false;

  // Turning the knob while muted un-mutes; current still holds the pre-mute volume
  _muted = false;

  int delta = (dir == Direction::Clockwise) ? _limits.step : -_limits.step;
  _current = constrain(_current + delta);
  out = snapshot();
  return true;
}

VolumeCommand VolumeController::onButtonPress() {
  if (_muted) {
    _current = constrain(_preMute);
    _muted = false;
  } else {
    _preMute = _current;
    _muted = true;
  }
  return snapshot();
}

VolumeCommand VolumeController::snapshot() const {
  VolumeCommand c;
  c.volume = _current;
  c.muted  = _muted;
  return c;
}
