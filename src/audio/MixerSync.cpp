#include "MixerSync.hpp"

void MixerSync::invalidate() {
  _knownVolume = false;
  _knownMute = false;
}

bool MixerSync::pushVolume(Mixer& mixer, int pct) {
  if (_knownVolume && _appliedVolume == pct) return true;
  if (mixer.setVolume(pct) || mixer.setVolume(pct)) {
    _knownVolume = true;
    _appliedVolume = pct;
    return true;
  }
  _knownVolume = false;
  _failures++;
  return false;
}

bool MixerSync::pushMute(Mixer& mixer, bool on) {
  if (_knownMute && _appliedMuted == on) return true;
  if (mixer.setMute(on) || mixer.setMute(on)) {
    _knownMute = true;
    _appliedMuted = on;
    return true;
  }
  _knownMute = false;
  _failures++;
  return false;
}

bool MixerSync::apply(Mixer& mixer, const VolumeCommand& cmd) {
  if (cmd.muted) {
    // Volume is left alone while muted; it goes out with the un-mute
    return pushMute(mixer, true);
  }
  // Set the level before opening the output; if it can't be set the output stays
  // muted until a later command gets the level through
  if (!pushVolume(mixer, cmd.volume)) return false;
  return pushMute(mixer, false);
}
