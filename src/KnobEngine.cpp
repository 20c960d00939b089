#include "KnobEngine.hpp"

void KnobEngine::begin(const KnobConfig& cfg, int initialVolume, bool a, bool b, bool button) {
  _cfg  = &cfg;
  _levA = a;
  _levB = b;
  _decoder.begin(a, b, cfg.reversed);
  _button.begin(cfg.debounceMs, toButton(button));
  _volume.begin(cfg.limits(), initialVolume);
  _phaseSeen = false;
  _lastPhaseMs = 0;
  _detents = _presses = _reanchors = 0;
}

int initialVolume(Mixer& mixer, const KnobConfig& cfg, bool* fromMixer) {
  int v = cfg.defaultVolume;
  int reported = 0;
  bool ok = mixer.getVolume(reported);
  if (ok) v = reported;
  if (fromMixer) *fromMixer = ok;
  if (v < cfg.minVolume) return cfg.minVolume;
  if (v > cfg.maxVolume) return cfg.maxVolume;
  return v;
}

ButtonState KnobEngine::toButton(bool level) const {
  bool pressed = _cfg->buttonActiveLow ? !level : level;
  return pressed ? ButtonState::Pressed : ButtonState::Released;
}

// Only the press edge drives the controller; release just re-arms the filter.
bool KnobEngine::onButton(ButtonState s, VolumeCommand& out) {
  if (s != ButtonState::Pressed) return false;
  _presses++;
  out = _volume.onButtonPress();
  return true;
}

bool KnobEngine::handle(const EdgeEvent& ev, VolumeCommand& out) {
  switch (ev.line) {
    case EdgeLine::PhaseA:
    case EdgeLine::PhaseB: {
      if (ev.line == EdgeLine::PhaseA) _levA = ev.level;
      else                             _levB = ev.level;
      _phaseSeen = true;
      _lastPhaseMs = ev.timestampMs;
      Direction d = _decoder.observe(_levA, _levB);
      if (d == Direction::None) return false;
      _detents++;
      return _volume.onStep(d, out);
    }
    case EdgeLine::Button: {
      if (!_cfg->hasButton()) return false;
      ButtonState s;
      if (!_button.observe(toButton(ev.level), ev.timestampMs, s)) return false;
      return onButton(s, out);
    }
  }
  return false;
}

bool KnobEngine::tick(uint32_t nowMs, VolumeCommand& out) {
  // A knob left alone sits on a detent; the boot-time seed may have been mid-cycle
  if (_phaseSeen && (int32_t)(nowMs - _lastPhaseMs) >= (int32_t)kRestLearnMs) {
    _phaseSeen = false;
    if (_decoder.reanchor()) _reanchors++;
  }

  if (!_cfg->hasButton()) return false;
  ButtonState s;
  if (!_button.poll(nowMs, s)) return false;
  return onButton(s, out);
}
