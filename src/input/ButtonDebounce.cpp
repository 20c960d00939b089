#include "ButtonDebounce.hpp"

void ButtonDebounce::begin(uint32_t stableMs, ButtonState initial) {
  _stableMs = stableMs;
  _stable = _pending = initial;
  _hasPending = false;
  _seen = false;
  _lastChangeMs = 0;
}

bool ButtonDebounce::settle(uint32_t nowMs, ButtonState& out) {
  if (!_hasPending) return false;
  if ((uint32_t)(nowMs - _lastChangeMs) < _stableMs) return false;
  _hasPending = false;
  if (_pending == _stable) return false;   // bounced back to where it was
  _stable = _pending;
  out = _stable;
  return true;
}

bool ButtonDebounce::observe(ButtonState raw, uint32_t nowMs, ButtonState& out) {
  // Out-of-order timestamps are noise (wrap-safe compare)
  if (_seen && (int32_t)(nowMs - _lastChangeMs) < 0) return false;

  bool confirmed = settle(nowMs, out);

  if (_hasPending && raw == _pending) return confirmed;   // same level again
  if (!_hasPending && raw == _stable) return confirmed;   // no change vs. accepted level

  // New raw level: restart the stability window
  _pending = raw;
  _hasPending = true;
  _lastChangeMs = nowMs;
  _seen = true;
  return confirmed;
}

bool ButtonDebounce::poll(uint32_t nowMs, ButtonState& out) {
  return settle(nowMs, out);
}
