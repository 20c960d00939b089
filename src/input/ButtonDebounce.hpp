// File Overview: Declares the stable-time debounce filter for the knob's push button.
#pragma once
#include <stdint.h>

enum class ButtonState : uint8_t { Released = 0, Pressed = 1 };

// A raw change becomes a confirmed transition only after the level has held for
// stableMs. Feed every raw edge to observe() and call poll() periodically so a
// settled level is confirmed even when no further edge arrives.
class ButtonDebounce {
public:
  void begin(uint32_t stableMs, ButtonState initial = ButtonState::Released);

  // Record a raw level. Returns true (and sets out) if the previous pending level
  // had already been stable long enough when this edge arrived.
  bool observe(ButtonState raw, uint32_t nowMs, ButtonState& out);
  bool poll(uint32_t nowMs, ButtonState& out);

  ButtonState stable() const { return _stable; }
  bool hasPending() const { return _hasPending; }

private:
  bool settle(uint32_t nowMs, ButtonState& out);

  uint32_t    _stableMs = 30;
  ButtonState _stable  = ButtonState::Released;
  ButtonState _pending = ButtonState::Released;
  bool        _hasPending = false;
  bool        _seen = false;          // any raw edge recorded yet
  uint32_t    _lastChangeMs = 0;
};
