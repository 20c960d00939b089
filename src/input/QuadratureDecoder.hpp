// File Overview: Declares the table-driven quadrature decoder that turns raw A/B phase
// transitions into at most one direction event per completed detent.
#pragma once
#include <stdint.h>

enum class Direction : int8_t { None = 0, Clockwise = 1, CounterClockwise = -1 };

// Full-cycle decoder. Clockwise is 00->01->11->10->00 on (A<<1)|B.
// A direction is reported only on arrival back at the rest (detent) state after all
// four sub-steps; partial or bounced cycles are dropped there.
// Full-cycle encoders detent on 00 or 11. A seed caught on 01/10 (knob moving or a
// contact bouncing during the read) leaves the detent unknown until the first 00/11.
// Framework-free: the caller reads the pins and feeds observe() on every A/B edge.
class QuadratureDecoder {
public:
  static constexpr uint8_t kNoRest = 0xFF;

  // Seed from the pin levels at startup. reversed swaps the reported direction.
  void begin(bool a, bool b, bool reversed = false);

  // Adopt the current state as the detent if it can be one (00/11); drops any partial
  // cycle. Called once the knob has been seen resting there. Returns true if it moved.
  bool reanchor();

  // Returns Clockwise/CounterClockwise when a complete cycle lands on the rest state,
  // None otherwise (partial cycle, repeated state, or a two-bit jump).
  Direction observe(bool a, bool b);

  uint8_t state() const { return _prev; }
  uint8_t restState() const { return _rest; }   // kNoRest until a detent is known
  bool    anchored() const { return _rest != kNoRest; }
  int8_t  pending() const { return _accum; }

private:
  bool    _reversed = false;
  uint8_t _rest  = 0;   // detent position
  uint8_t _prev  = 0;   // last A/B state
  int8_t  _accum = 0;   // accumulated sub-steps of the current cycle
};
