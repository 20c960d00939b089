#include "QuadratureDecoder.hpp"

namespace {
  constexpr int8_t X = 2;            // both bits changed: noise
  constexpr int8_t kStepsPerDetent = 4;

  // 4x4 transition table: (prev<<2|cur) -> -1, 0, +1 or X
  const int8_t kTbl[16] = {
     0, +1, -1,  X,
    -1,  0,  X, +1,
    +1,  X,  0, -1,
     X, -1, +1,  0
  };

  inline uint8_t pack(bool a, bool b){ return (uint8_t)((a ? 2 : 0) | (b ? 1 : 0)); }
  inline bool canRest(uint8_t s){ return s == 0b00 || s == 0b11; }
}

void QuadratureDecoder::begin(bool a, bool b, bool reversed) {
  _reversed = reversed;
  _prev  = pack(a, b);
  _rest  = canRest(_prev) ? _prev : kNoRest;
  _accum = 0;
}

bool QuadratureDecoder::reanchor() {
  if (!canRest(_prev) || _prev == _rest) return false;
  _rest  = _prev;
  _accum = 0;
  return true;
}

Direction QuadratureDecoder::observe(bool a, bool b) {
  uint8_t cur = pack(a, b);
  int8_t d = kTbl[(_prev << 2) | cur];
  _prev = cur;

  if (d == 0) return Direction::None;
  if (d == X) {                    // resync on the new state, drop the partial cycle
    _accum = 0;
    return Direction::None;
  }

  if (_rest == kNoRest) {           // seeded mid-cycle: first 00/11 is the detent
    if (canRest(cur)) {
      _rest  = cur;
      _accum = 0;
    }
    return Direction::None;
  }

  _accum += d;
  if (cur != _rest) return Direction::None;

  // Back at the detent: a full cycle reads +-4, anything else was bounce or a resync
  int8_t acc = _accum;
  _accum = 0;
  if (acc >= kStepsPerDetent)
    return _reversed ? Direction::CounterClockwise : Direction::Clockwise;
  if (acc <= -kStepsPerDetent)
    return _reversed ? Direction::Clockwise : Direction::CounterClockwise;
  return Direction::None;
}
