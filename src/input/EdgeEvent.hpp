// File Overview: Raw pin-level change as captured in interrupt context and queued for
// the single consumer task.
#pragma once
#include <stdint.h>

enum class EdgeLine : uint8_t { PhaseA = 0, PhaseB = 1, Button = 2 };

struct EdgeEvent {
  EdgeLine line = EdgeLine::PhaseA;
  bool     level = false;       // true = HIGH
  uint32_t timestampMs = 0;     // millis() at capture, wraps
};
