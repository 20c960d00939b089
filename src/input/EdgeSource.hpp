// File Overview: Declares the interrupt-driven edge source: CHANGE interrupts on the
// encoder phases and button push EdgeEvents into one FreeRTOS queue, read by one task.
#pragma once
#include <Arduino.h>
#include "config/KnobConfig.hpp"
#include "input/EdgeEvent.hpp"

namespace EdgeSource {
  // Configures inputs with pull-ups, creates the queue and attaches the ISRs.
  bool begin(const KnobConfig& cfg);
  void end();

  // Blocks up to waitMs for the next event in capture order.
  bool receive(EdgeEvent& ev, uint32_t waitMs);

  // Current pin levels (for seeding the decoder before interrupts run).
  bool readLevel(EdgeLine line);

  // Events lost because the queue was full since the last call.
  uint32_t takeDropped();
}
