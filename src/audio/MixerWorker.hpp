// File Overview: Declares the FreeRTOS task that owns the mixer adapter. The knob loop
// hands it absolute commands through a one-slot mailbox, so a slow host or I2C bus
// never stalls edge consumption and only the newest target is ever applied.
#pragma once
#include <stdint.h>
#include "audio/Mixer.hpp"
#include "audio/VolumeController.hpp"

namespace MixerWorker {
  // mixer must outlive the task.
  bool begin(Mixer* mixer);
  // Non-blocking; replaces any command the worker has not picked up yet.
  void submit(const VolumeCommand& cmd);

  uint32_t applied();
  uint32_t failed();
}
