// File Overview: Loads the knob configuration from the NVS namespace, falling back to
// the compiled-in defaults for any key that was never written.
#pragma once
#include <Preferences.h>
#include "config/KnobConfig.hpp"

namespace ConfigStore {
  // Reads every key; does not validate (see validateConfig).
  void load(Preferences& p, KnobConfig& cfg);
  // Logs the effective configuration at INFO.
  void dump(const KnobConfig& cfg);
}
