// File Overview: Declares the single-consumer dispatcher that applies queued edge events,
// in arrival order, to the quadrature decoder, button debounce and volume controller.
#pragma once
#include <stdint.h>

#include "config/KnobConfig.hpp"
#include "input/EdgeEvent.hpp"
#include "input/QuadratureDecoder.hpp"
#include "input/ButtonDebounce.hpp"
#include "audio/VolumeController.hpp"
#include "audio/Mixer.hpp"

// Not thread safe: one task owns the engine and calls handle()/tick().
class KnobEngine {
public:
  // cfg must outlive the engine. a/b/button are the pin levels read at startup.
  void begin(const KnobConfig& cfg, int initialVolume, bool a, bool b, bool button);

  // Returns true and fills out when the event changed the volume or mute state.
  bool handle(const EdgeEvent& ev, VolumeCommand& out);
  // Periodic debounce check; call at least every debounceMs/2. Also re-learns the
  // encoder detent once the phases have been idle for kRestLearnMs.
  bool tick(uint32_t nowMs, VolumeCommand& out);

  static constexpr uint32_t kRestLearnMs = 500;

  const VolumeController& volume() const { return _volume; }
  const QuadratureDecoder& decoder() const { return _decoder; }
  ButtonState button() const { return _button.stable(); }

  uint32_t detents() const { return _detents; }
  uint32_t presses() const { return _presses; }
  uint32_t reanchors() const { return _reanchors; }

private:
  ButtonState toButton(bool level) const;
  bool onButton(ButtonState s, VolumeCommand& out);

  const KnobConfig* _cfg = nullptr;
  QuadratureDecoder _decoder;
  ButtonDebounce    _button;
  VolumeController  _volume;

  bool _levA = false;
  bool _levB = false;
  bool _phaseSeen = false;
  uint32_t _lastPhaseMs = 0;
  uint32_t _detents = 0;
  uint32_t _presses = 0;
  uint32_t _reanchors = 0;
};

// Startup volume: whatever the mixer reports, else cfg.defaultVolume; clamped to
// cfg's range either way. fromMixer (optional) tells which one was used.
int initialVolume(Mixer& mixer, const KnobConfig& cfg, bool* fromMixer = nullptr);
