#include "ConfigStore.hpp"
#include <Arduino.h>
#include <esp_log.h>
#include "prefs.hpp"

namespace {
  const char* kTag = "KNOB-CFG";
}

namespace ConfigStore {

void load(Preferences& p, KnobConfig& cfg) {
  const KnobConfig def{};

  cfg.pinA            = p.getInt(KEY_PIN_A,   def.pinA);
  cfg.pinB            = p.getInt(KEY_PIN_B,   def.pinB);
  cfg.pinButton       = p.getInt(KEY_PIN_BTN, def.pinButton);
  cfg.buttonActiveLow = p.getBool(KEY_BTN_ACT_LOW, def.buttonActiveLow);

  cfg.minVolume     = p.getInt(KEY_VOL_MIN,     def.minVolume);
  cfg.maxVolume     = p.getInt(KEY_VOL_MAX,     def.maxVolume);
  cfg.step          = p.getInt(KEY_VOL_STEP,    def.step);
  cfg.defaultVolume = p.getInt(KEY_VOL_DEFAULT, def.defaultVolume);

  cfg.debounceMs = p.getUInt(KEY_DEBOUNCE_MS, def.debounceMs);
  cfg.reversed   = p.getBool(KEY_REVERSED, def.reversed);

  String kind = p.getString(KEY_MIXER, mixerKindName(def.mixerKind));
  if (!mixerKindFromName(kind.c_str(), cfg.mixerKind)) {
    ESP_LOGW(kTag, "Unknown mixer '%s', using %s", kind.c_str(), mixerKindName(def.mixerKind));
    cfg.mixerKind = def.mixerKind;
  }
  cfg.mixerTimeoutMs = p.getUInt(KEY_MIXER_TO_MS, def.mixerTimeoutMs);
  cfg.mixerControl   = p.getString(KEY_MIXER_CTRL, def.mixerControl.c_str()).c_str();
  cfg.linkBaud       = p.getUInt(KEY_LINK_BAUD, def.linkBaud);
}

void dump(const KnobConfig& cfg) {
  ESP_LOGI(kTag, "Encoder pins A=%d B=%d%s", cfg.pinA, cfg.pinB, cfg.reversed ? " (reversed)" : "");
  if (cfg.hasButton()) {
    ESP_LOGI(kTag, "Mute button pin %d (active %s), debounce %u ms",
             cfg.pinButton, cfg.buttonActiveLow ? "LOW" : "HIGH", (unsigned)cfg.debounceMs);
  } else {
    ESP_LOGI(kTag, "No mute button configured");
  }
  ESP_LOGI(kTag, "Volume %d..%d step %d (default %d)",
           cfg.minVolume, cfg.maxVolume, cfg.step, cfg.defaultVolume);
  ESP_LOGI(kTag, "Mixer %s, control '%s', timeout %u ms",
           mixerKindName(cfg.mixerKind), cfg.mixerControl.c_str(), (unsigned)cfg.mixerTimeoutMs);
}

} // namespace ConfigStore
