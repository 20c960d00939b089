#include <Arduino.h>
#include <Preferences.h>
#include <esp_log.h>

#include "pins.hpp"
#include "prefs.hpp"
#include "KnobEngine.hpp"
#include "config/KnobConfig.hpp"
#include "config/ConfigStore.hpp"
#include "input/EdgeSource.hpp"
#include "audio/Mixer.hpp"
#include "audio/MixerWorker.hpp"
#include "audio/SerialMixer.hpp"
#include "audio/Pt2258Mixer.hpp"

// Stream carrying HostLink frames. With USB CDC on boot this is the USB port and
// ESP_LOG output stays on UART0. Any other port is opened at cfg.linkBaud.
#ifndef HOST_LINK_SERIAL
#define HOST_LINK_SERIAL Serial
#endif

// ---------------- Globals ----------------
Preferences prefs;
static KnobConfig g_cfg;
static KnobEngine g_engine;
static Mixer* g_mixer = nullptr;
static bool g_halted = false;          // startup refused; loop only blinks
static const char* kTag = "KNOB";

static uint32_t g_lastStatsMs = 0;
static constexpr uint32_t STATS_INTERVAL_MS = 60000;

static void publish(const VolumeCommand& cmd) {
  MixerWorker::submit(cmd);
  if (cmd.muted) ESP_LOGI(kTag, "Muted (restore to %d)", g_engine.volume().preMuteVolume());
  else           ESP_LOGI(kTag, "Volume %d", cmd.volume);
}

static void halt(const char* why) {
  ESP_LOGE(kTag, "Refusing to start: %s", why);
  Serial.printf("[KNOB] refusing to start: %s\n", why);
  pinMode(PIN_STATUS_LED, OUTPUT);
  g_halted = true;
}

// ESP_LOG and the core's log_x go to UART0
static bool linkOnLogConsole() {
#if ARDUINO_USB_CDC_ON_BOOT
  return static_cast<Stream*>(&HOST_LINK_SERIAL) == static_cast<Stream*>(&Serial0);
#else
  return static_cast<Stream*>(&HOST_LINK_SERIAL) == static_cast<Stream*>(&Serial);
#endif
}

static void startHostLink(const KnobConfig& cfg) {
  if (static_cast<Stream*>(&HOST_LINK_SERIAL) != static_cast<Stream*>(&Serial)) {
    HOST_LINK_SERIAL.begin(cfg.linkBaud);
    ESP_LOGI(kTag, "Host link on its own port at %u baud", (unsigned)cfg.linkBaud);
  }
  if (linkOnLogConsole()) {
    // A log line inside a request would corrupt the frame
    ESP_LOGW(kTag, "Host link shares the log console, logging off");
    Serial.flush();
    HOST_LINK_SERIAL.setDebugOutput(false);
    esp_log_level_set("*", ESP_LOG_NONE);
  }
}

static Mixer* createMixer(const KnobConfig& cfg) {
  switch (cfg.mixerKind) {
    case MixerKind::Pt2258: {
      Pt2258Mixer* m = new Pt2258Mixer();
      // Keep the adapter even if the chip didn't ACK; MixerSync retries on every command
      (void)m->begin(PIN_I2C_SDA, PIN_I2C_SCL);
      return m;
    }
    case MixerKind::HostSerial:
    default:
      startHostLink(cfg);
      return new SerialMixer(HOST_LINK_SERIAL, cfg.mixerControl.c_str(), cfg.mixerTimeoutMs);
  }
}

// ---------------- setup/loop ----------------
void setup() {
  Serial.begin(115200);
  delay(50);
  Serial.println("[KNOB] volume knob " FW_VERSION);

  prefs.begin(NVS_NS, true);
  ConfigStore::load(prefs, g_cfg);
  prefs.end();

  const char* why = nullptr;
  if (!validateConfig(g_cfg, &why)) {
    halt(why);
    return;
  }
  ConfigStore::dump(g_cfg);

  g_mixer = createMixer(g_cfg);

  bool fromMixer = false;
  int initial = initialVolume(*g_mixer, g_cfg, &fromMixer);
  if (fromMixer) {
    ESP_LOGI(kTag, "Initial volume from %s mixer: %d", g_mixer->name(), initial);
  } else {
    ESP_LOGW(kTag, "%s mixer did not report a volume (%s), using %d",
             g_mixer->name(), g_mixer->lastError(), initial);
  }

  if (!EdgeSource::begin(g_cfg)) {
    halt("edge source unavailable");
    return;
  }
  g_engine.begin(g_cfg, initial,
                 EdgeSource::readLevel(EdgeLine::PhaseA),
                 EdgeSource::readLevel(EdgeLine::PhaseB),
                 EdgeSource::readLevel(EdgeLine::Button));
  ESP_LOGI(kTag, "Current volume %d", g_engine.volume().current());

  if (!MixerWorker::begin(g_mixer)) {
    EdgeSource::end();
    halt("mixer worker unavailable");
    return;
  }
  g_lastStatsMs = millis();
}

void loop() {
  if (g_halted) {
    digitalWrite(PIN_STATUS_LED, HIGH); delay(100);
    digitalWrite(PIN_STATUS_LED, LOW);  delay(900);
    return;
  }

  // Wake at least twice per debounce window so a settled press is confirmed on time
  const uint32_t waitMs = g_cfg.debounceMs / 2 ? g_cfg.debounceMs / 2 : 1;

  VolumeCommand cmd;
  EdgeEvent ev;
  if (EdgeSource::receive(ev, waitMs)) {
    if (g_engine.handle(ev, cmd)) publish(cmd);
    // Drain whatever else arrived, still in capture order
    while (EdgeSource::receive(ev, 0)) {
      if (g_engine.handle(ev, cmd)) publish(cmd);
    }
  }
  if (g_engine.tick(millis(), cmd)) publish(cmd);

  uint32_t dropped = EdgeSource::takeDropped();
  if (dropped) ESP_LOGW(kTag, "Edge queue overflow, %u events dropped", (unsigned)dropped);

  uint32_t now = millis();
  if (now - g_lastStatsMs >= STATS_INTERVAL_MS) {
    g_lastStatsMs = now;
    ESP_LOGI(kTag, "detents=%u presses=%u reanchors=%u mixer ok=%u failed=%u",
             (unsigned)g_engine.detents(), (unsigned)g_engine.presses(),
             (unsigned)g_engine.reanchors(),
             (unsigned)MixerWorker::applied(), (unsigned)MixerWorker::failed());
  }
}
