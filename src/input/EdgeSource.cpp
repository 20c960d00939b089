#include "EdgeSource.hpp"
#include <esp_log.h>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

namespace {
  constexpr UBaseType_t QUEUE_DEPTH = 64;   // ~16 detents of headroom
  const char* kTag = "KNOB-EDGE";

  QueueHandle_t g_queue = nullptr;
  int g_pin[3] = {-1, -1, -1};              // indexed by EdgeLine
  volatile uint32_t g_dropped = 0;

  void IRAM_ATTR push(EdgeLine line) {
    EdgeEvent ev;
    ev.line = line;
    ev.level = (digitalRead(g_pin[(int)line]) == HIGH);
    ev.timestampMs = millis();
    BaseType_t woken = pdFALSE;
    if (xQueueSendFromISR(g_queue, &ev, &woken) != pdTRUE) {
      g_dropped = g_dropped + 1;
    }
    if (woken == pdTRUE) portYIELD_FROM_ISR();
  }

  void IRAM_ATTR isrA()      { push(EdgeLine::PhaseA); }
  void IRAM_ATTR isrB()      { push(EdgeLine::PhaseB); }
  void IRAM_ATTR isrButton() { push(EdgeLine::Button); }
}

namespace EdgeSource {

bool begin(const KnobConfig& cfg) {
  if (g_queue) return true;

  g_queue = xQueueCreate(QUEUE_DEPTH, sizeof(EdgeEvent));
  if (!g_queue) {
    ESP_LOGE(kTag, "Failed to create edge queue");
    return false;
  }

  g_pin[(int)EdgeLine::PhaseA] = cfg.pinA;
  g_pin[(int)EdgeLine::PhaseB] = cfg.pinB;
  g_pin[(int)EdgeLine::Button] = cfg.pinButton;

  pinMode(cfg.pinA, INPUT_PULLUP);
  pinMode(cfg.pinB, INPUT_PULLUP);
  // Both edges: full-cycle decoding needs every phase change
  attachInterrupt(digitalPinToInterrupt(cfg.pinA), isrA, CHANGE);
  attachInterrupt(digitalPinToInterrupt(cfg.pinB), isrB, CHANGE);

  if (cfg.hasButton()) {
    pinMode(cfg.pinButton, cfg.buttonActiveLow ? INPUT_PULLUP : INPUT_PULLDOWN);
    // Release edges are needed too, otherwise the debounce window never re-arms
    attachInterrupt(digitalPinToInterrupt(cfg.pinButton), isrButton, CHANGE);
  }

  ESP_LOGI(kTag, "Edge interrupts attached (queue depth %u)", (unsigned)QUEUE_DEPTH);
  return true;
}

void end() {
  for (int i = 0; i < 3; ++i) {
    if (g_pin[i] >= 0) detachInterrupt(digitalPinToInterrupt(g_pin[i]));
    g_pin[i] = -1;
  }
  if (g_queue) {
    vQueueDelete(g_queue);
    g_queue = nullptr;
  }
}

bool receive(EdgeEvent& ev, uint32_t waitMs) {
  if (!g_queue) return false;
  return xQueueReceive(g_queue, &ev, pdMS_TO_TICKS(waitMs)) == pdTRUE;
}

bool readLevel(EdgeLine line) {
  int pin = g_pin[(int)line];
  if (pin < 0) return false;
  return digitalRead(pin) == HIGH;
}

uint32_t takeDropped() {
  noInterrupts();
  uint32_t d = g_dropped;
  g_dropped = 0;
  interrupts();
  return d;
}

} // namespace EdgeSource
