#include "MixerWorker.hpp"
#include <Arduino.h>
#include <esp_log.h>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

#include "audio/MixerSync.hpp"

namespace {
  constexpr uint32_t TASK_STACK = 4096;
  constexpr UBaseType_t TASK_PRIO = 1;   // same as loopTask; time-sliced, sleeps on the mailbox and in delay()
  const char* kTag = "KNOB-MIXER";

  Mixer*        g_mixer = nullptr;
  QueueHandle_t g_mailbox = nullptr;
  TaskHandle_t  g_task = nullptr;
  MixerSync     g_sync;
  volatile uint32_t g_applied = 0;
  volatile uint32_t g_failed = 0;

  void workerTask(void* arg) {
    (void)arg;
    VolumeCommand cmd;
    while (true) {
      if (xQueueReceive(g_mailbox, &cmd, portMAX_DELAY) != pdTRUE) continue;

      uint32_t t0 = millis();
      if (g_sync.apply(*g_mixer, cmd)) {
        g_applied = g_applied + 1;
        ESP_LOGD(kTag, "Applied volume=%d muted=%d (%u ms)",
                 cmd.volume, cmd.muted ? 1 : 0, (unsigned)(millis() - t0));
      } else {
        // Local state stays as is; the next command re-sends whatever is unknown
        g_failed = g_failed + 1;
        const char* why = g_mixer->lastError();
        ESP_LOGW(kTag, "%s mixer failed volume=%d muted=%d: %s (failures=%u)",
                 g_mixer->name(), cmd.volume, cmd.muted ? 1 : 0,
                 why[0] ? why : "no detail", (unsigned)g_sync.failures());
      }
    }
  }
}

namespace MixerWorker {

bool begin(Mixer* mixer) {
  if (g_task) return true;
  if (!mixer) return false;
  g_mixer = mixer;

  g_mailbox = xQueueCreate(1, sizeof(VolumeCommand));
  if (!g_mailbox) {
    ESP_LOGE(kTag, "Failed to create mixer mailbox");
    return false;
  }
  if (xTaskCreate(workerTask, "mixer", TASK_STACK, nullptr, TASK_PRIO, &g_task) != pdPASS) {
    ESP_LOGE(kTag, "Failed to start mixer task");
    vQueueDelete(g_mailbox);
    g_mailbox = nullptr;
    g_task = nullptr;
    return false;
  }
  ESP_LOGI(kTag, "Mixer worker started (%s)", mixer->name());
  return true;
}

void submit(const VolumeCommand& cmd) {
  if (!g_mailbox) return;
  xQueueOverwrite(g_mailbox, &cmd);
}

uint32_t applied() { return g_applied; }
uint32_t failed()  { return g_failed; }

} // namespace MixerWorker
