#pragma once
#include <Preferences.h>

extern Preferences prefs;

static constexpr const char* NVS_NS           = "volknob";
static constexpr const char* KEY_PIN_A        = "pin_a";
static constexpr const char* KEY_PIN_B        = "pin_b";
// -1 disables button handling
static constexpr const char* KEY_PIN_BTN      = "pin_btn";
static constexpr const char* KEY_BTN_ACT_LOW  = "btn_low";
static constexpr const char* KEY_VOL_MIN      = "vol_min";
static constexpr const char* KEY_VOL_MAX      = "vol_max";
static constexpr const char* KEY_VOL_STEP     = "vol_step";
static constexpr const char* KEY_VOL_DEFAULT  = "vol_def";
static constexpr const char* KEY_DEBOUNCE_MS  = "debounce";
static constexpr const char* KEY_REVERSED     = "reversed";
// "serial" or "pt2258"
static constexpr const char* KEY_MIXER        = "mixer";
static constexpr const char* KEY_MIXER_TO_MS  = "mixer_to";
// Host mixer control name, e.g. "Master" or "PCM"
static constexpr const char* KEY_MIXER_CTRL   = "mixer_ctl";
// Only used when the host link is on a UART (HOST_LINK_SERIAL overridden)
static constexpr const char* KEY_LINK_BAUD    = "link_baud";

#ifndef FW_VERSION
#define FW_VERSION "unknown"
#endif
