// File Overview: Default ESP32-S3 pin map for the volume knob. Every encoder/button pin
// can be overridden from NVS (see prefs.hpp); these are the factory values.
#pragma once

// ======================= Rotary Encoder =======================
#define PIN_ENC_A       2
#define PIN_ENC_B       1
#define PIN_ENC_BTN     44   // push switch, active LOW with internal pull-up

// ======================= I²C Bus (PT2258 volume IC) =======================
// GPIO47/48 cannot actively pull low on many modules; GPIO8/9 are the alternate.
#ifdef I2C_ALT_PINS
#  define PIN_I2C_SDA   8
#  define PIN_I2C_SCL   9
#else
#  define PIN_I2C_SDA   47
#  define PIN_I2C_SCL   48
#endif

// ======================= Status LED =======================
// Blinks when startup is refused (bad configuration).
#define PIN_STATUS_LED  21
