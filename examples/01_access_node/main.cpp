/**
 * @file main.cpp
 * @brief Access-control node firmware
 *
 * Wires the ClockGate runtime to an ESP32 board:
 * - DS1302 RTC on three GPIOs (bit-banged)
 * - Push button (polling, or CHANGE interrupt with CLOCKGATE_BUTTON_EDGE)
 * - AM2302 temperature/humidity sensor and a digital light sensor
 * - Three indicator LEDs; display text goes to Serial
 *
 * Build with CLOCKGATE_SET_TIME_ON_BOOT to seed the RTC from the build time.
 */

#include <Arduino.h>
#include <AM2302-Sensor.h>

#include "examples/common/BoardPins.h"
#include "examples/common/ClimateSensor.h"
#include "examples/common/GpioTransport.h"
#include "examples/common/Log.h"
#include "ClockGate/Node.h"
#include "ClockGate/Version.h"

static ClockGate::Node g_node;
static AM2302::AM2302_Sensor g_am2302{pins::AM2302};

static volatile bool g_halted = false;
static const char* volatile g_haltWorker = "";

#if defined(CLOCKGATE_BUTTON_EDGE)
static void IRAM_ATTR onButtonChange() {
  // Active low: capture level and time here so quick presses survive
  g_node.onButtonEdgeFromIsr(digitalRead(pins::BUTTON) == LOW, millis());
}
#endif

/**
 * @brief Blink the on-board LED forever. Never returns.
 */
[[noreturn]] static void haltBlink() {
  if (pins::LED >= 0) {
    pinMode(pins::LED, OUTPUT);
  }
  for (;;) {
    if (pins::LED >= 0) {
      digitalWrite(pins::LED, HIGH);
    }
    delay(150);
    if (pins::LED >= 0) {
      digitalWrite(pins::LED, LOW);
    }
    delay(150);
  }
}

static void onFatal(const char* worker, const ClockGate::Status& st, void* user) {
  (void)user;
  LOGE("FATAL in %s: %s (code=%s, detail=%ld)", worker, st.msg, ClockGate::errToStr(st.code),
       static_cast<long>(st.detail));
  g_haltWorker = worker;
  g_halted = true;
}

static void showText(const char* text, void* user) {
  (void)user;
  LOGI("Display: " LOG_COLOR_CYAN "%s" LOG_COLOR_RESET, text);
}

static ClockGate::NodeConfig makeConfig() {
  ClockGate::NodeConfig cfg;

  cfg.rtc.pinWrite = transport::gpioWrite;
  cfg.rtc.pinRead = transport::gpioRead;
  cfg.rtc.pinMode = transport::gpioMode;
  cfg.rtc.delayUs = transport::delayUs;
  cfg.rtc.sclkPin = pins::RTC_SCLK;
  cfg.rtc.ioPin = pins::RTC_IO;
  cfg.rtc.cePin = pins::RTC_CE;

  cfg.button.pinRead = transport::gpioRead;
  cfg.button.pinMode = transport::gpioMode;
  cfg.button.pin = pins::BUTTON;
  cfg.button.nowMs = transport::nowMs;
  cfg.button.delayMs = transport::delayMs;

  cfg.sampler.readClimate = climate::readAm2302;
  cfg.sampler.climateUser = &g_am2302;
  cfg.sampler.pinRead = transport::gpioRead;
  cfg.sampler.lightPin = pins::LIGHT;

  cfg.runtime.pinWrite = transport::gpioWrite;
  cfg.runtime.pinMode = transport::gpioMode;
  cfg.runtime.accessLedPin = pins::LED_ACCESS;
  cfg.runtime.eligibleLedPin = pins::LED_ELIGIBLE;
  cfg.runtime.lockedLedPin = pins::LED_LOCKED;
  cfg.runtime.display = showText;
  cfg.runtime.onFatal = onFatal;

#if defined(CLOCKGATE_BUTTON_EDGE)
  cfg.runtime.buttonStrategy = ClockGate::ButtonStrategy::EdgeInterrupt;
#endif

#if defined(CLOCKGATE_SET_TIME_ON_BOOT)
  if (ClockGate::Ds1302::parseBuildTime(cfg.runtime.bootTime)) {
    cfg.runtime.setTimeOnBoot = true;
  } else {
    LOGW("Build time not parseable, RTC left as is");
  }
#endif

  return cfg;
}

void setup() {
  delay(1000);  // USB-CDC enumeration delay
  Serial.begin(115200);
  while (!Serial && millis() < 4000) {
    delay(10);
  }

  LOGI("ClockGate %s", CLOCKGATE_VERSION_STRING);

  g_am2302.begin();

  const ClockGate::NodeConfig cfg = makeConfig();
  LOGI("Starting node (RTC SCLK=%d IO=%d CE=%d, button=%d)...", pins::RTC_SCLK, pins::RTC_IO,
       pins::RTC_CE, pins::BUTTON);
  ClockGate::Status st = g_node.begin(cfg);
  if (!st.ok()) {
    LOGE("Node start failed: %s (code=%s, detail=%ld)", st.msg, ClockGate::errToStr(st.code),
         static_cast<long>(st.detail));
    LOGE("Check RTC wiring and power");
    haltBlink();
  }

#if defined(CLOCKGATE_BUTTON_EDGE)
  attachInterrupt(digitalPinToInterrupt(pins::BUTTON), onButtonChange, CHANGE);
#endif

  LOGI("Node running. Long press: set clock, double press on odd minute: access");
}

void loop() {
  if (g_halted) {
    LOGE("Halted after fatal error in %s", g_haltWorker);
    haltBlink();
  }

#if defined(CLOCKGATE_BUTTON_EDGE)
  static uint32_t lastReport = 0;
  if (millis() - lastReport >= 60000U) {
    lastReport = millis();
    if (g_node.lostButtonEdges() != 0) {
      LOGW("Button edges lost: %lu", static_cast<unsigned long>(g_node.lostButtonEdges()));
    }
  }
#endif
  delay(100);
}
