/**
 * @file Node.cpp
 * @brief Worker tasks of the access-control node
 */

#include "ClockGate/Node.h"

#include <esp_log.h>

namespace ClockGate {

namespace {
constexpr char kTag[] = "node";

constexpr char kRtcPollerName[] = "rtc_poller";
constexpr char kButtonName[] = "button";
constexpr char kSamplerName[] = "sampler";
constexpr char kAggregatorName[] = "aggregator";

TickType_t msToTicksAtLeastOne(uint32_t ms) {
  TickType_t ticks = pdMS_TO_TICKS(ms);
  return ticks == 0 ? 1 : ticks;
}

// ===== Aggregator report hooks =====

void logEligibility(bool eligible, const ClockFields& at, void*) {
  ESP_LOGI(kTag, "Eligibility %s at %02u:%02u", eligible ? "on" : "off", at.hour, at.minute);
}

void logOutcome(const GestureEvent& gesture, Outcome outcome, const AccessController& access,
                void*) {
  if (outcome == Outcome::FieldIncremented) {
    const ClockFields& t = access.lastTime();
    ESP_LOGI(kTag, "%s: %s -> %02u:%02u:%02u", setupModeToStr(access.setupMode()),
             outcomeToStr(outcome), t.hour, t.minute, t.second);
  } else {
    ESP_LOGI(kTag, "%s: %s (setup=%s, access=%s)", gestureToStr(gesture.gesture),
             outcomeToStr(outcome), setupModeToStr(access.setupMode()),
             accessModeToStr(access.accessMode()));
  }
}

void logGestureError(const GestureEvent& gesture, const Status& status, void*) {
  ESP_LOGW(kTag, "%s ignored: %s", gestureToStr(gesture.gesture), status.msg);
}
}  // namespace

// ===== Lifecycle =====

Status Node::validate(const NodeConfig& config) const {
  const RuntimeConfig& rt = config.runtime;
  if (rt.rtcPollMs == 0 || rt.aggregatorPeriodMs == 0 || config.sampler.intervalMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Cadences must be > 0");
  }
  if (rt.tickDepth == 0 || rt.gestureDepth == 0 || rt.sampleDepth == 0 || rt.edgeDepth == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Queue depths must be > 0");
  }
  if (rt.stackWords == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Worker stack must be > 0");
  }
  if (rt.buttonStrategy == ButtonStrategy::EdgeInterrupt &&
      (!config.button.nowMs || config.button.pin < 0)) {
    return Status::Error(Err::INVALID_CONFIG, "Edge strategy needs nowMs and pin");
  }
  if (rt.setTimeOnBoot && !Ds1302::isValidTime(rt.bootTime)) {
    return Status::Error(Err::INVALID_TIME, "Boot time out of range");
  }
  return Status::Ok();
}

Status Node::begin(const NodeConfig& config) {
  if (_started) {
    return Status::Ok();
  }

  Status st = validate(config);
  if (!st.ok()) return st;
  _config = config;
  const RuntimeConfig& rt = _config.runtime;

  // Clock first: the actor takes ownership once started
  st = _clock.begin(_config.rtc);
  if (!st.ok()) return st;
  st = _rtc.begin(_clock, rt.rtcService);
  if (!st.ok()) return st;

  if (rt.setTimeOnBoot) {
    st = _rtc.setTime(rt.bootTime);
    if (!st.ok()) return st;
    ESP_LOGI(kTag, "Clock set to %02u:%02u:%02u", rt.bootTime.hour, rt.bootTime.minute,
             rt.bootTime.second);
  }

  st = startChannels();
  if (!st.ok()) return st;

  if (rt.buttonStrategy == ButtonStrategy::Polling) {
    st = _button.begin(_config.button);
  } else {
    st = _edgeReader.begin(_config.button, _edgeQueue);
    if (st.ok() && _config.button.pinMode) {
      st = _config.button.pinMode(_config.button.pin, PinMode::InputPullup,
                                  _config.button.gpioUser);
    }
  }
  if (!st.ok()) return st;

  st = _sampler.begin(_config.sampler);
  if (!st.ok()) return st;

  AccessConfig access;
  access.incrementField = RtcService::incrementField;
  access.clockUser = &_rtc;
  st = _access.begin(access);
  if (!st.ok()) return st;

  AggregatorConfig outputs;
  outputs.pinWrite = rt.pinWrite;
  outputs.pinMode = rt.pinMode;
  outputs.gpioUser = rt.gpioUser;
  outputs.accessLedPin = rt.accessLedPin;
  outputs.eligibleLedPin = rt.eligibleLedPin;
  outputs.lockedLedPin = rt.lockedLedPin;
  outputs.display = rt.display;
  outputs.displayUser = rt.displayUser;
  outputs.onEligibility = logEligibility;
  outputs.onOutcome = logOutcome;
  outputs.onGestureError = logGestureError;
  st = _aggregator.begin(_access, _ticks, _gestures, _samples, outputs);
  if (!st.ok()) return st;

  st = startTask(rtcPollerEntry, kRtcPollerName);
  if (!st.ok()) return st;
  st = startTask(buttonEntry, kButtonName);
  if (!st.ok()) return st;
  st = startTask(samplerEntry, kSamplerName);
  if (!st.ok()) return st;
  st = startTask(aggregatorEntry, kAggregatorName);
  if (!st.ok()) return st;

  _started = true;
  ESP_LOGI(kTag, "Node started (%s button)",
           rt.buttonStrategy == ButtonStrategy::Polling ? "polling" : "edge");
  return Status::Ok();
}

Status Node::startChannels() {
  const RuntimeConfig& rt = _config.runtime;
  Status st = _tickQueue.create(rt.tickDepth, sizeof(TickEvent));
  if (!st.ok()) return st;
  st = _gestureQueue.create(rt.gestureDepth, sizeof(GestureEvent));
  if (!st.ok()) return st;
  st = _sampleQueue.create(rt.sampleDepth, sizeof(SensorSample));
  if (!st.ok()) return st;
  if (rt.buttonStrategy == ButtonStrategy::EdgeInterrupt) {
    st = _edgeQueue.create(rt.edgeDepth, sizeof(ButtonEdge));
    if (!st.ok()) return st;
  }

  st = _ticks.begin(_tickQueue, rt.channelSendWaitMs);
  if (!st.ok()) return st;
  st = _gestures.begin(_gestureQueue, rt.channelSendWaitMs);
  if (!st.ok()) return st;
  return _samples.begin(_sampleQueue, rt.channelSendWaitMs);
}

void Node::onButtonEdgeFromIsr(bool pressed, uint32_t atMs) {
  ButtonEdge edge;
  edge.pressed = pressed;
  edge.atMs = atMs;
  BaseType_t woken = pdFALSE;
  if (!_edgeQueue.sendFromIsr(&edge, &woken)) {
    _lostEdges = _lostEdges + 1;
  }
  portYIELD_FROM_ISR(woken);
}

Status Node::startTask(TaskFunction_t entry, const char* name) {
  BaseType_t created = xTaskCreate(entry, name, _config.runtime.stackWords, this,
                                   _config.runtime.workerPriority, nullptr);
  if (created != pdPASS) {
    return Status::Error(Err::RESOURCE_ERROR, "Worker task creation failed");
  }
  return Status::Ok();
}

void Node::fatal(const char* worker, const Status& status) {
  ESP_LOGE(kTag, "%s stopped: %s (%s, detail=%ld)", worker, status.msg, errToStr(status.code),
           static_cast<long>(status.detail));
  if (_config.runtime.onFatal) {
    _config.runtime.onFatal(worker, status, _config.runtime.fatalUser);
  }
  vTaskDelete(nullptr);
}

// ===== RTC Poller =====

void Node::rtcPollerEntry(void* arg) {
  static_cast<Node*>(arg)->runRtcPoller();
}

void Node::runRtcPoller() {
  const TickType_t period = msToTicksAtLeastOne(_config.runtime.rtcPollMs);
  TickType_t lastWake = xTaskGetTickCount();
  for (;;) {
    vTaskDelayUntil(&lastWake, period);

    TickEvent tick;
    Status st = _rtc.read(tick.time);
    if (st.isBusFault()) {
      fatal(kRtcPollerName, st);
      return;
    }
    if (!st.ok()) {
      // Corrupt BCD or similar: skip this tick
      ESP_LOGW(kTag, "RTC read skipped: %s", st.msg);
      continue;
    }

    ESP_LOGD(kTag, "Time: %02u:%02u:%02u", tick.time.hour, tick.time.minute, tick.time.second);
    st = _ticks.send(tick);
    if (!st.ok()) {
      fatal(kRtcPollerName, st);
      return;
    }
  }
}

// ===== Button =====

void Node::buttonEntry(void* arg) {
  static_cast<Node*>(arg)->runButton();
}

void Node::runButton() {
  const bool polling = _config.runtime.buttonStrategy == ButtonStrategy::Polling;
  for (;;) {
    GestureEvent event;
    Status st = polling ? _button.waitForGesture(event) : _edgeReader.waitForGesture(event);
    if (!st.ok()) {
      fatal(kButtonName, st);
      return;
    }

    ESP_LOGD(kTag, "Gesture %s (%lu ms)", gestureToStr(event.gesture),
             static_cast<unsigned long>(event.durationMs));
    st = _gestures.send(event);
    if (!st.ok()) {
      fatal(kButtonName, st);
      return;
    }
  }
}

// ===== Sensor Sampler =====

void Node::samplerEntry(void* arg) {
  static_cast<Node*>(arg)->runSampler();
}

void Node::runSampler() {
  const TickType_t period = msToTicksAtLeastOne(_config.sampler.intervalMs);
  TickType_t lastWake = xTaskGetTickCount();
  uint32_t reportedFailures = 0;
  for (;;) {
    vTaskDelayUntil(&lastWake, period);

    SensorSample batch[kMaxSamplesPerCycle];
    size_t count = 0;
    Status st = _sampler.sample(batch, kMaxSamplesPerCycle, count);

    for (size_t i = 0; i < count; ++i) {
      Status sent = _samples.send(batch[i]);
      if (!sent.ok()) {
        fatal(kSamplerName, sent);
        return;
      }
    }

    if (_sampler.climateFailures() != reportedFailures) {
      reportedFailures = _sampler.climateFailures();
      ESP_LOGW(kTag, "Climate read failed: %s (%lu failures)", _sampler.lastClimateStatus().msg,
               static_cast<unsigned long>(reportedFailures));
    }

    if (st.isBusFault()) {
      fatal(kSamplerName, st);
      return;
    }
    if (!st.ok()) {
      ESP_LOGW(kTag, "Light read failed: %s", st.msg);
    }
  }
}

// ===== Aggregator =====

void Node::aggregatorEntry(void* arg) {
  static_cast<Node*>(arg)->runAggregator();
}

void Node::runAggregator() {
  const TickType_t period = msToTicksAtLeastOne(_config.runtime.aggregatorPeriodMs);
  TickType_t lastWake = xTaskGetTickCount();
  for (;;) {
    vTaskDelayUntil(&lastWake, period);

    Status st = _aggregator.runCycle();
    if (!st.ok()) {
      fatal(kAggregatorName, st);
      return;
    }
  }
}

}  // namespace ClockGate
