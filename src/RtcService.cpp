/**
 * @file RtcService.cpp
 * @brief RTC actor task
 */

#include "ClockGate/RtcService.h"

#include <esp_log.h>

namespace ClockGate {

namespace {
constexpr char kTag[] = "rtc_service";
}  // namespace

Status RtcService::begin(RtcClock& clock, const RtcServiceConfig& config) {
  if (_task != nullptr) {
    return Status::Ok();
  }
  if (config.mailboxDepth == 0 || config.stackWords == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Mailbox depth and stack must be > 0");
  }

  Status st = _mailbox.create(config.mailboxDepth, sizeof(RtcServer::Envelope));
  if (!st.ok()) return st;
  st = _server.begin(clock, _mailbox);
  if (!st.ok()) return st;

  BaseType_t created = xTaskCreate(taskEntry, "rtc_service", config.stackWords, this,
                                   config.priority, &_task);
  if (created != pdPASS) {
    _task = nullptr;
    return Status::Error(Err::RESOURCE_ERROR, "RTC service task creation failed");
  }
  return Status::Ok();
}

Status RtcService::read(ClockFields& out) {
  RtcRequest request;
  request.op = RtcOp::Read;
  return call(request, out);
}

Status RtcService::increment(ClockField field, ClockFields& out) {
  RtcRequest request;
  request.op = RtcOp::Increment;
  request.field = field;
  return call(request, out);
}

Status RtcService::setTime(const ClockFields& time) {
  RtcRequest request;
  request.op = RtcOp::SetTime;
  request.time = time;
  ClockFields ignored;
  return call(request, ignored);
}

Status RtcService::incrementField(ClockField field, ClockFields& out, void* user) {
  RtcService* service = static_cast<RtcService*>(user);
  if (service == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "RtcService instance is null");
  }
  return service->increment(field, out);
}

Status RtcService::call(const RtcRequest& request, ClockFields& out) {
  if (_task == nullptr) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  TaskNotifyCompletion done;
  return _server.call(request, out, done);
}

void RtcService::run() {
  bool faultLogged = false;
  for (;;) {
    if (!_server.serveOne(kWaitForever)) {
      continue;
    }
    const Status& fault = _server.fault();
    if (!fault.ok() && !faultLogged) {
      faultLogged = true;
      ESP_LOGE(kTag, "RTC bus fault: %s (%s, detail=%ld), bus frozen", fault.msg,
               errToStr(fault.code), static_cast<long>(fault.detail));
    }
  }
}

void RtcService::taskEntry(void* arg) {
  static_cast<RtcService*>(arg)->run();
}

}  // namespace ClockGate
