/**
 * @file RtcServer.cpp
 * @brief Mailbox serialization of RTC requests
 */

#include "ClockGate/RtcServer.h"

namespace ClockGate {

Status RtcServer::begin(RtcClock& clock, Queue& mailbox) {
  if (!clock.isInitialized()) {
    return Status::Error(Err::NOT_INITIALIZED, "RtcClock not started");
  }
  if (mailbox.itemSize() != sizeof(Envelope)) {
    return Status::Error(Err::INVALID_CONFIG, "Mailbox item size does not match envelope",
                         static_cast<int32_t>(mailbox.itemSize()));
  }
  _clock = &clock;
  _mailbox = &mailbox;
  _fault = Status::Ok();
  return Status::Ok();
}

Status RtcServer::call(const RtcRequest& request, ClockFields& out, Completion& done) {
  if (_mailbox == nullptr) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  Status result = Status::Ok();
  Envelope envelope;
  envelope.request = request;
  envelope.out = &out;
  envelope.result = &result;
  envelope.done = &done;

  Status st = _mailbox->send(&envelope, kWaitForever);
  if (!st.ok()) {
    return st;
  }
  // The server writes result before signalling
  done.wait();
  return result;
}

bool RtcServer::serveOne(uint32_t timeoutMs) {
  if (_mailbox == nullptr) {
    return false;
  }
  Envelope envelope;
  if (!_mailbox->receive(&envelope, timeoutMs)) {
    return false;
  }

  if (!_fault.ok()) {
    *envelope.result = _fault;
  } else {
    *envelope.result = _clock->execute(envelope.request, *envelope.out);
    if (envelope.result->isBusFault()) {
      _fault = *envelope.result;
    }
  }
  envelope.done->signal();
  return true;
}

}  // namespace ClockGate
