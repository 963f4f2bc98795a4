/**
 * @file Ds1302.cpp
 * @brief Implementation of the DS1302 three-wire protocol engine
 */

#include "ClockGate/Ds1302.h"
#include "ClockGate/CommandTable.h"

namespace ClockGate {

namespace {
constexpr uint8_t kBitsPerByte = 8;

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

uint8_t twoDigits(const char* p) {
  return static_cast<uint8_t>((p[0] - '0') * 10 + (p[1] - '0'));
}
}  // namespace

// ===== Lifecycle Functions =====

Status Ds1302::begin(const Config& config) {
  if (_initialized) {
    end();
  }

  // Validate configuration FIRST - don't touch any pin until validation passes
  if (!config.pinWrite || !config.pinRead || !config.pinMode || !config.delayUs) {
    return Status::Error(Err::INVALID_CONFIG, "GPIO callbacks are null");
  }
  if (config.sclkPin < 0 || config.ioPin < 0 || config.cePin < 0) {
    return Status::Error(Err::INVALID_CONFIG, "SCLK, I/O and CE pins must be set");
  }
  if (config.sclkPin == config.ioPin || config.sclkPin == config.cePin ||
      config.ioPin == config.cePin) {
    return Status::Error(Err::INVALID_CONFIG, "SCLK, I/O and CE pins must differ");
  }
  if (config.guardDelayUs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "Guard delay must be > 0");
  }

  _config = config;

  Status st = _config.pinMode(_config.sclkPin, PinMode::Output, _config.gpioUser);
  if (!st.ok()) return st;
  st = _config.pinMode(_config.cePin, PinMode::Output, _config.gpioUser);
  if (!st.ok()) return st;

  // Idle bus: CE low, SCLK low, I/O driven low
  st = _config.pinWrite(_config.cePin, false, _config.gpioUser);
  if (!st.ok()) return st;
  st = setClock(false);
  if (!st.ok()) return st;
  st = _io.attach(_config);
  if (!st.ok()) return st;
  st = _io.write(false);
  if (!st.ok()) return st;

  if (_config.disableWriteProtectOnBegin) {
    st = writeRegister(cmd::WRITE_CONTROL, cmd::CONTROL_WP_OFF);
    if (!st.ok()) return st;
  }

  _initialized = true;
  return Status::Ok();
}

void Ds1302::end() {
  _initialized = false;
  // No resources to release (pins owned by application)
}

// ===== Register Operations =====

Status Ds1302::disableWriteProtect() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  return writeRegister(cmd::WRITE_CONTROL, cmd::CONTROL_WP_OFF);
}

Status Ds1302::writeField(ClockField field, uint8_t value) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (value >= fieldModulus(field)) {
    return Status::Error(Err::INVALID_TIME, "Clock field value out of range", value);
  }

  const uint8_t bcd = decimalToBcd(value);
  switch (field) {
    case ClockField::Seconds:
      // Clock-halt bit cleared so the oscillator keeps running
      return writeRegister(cmd::WRITE_SECONDS,
                           static_cast<uint8_t>(bcd & cmd::SECONDS_VALUE_MASK));
    case ClockField::Minutes:
      return writeRegister(cmd::WRITE_MINUTES,
                           static_cast<uint8_t>(bcd & cmd::MINUTES_VALUE_MASK));
    case ClockField::Hours:
      // b7 = 0 selects 24-hour mode
      return writeRegister(cmd::WRITE_HOURS,
                           static_cast<uint8_t>(bcd & cmd::HOURS_24H_MASK));
  }
  return Status::Error(Err::INVALID_PARAM, "Unknown clock field");
}

Status Ds1302::setTime(const ClockFields& time) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (!isValidTime(time)) {
    return Status::Error(Err::INVALID_TIME, "Invalid time values");
  }

  Status st = writeRegister(cmd::WRITE_CONTROL, cmd::CONTROL_WP_OFF);
  if (!st.ok()) return st;
  st = writeField(ClockField::Seconds, time.second);
  if (!st.ok()) return st;
  st = writeField(ClockField::Minutes, time.minute);
  if (!st.ok()) return st;
  return writeField(ClockField::Hours, time.hour);
}

Status Ds1302::readTime(ClockFields& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  uint8_t raw[cmd::BURST_TIME_BYTES] = {0};

  Status st = openTransaction();
  if (!st.ok()) return abortTransaction(st);
  st = sendByte(cmd::BURST_READ);
  if (!st.ok()) return abortTransaction(st);

  st = _io.toInput();
  if (!st.ok()) return abortTransaction(st);
  for (uint8_t i = 0; i < cmd::BURST_TIME_BYTES; ++i) {
    st = receiveByte(raw[i]);
    if (!st.ok()) return abortTransaction(st);
  }
  // Consume date, month, day and year so the burst frame completes
  for (uint8_t i = 0; i < cmd::BURST_SKIPPED_BYTES; ++i) {
    uint8_t discarded = 0;
    st = receiveByte(discarded);
    if (!st.ok()) return abortTransaction(st);
  }
  st = _io.toOutput();
  if (!st.ok()) return abortTransaction(st);

  st = closeTransaction();
  if (!st.ok()) return st;

  const uint8_t secReg = static_cast<uint8_t>(raw[0] & cmd::SECONDS_VALUE_MASK);
  const uint8_t minReg = static_cast<uint8_t>(raw[1] & cmd::MINUTES_VALUE_MASK);
  const uint8_t hourReg = static_cast<uint8_t>(raw[2] & cmd::HOURS_24H_MASK);

  if (!isValidBcd(secReg) || !isValidBcd(minReg) || !isValidBcd(hourReg)) {
    // Bus transfer completed but data is corrupt - not a bus fault
    return Status::Error(Err::INVALID_TIME, "RTC returned invalid BCD", raw[0]);
  }

  ClockFields decoded;
  decoded.second = bcdToDecimal(secReg);
  decoded.minute = bcdToDecimal(minReg);
  decoded.hour = bcdToDecimal(hourReg);
  if (!isValidTime(decoded)) {
    return Status::Error(Err::INVALID_TIME, "RTC returned out-of-range time");
  }

  out = decoded;
  return Status::Ok();
}

// ===== Bus Primitives =====

Status Ds1302::openTransaction() {
  // SCLK must be low before CE rises
  Status st = setClock(false);
  if (!st.ok()) return st;
  st = _io.write(false);
  if (!st.ok()) return st;
  st = _config.pinWrite(_config.cePin, true, _config.gpioUser);
  if (!st.ok()) return st;
  guardDelay();
  return Status::Ok();
}

Status Ds1302::closeTransaction() {
  Status st = _config.pinWrite(_config.cePin, false, _config.gpioUser);
  if (!st.ok()) return st;
  guardDelay();
  return Status::Ok();
}

Status Ds1302::abortTransaction(const Status& cause) {
  // Best effort: the frame is already lost, only the idle line state matters.
  // CE low ends the frame on the chip even if I/O cannot be driven again.
  Status cleanup = _io.toOutput();
  (void)cleanup;
  cleanup = closeTransaction();
  (void)cleanup;
  return cause;
}

Status Ds1302::sendByte(uint8_t value) {
  for (uint8_t i = 0; i < kBitsPerByte; ++i) {
    Status st = setClock(false);
    if (!st.ok()) return st;
    st = _io.write(((value >> i) & 0x01) != 0);
    if (!st.ok()) return st;
    guardDelay();
    st = setClock(true);
    if (!st.ok()) return st;
    guardDelay();
  }
  return Status::Ok();
}

Status Ds1302::receiveByte(uint8_t& value) {
  uint8_t acc = 0;
  for (uint8_t i = 0; i < kBitsPerByte; ++i) {
    // Chip shifts the next bit out on the falling edge
    Status st = setClock(false);
    if (!st.ok()) return st;
    guardDelay();
    bool bit = false;
    st = _io.read(bit);
    if (!st.ok()) return st;
    if (bit) {
      acc = static_cast<uint8_t>(acc | (1u << i));
    }
    st = setClock(true);
    if (!st.ok()) return st;
    guardDelay();
  }
  value = acc;
  return Status::Ok();
}

Status Ds1302::setClock(bool high) {
  return _config.pinWrite(_config.sclkPin, high, _config.gpioUser);
}

Status Ds1302::writeRegister(uint8_t command, uint8_t value) {
  Status st = openTransaction();
  if (!st.ok()) return abortTransaction(st);
  st = sendByte(command);
  if (!st.ok()) return abortTransaction(st);
  st = sendByte(value);
  if (!st.ok()) return abortTransaction(st);
  return closeTransaction();
}

void Ds1302::guardDelay() {
  _config.delayUs(_config.guardDelayUs, _config.gpioUser);
}

// ===== Conversion Helper Functions =====

uint8_t Ds1302::bcdToDecimal(uint8_t bcd) {
  return static_cast<uint8_t>((bcd >> 4) * 10 + (bcd & 0x0F));
}

uint8_t Ds1302::decimalToBcd(uint8_t dec) {
  return static_cast<uint8_t>(((dec / 10) << 4) | (dec % 10));
}

bool Ds1302::isValidBcd(uint8_t v) {
  const uint8_t low = static_cast<uint8_t>(v & 0x0F);
  const uint8_t high = static_cast<uint8_t>((v >> 4) & 0x0F);
  return (low <= 9) && (high <= 9);
}

uint8_t Ds1302::fieldModulus(ClockField field) {
  return field == ClockField::Hours ? 24 : 60;
}

bool Ds1302::isValidTime(const ClockFields& time) {
  return time.hour < 24 && time.minute < 60 && time.second < 60;
}

bool Ds1302::parseTimeString(const char* text, ClockFields& out) {
  if (text == nullptr) {
    return false;
  }
  // "HH:MM:SS"
  for (uint8_t i = 0; i < 8; ++i) {
    const char c = text[i];
    if (c == '\0') {
      return false;
    }
    const bool colon = (i == 2 || i == 5);
    if (colon ? (c != ':') : !isDigit(c)) {
      return false;
    }
  }
  if (text[8] != '\0') {
    return false;
  }

  ClockFields parsed;
  parsed.hour = twoDigits(text);
  parsed.minute = twoDigits(text + 3);
  parsed.second = twoDigits(text + 6);
  if (!isValidTime(parsed)) {
    return false;
  }
  out = parsed;
  return true;
}

bool Ds1302::parseBuildTime(ClockFields& out) {
  return parseTimeString(__TIME__, out);
}

}  // namespace ClockGate
