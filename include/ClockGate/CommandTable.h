/**
 * @file CommandTable.h
 * @brief DS1302 command bytes, register masks and bus timing constants.
 *
 * Every transaction starts with one command byte, sent least-significant bit
 * first:
 *   b7 = 1 (must be set), b6 = RAM/CK (0 = clock registers),
 *   b5-b1 = register address, b0 = RD/W (1 = read).
 *
 * @note Register values are BCD unless noted.
 */

#pragma once

#include <stdint.h>

namespace ClockGate {

namespace cmd {

// ========== Clock Register Commands (write) ==========

/// @brief Write seconds register (address 0)
/// BCD: b7=CH (clock halt), b6-b4 = 10 seconds, b3-b0 = seconds (0–59)
static constexpr uint8_t WRITE_SECONDS = 0x80;

/// @brief Write minutes register (address 1)
/// BCD: b7=0, b6-b4 = 10 minutes, b3-b0 = minutes (0–59)
static constexpr uint8_t WRITE_MINUTES = 0x82;

/// @brief Write hours register (address 2)
/// BCD: b7=12/24 (0 = 24 hour), b5-b4 = 10 hours, b3-b0 = hours (0–23)
static constexpr uint8_t WRITE_HOURS = 0x84;

/// @brief Write control register (address 7)
/// b7=WP (write protect), b6-b0 always 0
static constexpr uint8_t WRITE_CONTROL = 0x8E;

// ========== Burst Commands ==========

/// @brief Clock burst read (address 31, read)
/// Streams seconds, minutes, hours, date, month, day, year, control in order.
static constexpr uint8_t BURST_READ = 0xBF;

/// @brief Number of bytes kept from a clock burst (seconds, minutes, hours)
static constexpr uint8_t BURST_TIME_BYTES = 3;

/// @brief Date, month, day and year bytes clocked out and discarded
static constexpr uint8_t BURST_SKIPPED_BYTES = 4;

// ========== Control Register Values ==========

/// @brief Control register value with write protection cleared
static constexpr uint8_t CONTROL_WP_OFF = 0x00;

/// @brief Write-protect bit in the control register
static constexpr uint8_t CONTROL_WP_BIT = 7;

// ========== Register Masks ==========

/// @brief Clock-halt flag (seconds b7). Cleared on every seconds write.
static constexpr uint8_t SECONDS_CH_MASK = 0x80;

/// @brief Seconds value bits (b6-b0)
static constexpr uint8_t SECONDS_VALUE_MASK = 0x7F;

/// @brief Minutes value bits (b6-b0)
static constexpr uint8_t MINUTES_VALUE_MASK = 0x7F;

/// @brief Hours value bits in 24-hour mode (b5-b0); b7=0 selects 24-hour mode
static constexpr uint8_t HOURS_24H_MASK = 0x3F;

// ========== Command Byte Fields ==========

/// @brief RD/W bit: set for read commands
static constexpr uint8_t CMD_READ_BIT = 0x01;

/// @brief Mandatory b7 of every command byte
static constexpr uint8_t CMD_VALID_BIT = 0x80;

/// @brief Register address field (b5-b1)
static constexpr uint8_t CMD_ADDRESS_MASK = 0x3E;

// ========== Timing ==========

/// @brief Default hold time per clock half-cycle in microseconds
static constexpr uint32_t DEFAULT_GUARD_DELAY_US = 1;

}  // namespace cmd

}  // namespace ClockGate
