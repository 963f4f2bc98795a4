/**
 * @file Version.h
 * @brief ClockGate library version
 */

#pragma once

#define CLOCKGATE_VERSION_MAJOR 1
#define CLOCKGATE_VERSION_MINOR 0
#define CLOCKGATE_VERSION_PATCH 0
#define CLOCKGATE_VERSION_STRING "1.0.0"
