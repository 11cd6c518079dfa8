/**
 * @file log.hpp
 * @brief Level-filtered console logging for Forge instruments.
 * @copyright Copyright (c) 2025 MTA, Inc.
 *
 * LOGD, LOGW, LOGE and LOGC take a printf format string and arguments and
 * print one line tagged with the level. On the RP2350 the output goes to the
 * USB CDC console opened by stdio_init_all(); in host tests it goes to stdout.
 *
 * The build passes `LOG_LEVEL` (the `FORGE_LOG_LEVEL` CMake cache variable,
 * `LOG_LEVEL_WARNING` unless overridden). Calls below that level expand to
 * nothing, so their arguments are not evaluated.
 *
 * | Level      | Used for                                     | Core 1 tick path     |
 * |------------|----------------------------------------------|----------------------|
 * | DEBUG      | handshake and FSM transitions, startup info  | yes, bench use only  |
 * | WARNING    | host mistakes (refused arm, aborted pulse)   | one-shot events only |
 * | ERROR      | FSM faults, failed activation                | one-shot events only |
 * | CRITICAL   | safety system fault records and halts        | no                   |
 *
 * printf can block for as long as the USB host stops draining the console.
 * Anything that runs every tick, such as the scheduler or per-tick counters,
 * must not log at all; Core 0 tasks read counters and report them instead.
 * A debug build (`-DFORGE_LOG_LEVEL=LOG_LEVEL_DEBUG`) prints on every
 * handshake and state change and can cause deadline misses when the console
 * is slow.
 */

#pragma once

#include <cstdio>


#define LOG_LEVEL_DEBUG     0
#define LOG_LEVEL_WARNING   1
#define LOG_LEVEL_ERROR     2
#define LOG_LEVEL_CRITICAL  3

#ifndef LOG_LEVEL
#warning "LOG_LEVEL is not defined, defaulting to LOG_LEVEL_CRITICAL"
#define LOG_LEVEL LOG_LEVEL_CRITICAL
#endif

#define FORGE_LOG_EMIT(tag, fmt, ...) printf("[" tag "] " fmt, ##__VA_ARGS__)

#if LOG_LEVEL <= LOG_LEVEL_DEBUG
#define LOGD(fmt, ...) FORGE_LOG_EMIT("DEBUG", fmt, ##__VA_ARGS__)
#else
#define LOGD(fmt, ...)
#endif

#if LOG_LEVEL <= LOG_LEVEL_WARNING
#define LOGW(fmt, ...) FORGE_LOG_EMIT("WARNING", fmt, ##__VA_ARGS__)
#else
#define LOGW(fmt, ...)
#endif

#if LOG_LEVEL <= LOG_LEVEL_ERROR
#define LOGE(fmt, ...) FORGE_LOG_EMIT("ERROR", fmt, ##__VA_ARGS__)
#else
#define LOGE(fmt, ...)
#endif

#if LOG_LEVEL <= LOG_LEVEL_CRITICAL
#define LOGC(fmt, ...) FORGE_LOG_EMIT("CRITICAL", fmt, ##__VA_ARGS__)
#else
#define LOGC(fmt, ...)
#endif
