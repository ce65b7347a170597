// src/common/logger.hpp
// Process-wide logging that is safe to call from the audio thread.
//
// Messages are formatted into a fixed-size slot and pushed onto a lock-free
// rtlog queue; a background thread drains the queue and hands each message
// to the registered sinks. The sink list starts with one that prints to
// stderr:
//   [keyfall #12 (W)]: Track 3: undefined status byte ...
// It drops Diagnostic messages. clear_sinks() removes it like any other
// sink; add_stderr_sink() puts it back.
//
// Usage:
//   logging::warning("Dropped %llu events", n);
//   logging::add_sink([](logging::Level l, std::size_t serial, const char *m) {
//     ...
//   });

#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>

namespace logging {

enum class Level { Error, Warning, Info, Diagnostic };

using Sink =
    std::function<void(Level level, std::size_t serial, const char *message)>;

void error(const char *format, ...);
void warning(const char *format, ...);
void info(const char *format, ...);
void diagnostic(const char *format, ...);

// Sinks run on the log processing thread (or inside flush()).
void add_sink(Sink sink);
void add_stderr_sink();
void clear_sinks();

// Drain everything queued so far on the calling thread.
void flush();

// Messages lost because the queue was full.
std::uint64_t dropped_messages();

const char *level_name(Level level);

} // namespace logging
