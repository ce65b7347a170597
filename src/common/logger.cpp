// src/common/logger.cpp
// rtlog-backed implementation of the process-wide logger.

#include "common/logger.hpp"

#include <rtlog/rtlog.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace {

constexpr auto kMaxLogMessages = 256;
constexpr auto kMaxLogMessageLength = 512;

std::atomic<std::size_t> log_serial{0};
std::atomic<std::uint64_t> dropped{0};

struct LogContext {
  logging::Level level;
};

// Multiple writers: the UI thread and the audio callback both log.
using RealtimeLogger =
    rtlog::Logger<LogContext, kMaxLogMessages, kMaxLogMessageLength,
                  log_serial, rtlog::MultiRealtimeWriterQueueType>;

RealtimeLogger rt_logger;

void print_to_stderr(logging::Level level, std::size_t serial,
                     const char *message) {
  if (level == logging::Level::Diagnostic) {
    return; // too much by default
  }
  std::cerr << "[keyfall #" << serial << " (" << logging::level_name(level)
            << ")]: " << message << std::endl;
}

std::mutex sinks_mutex;
std::vector<logging::Sink> &sinks() {
  static std::vector<logging::Sink> list{print_to_stderr};
  return list;
}

class ForwardToSinks {
public:
#if WIN32
  void operator()(const LogContext &data, std::size_t serial,
                  const char *format, ...)
#else
  void operator()(const LogContext &data, std::size_t serial,
                  const char *format, ...) __attribute__((format(printf, 4, 5)))
#endif
  {
    std::array<char, kMaxLogMessageLength> buffer;

    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(sinks_mutex);
    for (auto &sink : sinks()) {
      sink(data.level, serial, buffer.data());
    }
  }
};

ForwardToSinks forward_to_sinks;

// The queue has a single consumer: the processing thread and flush() take
// turns under drain_mutex.
std::mutex drain_mutex;

void drain_queue() {
  std::lock_guard<std::mutex> lock(drain_mutex);
  rt_logger.PrintAndClearLogQueue(forward_to_sinks);
}

class ProcessingThread {
public:
  explicit ProcessingThread(std::chrono::milliseconds wait)
      : thread_([this, wait] {
          while (running_.load(std::memory_order_acquire)) {
            drain_queue();
            std::this_thread::sleep_for(wait);
          }
          drain_queue();
        }) {}

  ~ProcessingThread() {
    running_.store(false, std::memory_order_release);
    thread_.join();
  }

private:
  std::atomic<bool> running_{true};
  std::thread thread_;
};

void ensure_processing_thread() {
  sinks(); // must outlive the thread
  static ProcessingThread thread(std::chrono::milliseconds(10));
}

void logv(logging::Level level, const char *format, va_list args) {
  ensure_processing_thread();
  const auto status = rt_logger.Logv(LogContext{level}, format, args);
  if (status == rtlog::Status::Error_QueueFull) {
    dropped.fetch_add(1, std::memory_order_relaxed);
  }
}

} // namespace

namespace logging {

void error(const char *format, ...) {
  va_list args;
  va_start(args, format);
  logv(Level::Error, format, args);
  va_end(args);
}

void warning(const char *format, ...) {
  va_list args;
  va_start(args, format);
  logv(Level::Warning, format, args);
  va_end(args);
}

void info(const char *format, ...) {
  va_list args;
  va_start(args, format);
  logv(Level::Info, format, args);
  va_end(args);
}

void diagnostic(const char *format, ...) {
  va_list args;
  va_start(args, format);
  logv(Level::Diagnostic, format, args);
  va_end(args);
}

void add_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(sinks_mutex);
  sinks().push_back(std::move(sink));
}

void add_stderr_sink() { add_sink(print_to_stderr); }

void clear_sinks() {
  std::lock_guard<std::mutex> lock(sinks_mutex);
  sinks().clear();
}

void flush() { drain_queue(); }

std::uint64_t dropped_messages() {
  return dropped.load(std::memory_order_relaxed);
}

const char *level_name(Level level) {
  switch (level) {
  case Level::Error:
    return "E";
  case Level::Warning:
    return "W";
  case Level::Info:
    return "I";
  case Level::Diagnostic:
    return "D";
  }
  return "";
}

} // namespace logging
