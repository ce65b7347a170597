// src/playback/clock.hpp
// A pausable, seekable playback position driven by a monotonic wall clock.
//
// While running: position = base + (now - anchor). While paused the
// position is frozen at base. seek() moves the position immediately in
// either direction; negative targets clamp to zero. get_time() never blocks
// and keeps following wall time even when nobody asks for it, so a stalled
// caller sees the full elapsed time on its next call.

#pragma once
#include <chrono>
#include <functional>

namespace playback {

using Seconds = std::chrono::duration<double>;
using ClockSource = std::function<std::chrono::steady_clock::time_point()>;

class PlaybackClock {
public:
  explicit PlaybackClock(ClockSource source = &std::chrono::steady_clock::now);

  void play();
  void pause();
  void toggle_pause();
  void seek(Seconds target);

  Seconds get_time() const;
  bool is_paused() const { return !running_; }

private:
  ClockSource now_;
  bool running_ = false;
  Seconds base_{0.0};
  std::chrono::steady_clock::time_point anchor_;
};

} // namespace playback
