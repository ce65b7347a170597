// src/playback/clock.cpp
// Playback time as base_ plus the steady time elapsed since anchor_.

#include "playback/clock.hpp"

namespace playback {

PlaybackClock::PlaybackClock(ClockSource source)
    : now_(std::move(source)), anchor_(now_()) {}

void PlaybackClock::play() {
  if (running_)
    return;
  anchor_ = now_();
  running_ = true;
}

void PlaybackClock::pause() {
  if (!running_)
    return;
  base_ = get_time();
  running_ = false;
}

void PlaybackClock::toggle_pause() {
  if (running_)
    pause();
  else
    play();
}

void PlaybackClock::seek(Seconds target) {
  // 1) Clamp to the start of the file
  base_ = target < Seconds(0.0) ? Seconds(0.0) : target;
  // 2) Count elapsed time from now; paused stays paused
  anchor_ = now_();
}

Seconds PlaybackClock::get_time() const {
  if (!running_)
    return base_;
  const Seconds elapsed = now_() - anchor_;
  // steady_clock never goes back, but a custom source might
  return elapsed > Seconds(0.0) ? base_ + elapsed : base_;
}

} // namespace playback
