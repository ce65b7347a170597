// src/playback/buffered_timeline.cpp
// In-memory timeline: a cursor over the merged events plus checkpoints of the
// held notes and channel state for seeking.

#include "playback/buffered_timeline.hpp"

#include <algorithm>

namespace playback {

BufferedTimeline::BufferedTimeline(midi::Song song,
                                   const TimelineOptions &options)
    : song_(std::move(song)),
      stride_(std::max<std::size_t>(1, options.checkpoint_stride)),
      held_(options.vel_ignore) {
  const auto &events = song_.events;
  checkpoints_.reserve(events.size() / stride_ + 1);

  // One pass: count the notes and snapshot the state every stride_ events
  midi::NoteTracker tracker(options.vel_ignore);
  midi::ControlTracker controls;
  for (std::size_t i = 0; i < events.size(); ++i) {
    if (i % stride_ == 0) {
      checkpoints_.push_back(Checkpoint{tracker.sounding(), controls});
    }
    tracker.apply(events[i]);
    controls.apply(events[i]);
    if (midi::counts_as_note(events[i], options.vel_ignore)) {
      ++totalNotes_;
    }
  }
  // A seek past the last event may land exactly on the next stride boundary
  if (events.size() % stride_ == 0) {
    checkpoints_.push_back(Checkpoint{tracker.sounding(), controls});
  }
}

void BufferedTimeline::consume(const midi::MidiEvent &ev) {
  held_.apply(ev);
  controls_.apply(ev);
}

void BufferedTimeline::advance(double until,
                               std::vector<midi::MidiEvent> &out) {
  if (until <= position_)
    return;
  const auto &events = song_.events;
  while (cursor_ < events.size() && events[cursor_].time <= until) {
    consume(events[cursor_]);
    out.push_back(events[cursor_]);
    ++cursor_;
  }
  position_ = until;
}

void BufferedTimeline::seek(double t, std::vector<midi::SoundingNote> &sounding,
                            std::vector<std::uint32_t> &controls) {
  const auto &events = song_.events;

  // 1) First event strictly after t: everything before it is consumed
  const auto it = std::upper_bound(
      events.begin(), events.end(), t,
      [](double time, const midi::MidiEvent &ev) { return time < ev.time; });
  const std::size_t target = static_cast<std::size_t>(it - events.begin());

  // 2) Backward or long jumps restart from the checkpoint below the target
  if (target < cursor_ || target - cursor_ > stride_) {
    const Checkpoint &cp = checkpoints_[target / stride_];
    held_.restore(cp.held);
    controls_ = cp.controls;
    cursor_ = (target / stride_) * stride_;
  }

  // 3) Replay the rest silently
  skip_to(target);

  position_ = t;
  sounding = held_.sounding();
  controls = controls_.messages();
}

void BufferedTimeline::skip_to(std::size_t end) {
  const auto &events = song_.events;
  for (; cursor_ < end; ++cursor_) {
    consume(events[cursor_]);
  }
}

} // namespace playback
