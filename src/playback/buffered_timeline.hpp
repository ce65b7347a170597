// src/playback/buffered_timeline.hpp
// Timeline over a Song decoded entirely into memory.
//
// The cursor is an index into the merged event list. A seek finds the target
// with a binary search on time, then rebuilds the held notes and channel
// state from the closest checkpoint at or before it (one every `stride`
// events), unless the target is a short hop forward from the cursor.

#pragma once
#include <vector>

#include "midi/control_tracker.hpp"
#include "midi/note_tracker.hpp"
#include "playback/timeline.hpp"

namespace playback {

class BufferedTimeline final : public Timeline {
public:
  BufferedTimeline(midi::Song song, const TimelineOptions &options);

  using Timeline::seek;
  void advance(double until, std::vector<midi::MidiEvent> &out) override;
  void seek(double t, std::vector<midi::SoundingNote> &sounding,
            std::vector<std::uint32_t> &controls) override;

  double position() const override { return position_; }
  std::optional<double> length() const override { return song_.length; }
  std::uint64_t total_notes() const override { return totalNotes_; }
  std::uint64_t decode_errors() const override { return song_.decodeErrors; }

  const midi::Song &song() const { return song_; }

private:
  struct Checkpoint {
    std::vector<midi::SoundingNote> held;
    midi::ControlTracker controls;
  };

  // Consume events [cursor_, end) without yielding them.
  void skip_to(std::size_t end);
  void consume(const midi::MidiEvent &ev);

  midi::Song song_;
  std::size_t stride_;
  // checkpoints_[i]: state before event i * stride_
  std::vector<Checkpoint> checkpoints_;

  midi::NoteTracker held_;
  midi::ControlTracker controls_;
  std::size_t cursor_ = 0;
  double position_ = kBeforeStart;
  std::uint64_t totalNotes_ = 0;
};

} // namespace playback
