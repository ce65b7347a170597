// src/playback/streamed_timeline.hpp
// Timeline that decodes the file in place, a little ahead of playback.
//
// At open a single forward pass over the file counts the notes, measures the
// length and records a checkpoint every `stride` events: the complete
// decoder state plus the notes held and the channel state at that point. Playback then decodes
// into a small lookahead deque. A seek either keeps decoding from the live
// state (short hops forward) or restores the closest checkpoint at or before
// the target and decodes the remaining few events.
//
// Malformed events are skipped and counted. A truncated file still opens:
// the scan pass logs where the data ends. Decoding ahead stops quietly at
// that point, every event before it is still yielded, and advance()/seek()
// throw midi::DecodeError once playback moves past the last one.

#pragma once
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "io/io.hpp"
#include "midi/control_tracker.hpp"
#include "midi/event_merger.hpp"
#include "midi/note_tracker.hpp"
#include "playback/timeline.hpp"

namespace playback {

class StreamedTimeline final : public Timeline {
public:
  // Throws midi::LoadError when the header or track index is unusable.
  StreamedTimeline(std::unique_ptr<io::ByteSource> source,
                   const TimelineOptions &options);

  using Timeline::seek;
  void advance(double until, std::vector<midi::MidiEvent> &out) override;
  void seek(double t, std::vector<midi::SoundingNote> &sounding,
            std::vector<std::uint32_t> &controls) override;

  double position() const override { return position_; }
  std::optional<double> length() const override { return length_; }
  std::uint64_t total_notes() const override { return totalNotes_; }
  std::uint64_t decode_errors() const override { return decodeErrors_; }

  const midi::SmfLayout &layout() const { return layout_; }
  std::size_t checkpoint_count() const { return checkpoints_.size(); }
  // Structural failure found by the scan pass, if any.
  const std::optional<midi::DecodeError> &scan_failure() const {
    return failure_;
  }

private:
  struct Checkpoint {
    double time = 0.0; // time of the last item merged before this point
    midi::MergerState state;
    std::vector<midi::SoundingNote> held;
    midi::ControlTracker controls;
  };

  void scan(const TimelineOptions &options);
  // Decode until an event past horizon is buffered or the file ends. A
  // DecodeError ends decoding and is kept in fillFailure_.
  void fill(double horizon);
  void restore(const Checkpoint &cp);
  void consume(const midi::MidiEvent &ev);

  std::unique_ptr<io::ByteSource> source_;
  midi::SmfLayout layout_;
  std::size_t stride_;
  double lookahead_;

  std::vector<Checkpoint> checkpoints_;
  std::uint64_t totalNotes_ = 0;
  std::uint64_t decodeErrors_ = 0;
  std::optional<double> length_;
  std::optional<midi::DecodeError> failure_;

  std::unique_ptr<midi::EventMerger> decoder_;
  std::deque<midi::MidiEvent> pending_;
  bool exhausted_ = false;
  std::optional<midi::DecodeError> fillFailure_;
  midi::NoteTracker held_;
  midi::ControlTracker controls_;
  double position_ = kBeforeStart;
};

} // namespace playback
