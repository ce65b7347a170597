// src/playback/timeline.hpp
// Ordered MIDI events due between two points in time.
//
// Two strategies share this contract:
//  - BufferedTimeline: the whole file decoded into memory at open.
//  - StreamedTimeline: the file decoded in place, a little ahead of playback.
// For the same file both yield exactly the same events in the same order.
//
// The cursor starts before time zero, so the first advance() also yields the
// events at t = 0.
//
// Held notes are split into audible and ignored layers using
// TimelineOptions::vel_ignore, which must match the dispatch's range.

#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "midi/events.hpp"

namespace playback {

enum class MidiLoading { Ram, Live };

constexpr double kBeforeStart = -1.0;

struct TimelineOptions {
  std::optional<midi::VelocityRange> vel_ignore; // excluded from total_notes
  std::size_t checkpoint_stride = 4096;          // events between checkpoints
  double lookahead = 0.5; // seconds decoded past the requested time (Live)
};

class Timeline {
public:
  virtual ~Timeline() = default;

  // Append the events with time in (position(), until] and move to until.
  // A call with until <= position() yields nothing and does not move back.
  virtual void advance(double until, std::vector<midi::MidiEvent> &out) = 0;

  // Move to t without yielding anything. Events at or before t count as
  // consumed. sounding receives the notes held at t; controls receives the
  // messages that put every channel in its state at t (program, controllers,
  // pitch bend), see midi::ControlTracker::messages().
  virtual void seek(double t, std::vector<midi::SoundingNote> &sounding,
                    std::vector<std::uint32_t> &controls) = 0;

  void seek(double t, std::vector<midi::SoundingNote> &sounding) {
    std::vector<std::uint32_t> controls;
    seek(t, sounding, controls);
  }

  virtual double position() const = 0;
  virtual std::optional<double> length() const = 0;
  virtual std::uint64_t total_notes() const = 0;
  virtual std::uint64_t decode_errors() const = 0;
};

// Open path with the requested strategy. Throws midi::LoadError.
std::unique_ptr<Timeline> open_timeline(const std::filesystem::path &path,
                                        MidiLoading loading,
                                        const TimelineOptions &options);

} // namespace playback
