// src/midi/event_merger.hpp
// Merges the tracks of an SMF into one time-ordered stream of channel events.
//
// Ordering: ascending absolute tick; ties go to the lower track index, then
// to file order within the track. Tempo events are applied as they are
// merged, so each event's time comes from the tempo segment in effect at its
// tick. Both timelines decode through this class, which is what makes their
// output identical for the same file.
//
// snapshot()/restore() capture the complete decoder state between two
// next() calls (per-track byte offsets, ticks, running status, tempo
// segment), so decoding can resume from a checkpoint without rescanning.

#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <queue>
#include <utility>
#include <vector>

#include "io/io.hpp"
#include "midi/events.hpp"
#include "midi/tempo.hpp"
#include "midi/track_cursor.hpp"

namespace midi {

struct MergerState {
  std::vector<TrackState> tracks;
  TempoSeg tempo;
  std::uint64_t index = 0; // channel events emitted before this state
  double lastTime = 0.0;   // time of the last merged item
};

class EventMerger {
public:
  EventMerger(io::ByteSource &src, const SmfLayout &layout);

  // Next channel event in merged order; false once every track has ended.
  // Throws DecodeError once the stream reaches corrupt data; every event
  // decoded before that point is returned first.
  bool next(MidiEvent &out);

  MergerState snapshot() const;
  void restore(const MergerState &state);
  void rewind();

  std::uint64_t index() const { return index_; }
  // Time of the last merged item, meta events included.
  double last_time() const { return lastTime_; }
  std::uint64_t decode_errors() const;

  void set_quiet(bool quiet);

private:
  using HeadKey = std::pair<std::uint64_t, std::uint16_t>; // (tick, track)

  void rebuild_heap();

  std::vector<TrackCursor> cursors_;
  TempoTracker tempo_;
  std::priority_queue<HeadKey, std::vector<HeadKey>, std::greater<HeadKey>>
      heads_;
  std::uint64_t index_ = 0;
  double lastTime_ = 0.0;
  std::optional<DecodeError> failure_;
};

} // namespace midi
