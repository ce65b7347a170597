// src/midi/tempo.hpp
// Timing utilities: convert absolute ticks to seconds under tempo changes.
//
// Contract:
//  - TempoTracker follows the tempo as events are merged in tick order:
//    set_tempo() closes the current segment and opens a new one, so
//    seconds_at() only ever needs the current segment.
//  - PPQN files use startSec + (tick - startTick) / ppqn * usPerQN.
//  - SMPTE files ignore tempo events; a tick is 1 / (fps * subframes) s.
//  - segment()/restore() let a checkpoint capture and replay the exact
//    floating-point state, so a resumed decode yields identical times.

#pragma once
#include "midi/events.hpp"

#include <cstdint>

namespace midi {

class TempoTracker {
public:
  explicit TempoTracker(const SMFHeader &header);

  double seconds_at(std::uint64_t tick) const;

  // Tempo meta event (FF 51) at `tick`.
  void set_tempo(std::uint64_t tick, std::uint32_t usPerQN);

  const TempoSeg &segment() const { return seg_; }
  void restore(const TempoSeg &seg) { seg_ = seg; }

private:
  TempoSeg seg_;
  bool isPPQN_;
  double ppqn_;
  double smpteTicksPerSec_ = 0.0;
};

} // namespace midi
