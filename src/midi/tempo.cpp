// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"

namespace midi {

TempoTracker::TempoTracker(const SMFHeader &header)
    : isPPQN_(header.isPPQN),
      // A PPQN of 0 would divide by zero; treat it like the common default
      ppqn_(header.isPPQN && header.ppqn != 0 ? header.ppqn : 480) {
  if (!isPPQN_) {
    // 29 in the division byte means 29.97 drop-frame
    const double fps = header.smpte_fps == 29 ? 29.97 : header.smpte_fps;
    const int sub = header.smpte_sub > 0 ? header.smpte_sub : 1;
    smpteTicksPerSec_ = fps * sub;
  }
  // Default tempo is 120 BPM => 500,000 microseconds per quarter note
  seg_ = TempoSeg{0u, 0.0, 500000.0};
}

double TempoTracker::seconds_at(std::uint64_t tick) const {
  if (!isPPQN_) {
    return smpteTicksPerSec_ > 0.0 ? tick / smpteTicksPerSec_ : 0.0;
  }
  const double deltaQN = (tick - seg_.startTick) / ppqn_;
  return seg_.startSec + deltaQN * (seg_.usPerQN * 1e-6);
}

void TempoTracker::set_tempo(std::uint64_t tick, std::uint32_t usPerQN) {
  if (!isPPQN_ || tick < seg_.startTick) {
    // SMPTE time is absolute; out-of-order tempo data is ignored
    return;
  }
  // Start a new segment at this tick with the new tempo
  const double startSec = seconds_at(tick);
  seg_ = TempoSeg{tick, startSec, static_cast<double>(usPerQN)};
}

} // namespace midi
