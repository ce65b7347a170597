// src/midi/control_tracker.hpp
// Channel state (program, controllers, pitch bend) after a run of events.
//
// A seek skips every event before the target, so the synth never hears the
// program changes and controller moves that set each channel up. Timelines
// keep one of these in step with their cursor (and copy it into their
// checkpoints) so the engine can replay the state at the target:
//
//   for (auto raw : tracker.messages()) dispatch.push_event(raw);
//
// messages() covers all 16 channels: Reset All Controllers, then every
// controller set so far in ascending order (bank select before the program),
// then the program and the pitch bend. Channels that never received a value
// get the General MIDI defaults, so a backward seek also undoes changes made
// later in the file.

#pragma once
#include <array>
#include <cstdint>
#include <vector>

#include "midi/events.hpp"

namespace midi {

class ControlTracker {
public:
  ControlTracker() { clear(); }

  void apply(const MidiEvent &ev);
  void clear();

  std::vector<std::uint32_t> messages() const;

  // -1 when the channel has not received one
  int program(std::uint8_t channel) const {
    return channels_[channel & 0x0F].program;
  }
  int controller(std::uint8_t channel, std::uint8_t cc) const;
  int pitch_bend(std::uint8_t channel) const {
    return channels_[channel & 0x0F].bend;
  }

private:
  // 120..127 are channel mode messages, not state
  static constexpr std::size_t kControllers = 120;

  struct Channel {
    std::array<std::int16_t, kControllers> cc;
    std::int16_t program;
    std::int16_t bend; // 14-bit
  };

  void reset_controllers(Channel &ch);

  std::array<Channel, 16> channels_;
};

} // namespace midi
