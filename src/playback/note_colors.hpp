// src/playback/note_colors.hpp
// Per-key "currently sounding" state for keyboard highlighting.
//
// Each key keeps a count of unmatched note-ons per channel. A key shows the
// color of the most recent note-on among the channels still holding it, so
// releasing one channel hands the key back to the other instead of leaving
// the released channel's color behind. Overlapping notes never clear a key
// early.

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "midi/color.hpp"

namespace playback {

class NoteColorState {
public:
  static constexpr std::size_t kKeyCount = 128;
  static constexpr std::size_t kChannelCount = 16;

  void note_on(std::uint8_t key, std::uint8_t channel, midi::MidiColor color);
  void note_off(std::uint8_t key, std::uint8_t channel);
  void clear();

  std::optional<midi::MidiColor> color(std::uint8_t key) const;
  std::uint32_t active_count(std::uint8_t key) const {
    return active_[key & 0x7F];
  }
  // Unmatched note-ons over all keys.
  std::uint64_t active_count() const;

  // One entry per key, std::nullopt for silent keys.
  std::vector<std::optional<midi::MidiColor>> colors() const;

private:
  struct Holder {
    std::uint32_t count = 0;
    std::uint64_t order = 0; // stamp of the channel's latest note-on
    midi::MidiColor color;
  };

  std::array<std::array<Holder, kChannelCount>, kKeyCount> holders_{};
  std::array<std::uint32_t, kKeyCount> active_{};
  std::uint64_t stamp_ = 0;
};

} // namespace playback
