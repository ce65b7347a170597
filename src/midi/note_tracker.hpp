// src/midi/note_tracker.hpp
// Which notes are held after a run of events, per channel and key.
//
// Overlapping note-ons on the same channel/key stack up as layers; each
// note-off removes one layer. Layers whose note-on is in the velocity-ignore
// range are counted apart from the audible ones, and a note-off removes an
// ignored layer first, the same pairing the playback engine applies when it
// swallows the note-off of a suppressed note-on. Timelines keep one of these
// in step with their cursor so a seek can report the notes sounding at the
// target time, and checkpoints store its sounding() snapshot.

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// Counts toward total_notes: a real note-on whose velocity is not ignored.
inline bool counts_as_note(const MidiEvent &ev,
                           const std::optional<VelocityRange> &ignore) {
  return ev.is_note_on() && !(ignore && ignore->contains(ev.data2()));
}

class NoteTracker {
public:
  explicit NoteTracker(std::optional<VelocityRange> ignore = std::nullopt)
      : ignore_(ignore) {}

  void apply(const MidiEvent &ev);
  void clear();

  // Held notes ordered by channel, then key.
  std::vector<SoundingNote> sounding() const;
  void restore(const std::vector<SoundingNote> &notes);

private:
  static constexpr std::size_t kSlots = 16 * 128;

  std::optional<VelocityRange> ignore_;
  std::array<std::uint32_t, kSlots> layers_{};
  std::array<std::uint32_t, kSlots> audible_{};
  std::array<std::uint8_t, kSlots> velocity_{};
  std::array<std::uint8_t, kSlots> audibleVelocity_{};
};

} // namespace midi
