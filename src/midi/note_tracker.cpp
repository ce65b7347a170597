// src/midi/note_tracker.cpp

#include "midi/note_tracker.hpp"

namespace midi {

void NoteTracker::apply(const MidiEvent &ev) {
  const std::size_t slot = ev.channel() * 128u + (ev.data1() & 0x7F);
  if (ev.is_note_on()) {
    ++layers_[slot];
    velocity_[slot] = ev.data2();
    if (counts_as_note(ev, ignore_)) {
      ++audible_[slot];
      audibleVelocity_[slot] = ev.data2();
    }
  } else if (ev.is_note_off() && layers_[slot] > 0) {
    // An ignored layer takes the note-off if there is one
    if (layers_[slot] == audible_[slot] && --audible_[slot] == 0)
      audibleVelocity_[slot] = 0;
    --layers_[slot];
  }
}

void NoteTracker::clear() {
  layers_.fill(0);
  audible_.fill(0);
  velocity_.fill(0);
  audibleVelocity_.fill(0);
}

std::vector<SoundingNote> NoteTracker::sounding() const {
  std::vector<SoundingNote> notes;
  for (std::size_t slot = 0; slot < kSlots; ++slot) {
    if (layers_[slot] != 0) {
      SoundingNote n;
      n.channel = static_cast<std::uint8_t>(slot / 128);
      n.key = static_cast<std::uint8_t>(slot % 128);
      n.velocity = velocity_[slot];
      n.layers = layers_[slot];
      n.audible = audible_[slot];
      n.audibleVelocity = audibleVelocity_[slot];
      notes.push_back(n);
    }
  }
  return notes;
}

void NoteTracker::restore(const std::vector<SoundingNote> &notes) {
  clear();
  for (const auto &n : notes) {
    const std::size_t slot = (n.channel & 0x0F) * 128u + (n.key & 0x7F);
    layers_[slot] = n.layers;
    audible_[slot] = n.audible;
    velocity_[slot] = n.velocity;
    audibleVelocity_[slot] = n.audibleVelocity;
  }
}

} // namespace midi
