// src/midi/events.hpp
// Core MIDI domain types shared across the app.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace midi {

// Unreadable path, missing 'MThd'/'MTrk', bad header: no session is created.
struct LoadError : std::runtime_error {
  explicit LoadError(const std::string &what) : std::runtime_error(what) {}
};

// Structural corruption found while decoding (data ends inside an event or
// before the announced track length). Fatal for the playback session.
struct DecodeError : std::runtime_error {
  DecodeError(const std::string &what, std::uint64_t offset)
      : std::runtime_error(what), offset(offset) {}
  std::uint64_t offset; // byte offset in the file where decoding stopped
};

// Pack a channel message the way KDMAPI's SendDirectData expects it:
// status in the low byte, then data1, then data2.
constexpr std::uint32_t pack(std::uint8_t status, std::uint8_t d1,
                             std::uint8_t d2 = 0) {
  return static_cast<std::uint32_t>(status) |
         (static_cast<std::uint32_t>(d1) << 8) |
         (static_cast<std::uint32_t>(d2) << 16);
}

// A channel voice message at an absolute time.
struct MidiEvent {
  double time = 0.0;       // seconds from the start of the file
  std::uint32_t raw = 0;   // packed message, see pack()
  std::uint16_t track = 0; // index of the MTrk chunk it came from

  std::uint8_t status() const { return raw & 0xFF; }
  std::uint8_t type() const { return status() & 0xF0; }
  std::uint8_t channel() const { return status() & 0x0F; }
  std::uint8_t data1() const { return (raw >> 8) & 0xFF; }
  std::uint8_t data2() const { return (raw >> 16) & 0xFF; }

  bool is_note_on() const { return type() == 0x90 && data2() != 0; }
  // Either a true 0x80 or "Note On with velocity 0"
  bool is_note_off() const {
    return type() == 0x80 || (type() == 0x90 && data2() == 0);
  }
};

inline bool operator==(const MidiEvent &a, const MidiEvent &b) {
  return a.time == b.time && a.raw == b.raw && a.track == b.track;
}
inline bool operator!=(const MidiEvent &a, const MidiEvent &b) {
  return !(a == b);
}

// Inclusive velocity range whose note-ons are suppressed before dispatch.
struct VelocityRange {
  std::uint8_t lo = 0;
  std::uint8_t hi = 0;

  bool contains(std::uint8_t v) const { return v >= lo && v <= hi; }
};

// A note held at some point in time, with how many overlapping note-ons
// (layers) are still unmatched on that channel/key. Layers whose note-on
// falls in the velocity-ignore range never reach the synth; the rest are
// `audible`.
struct SoundingNote {
  std::uint8_t channel = 0;
  std::uint8_t key = 0;
  std::uint8_t velocity = 0; // velocity of the latest note-on
  std::uint32_t layers = 0;
  std::uint32_t audible = 0;
  std::uint8_t audibleVelocity = 0; // latest note-on among the audible layers
};

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 0;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field

  bool isPPQN = true;  // true if PPQN timing, false if SMPTE
  unsigned ppqn = 480; // valid when isPPQN == true
  int smpte_fps = 0;   // valid when isPPQN == false
  int smpte_sub = 0;   // valid when isPPQN == false
};

// Where a track's event bytes live in the file.
struct ChunkRef {
  std::uint64_t offset = 0; // first byte after the 8-byte chunk header
  std::uint32_t length = 0; // announced length
};

// Header + track index, enough to decode the file from any ByteSource.
struct SmfLayout {
  SMFHeader header;
  std::vector<ChunkRef> tracks;
  std::uint64_t fileSize = 0;
  bool truncated = false; // file ends before an announced chunk end
};

// A tempo segment: from startTick on, time advances at usPerQN.
struct TempoSeg {
  std::uint64_t startTick = 0; // segment begins at this absolute tick
  double startSec = 0;         // time in seconds at startTick
  double usPerQN = 500000.0;   // tempo in this segment
};

// A fully decoded song: what the buffered timeline keeps in memory.
struct Song {
  SmfLayout layout;
  std::vector<MidiEvent> events; // merged across tracks, ascending time
  double length = 0.0;           // time of the last merged item
  std::uint64_t decodeErrors = 0;
};

} // namespace midi
