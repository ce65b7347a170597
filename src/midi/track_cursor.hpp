// src/midi/track_cursor.hpp
// Decodes one MTrk chunk one item at a time, reading the bytes in place from
// an io::ByteSource.
//
// The cursor always holds the next decoded item (its "head") so a merger can
// compare heads across tracks. head_state() is the decoder state *before*
// the head was decoded; restoring it re-decodes the same head, which is what
// checkpoints rely on.
//
// Malformed events (undefined status bytes, running status before any status,
// data bytes with the high bit set) are skipped and counted. Running out of
// data inside an event or before the announced chunk end throws DecodeError.

#pragma once
#include <cstdint>

#include "common/reader.hpp"
#include "io/io.hpp"
#include "midi/events.hpp"

namespace midi {

struct TrackState {
  std::uint64_t offset = 0; // absolute byte offset of the next event
  std::uint64_t tick = 0;   // absolute tick of the last decoded event
  std::uint8_t running = 0; // running status
  bool ended = false;
};

struct TrackItem {
  enum class Kind { Channel, Tempo, EndOfTrack };
  Kind kind = Kind::Channel;
  std::uint64_t tick = 0;
  std::uint32_t raw = 0;     // Kind::Channel: packed message
  std::uint32_t usPerQN = 0; // Kind::Tempo
};

class TrackCursor {
public:
  TrackCursor(io::ByteSource &src, std::uint64_t fileSize, ChunkRef chunk,
              std::uint16_t index);

  // Reposition to a state previously returned by head_state() (or the start
  // state) and decode the head.
  void restore(const TrackState &state);
  void rewind();

  bool has_head() const { return hasHead_; }
  const TrackItem &head() const { return head_; }
  void pop() { decode_head(); }

  TrackState head_state() const { return headState_; }
  std::uint16_t index() const { return index_; }
  std::uint64_t decode_errors() const { return errors_; }

  // Malformed events are logged unless quiet (replays of already-reported
  // ranges).
  void set_quiet(bool quiet) { quiet_ = quiet; }

private:
  void decode_head();
  bool decode_item(TrackItem &out);
  void malformed(const char *what, std::uint64_t at, int byte);

  SourceReader reader_;
  std::uint64_t chunkBegin_;
  std::uint64_t chunkEnd_;
  std::uint64_t fileSize_;
  std::uint16_t index_;

  std::uint64_t tick_ = 0;
  std::uint8_t running_ = 0; // last seen channel status for running status
  bool ended_ = false;

  TrackItem head_;
  bool hasHead_ = false;
  TrackState headState_;

  std::uint64_t errors_ = 0;
  bool quiet_ = false;
};

} // namespace midi
