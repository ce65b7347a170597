// src/midi/track_cursor.cpp
// Walk a single MTrk chunk one event at a time.

#include "midi/track_cursor.hpp"

#include "common/logger.hpp"

#include <string>

namespace midi {

TrackCursor::TrackCursor(io::ByteSource &src, std::uint64_t fileSize,
                         ChunkRef chunk, std::uint16_t index)
    : reader_(src, chunk.offset, chunk.offset + chunk.length),
      chunkBegin_(chunk.offset), chunkEnd_(chunk.offset + chunk.length),
      fileSize_(fileSize), index_(index) {
  headState_ = TrackState{chunk.offset, 0, 0, false};
}

void TrackCursor::rewind() { restore(TrackState{chunkBegin_, 0, 0, false}); }

void TrackCursor::restore(const TrackState &state) {
  reader_.seek(state.offset);
  tick_ = state.tick;
  running_ = state.running;
  ended_ = state.ended;
  decode_head();
}

void TrackCursor::decode_head() {
  headState_ = TrackState{reader_.off(), tick_, running_, ended_};
  hasHead_ = decode_item(head_);
}

void TrackCursor::malformed(const char *what, std::uint64_t at, int byte) {
  ++errors_;
  if (!quiet_) {
    logging::warning("Track %u: %s (byte 0x%02X at offset %llu), event skipped",
                     static_cast<unsigned>(index_), what, byte,
                     static_cast<unsigned long long>(at));
  }
}

bool TrackCursor::decode_item(TrackItem &out) {
  while (!ended_) {
    const std::uint64_t eventStart = reader_.off();
    if (eventStart >= chunkEnd_) {
      // Chunk consumed without an End of Track meta event: accept it
      ended_ = true;
      break;
    }
    if (eventStart >= fileSize_) {
      throw DecodeError("Track " + std::to_string(index_) +
                            ": file ends before the announced track length",
                        eventStart);
    }

    try {
      // 1) Delta-time (Variable-Length Quantity)
      tick_ += read_vlq(reader_);

      // 2) Status or running status?
      const std::uint8_t first = reader_.u8();
      std::uint8_t status = 0;
      bool haveData1 = false;
      std::uint8_t data1 = 0;

      if (first & 0x80) {
        // New status byte
        status = first;
        if ((status & 0xF0) < 0xF0) {
          running_ = status; // only channel messages set running status
        }
      } else {
        // Running status: 'first' is actually data1 for the previous channel
        // status
        if (running_ == 0) {
          malformed("running status used before any status", eventStart,
                    first);
          continue;
        }
        status = running_;
        haveData1 = true;
        data1 = first;
      }

      const std::uint8_t type = status & 0xF0;

      // Channel messages with two data bytes
      if (type == 0x80 || type == 0x90 || type == 0xA0 || type == 0xB0 ||
          type == 0xE0) {
        const std::uint8_t d1 = haveData1 ? data1 : reader_.u8();
        const std::uint8_t d2 = reader_.u8();
        if ((d1 | d2) & 0x80) {
          malformed("data byte with the high bit set", eventStart,
                    (d1 & 0x80) ? d1 : d2);
          continue;
        }
        out = TrackItem{TrackItem::Kind::Channel, tick_, pack(status, d1, d2),
                        0};
        return true;
      }

      // Channel messages with one data byte (Program Change / Channel
      // Pressure)
      if (type == 0xC0 || type == 0xD0) {
        const std::uint8_t d1 = haveData1 ? data1 : reader_.u8();
        if (d1 & 0x80) {
          malformed("data byte with the high bit set", eventStart, d1);
          continue;
        }
        out = TrackItem{TrackItem::Kind::Channel, tick_, pack(status, d1), 0};
        return true;
      }

      // Meta events
      if (status == 0xFF) {
        const std::uint8_t metaType = reader_.u8();
        const std::uint32_t mlen = read_vlq(reader_);

        if (metaType == 0x2F) { // End of Track
          reader_.skip(mlen);
          ended_ = true;
          out = TrackItem{TrackItem::Kind::EndOfTrack, tick_, 0, 0};
          return true;
        }
        if (metaType == 0x51 && mlen == 3) {
          // Tempo: 3 bytes big-endian microseconds per quarter note
          const std::uint32_t t0 = reader_.u8(), t1 = reader_.u8(),
                              t2 = reader_.u8();
          const std::uint32_t usPerQN = (t0 << 16) | (t1 << 8) | t2;
          out = TrackItem{TrackItem::Kind::Tempo, tick_, 0, usPerQN};
          return true;
        }
        // Skip other meta payloads we don't consume
        reader_.skip(mlen);
        continue;
      }

      // SysEx events
      if (status == 0xF0 || status == 0xF7) {
        const std::uint32_t slen = read_vlq(reader_);
        reader_.skip(slen);
        continue;
      }

      // System common / realtime bytes have no place in a track. Consume the
      // data bytes the common ones carry so the next delta-time lines up.
      malformed("undefined status byte", eventStart, status);
      if (status == 0xF2) {
        reader_.skip(2);
      } else if (status == 0xF1 || status == 0xF3) {
        reader_.skip(1);
      }
    } catch (const EndOfData &) {
      throw DecodeError("Track " + std::to_string(index_) +
                            ": unexpected end of data inside an event",
                        eventStart);
    }
  }
  return false;
}

} // namespace midi
