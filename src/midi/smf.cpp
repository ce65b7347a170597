// src/midi/smf.cpp
// Parse a Standard MIDI File (SMF) into its layout and merged events.
// Pure parsing: no printing.

#include "midi/smf.hpp"
#include "common/reader.hpp" // Bytes cursor
#include "midi/event_merger.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::uint32_t kMThd = 0x4D546864;
constexpr std::uint32_t kMTrk = 0x4D54726B;

// Parse SMF header (MThd chunk) and fill midi::SMFHeader.
midi::SMFHeader parse_header(Bytes &r) {
  const std::uint32_t id = r.be32();
  if (id != kMThd) {
    throw midi::LoadError("Not a MIDI file (missing 'MThd')");
  }

  const std::uint32_t length = r.be32();
  if (length != 6) {
    throw midi::LoadError("Header chunk length must be 6");
  }

  midi::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();

  if ((h.division & 0x8000) == 0) {
    // PPQN timing (ticks per quarter note)
    h.isPPQN = true;
    h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
    if (h.ppqn == 0) {
      throw midi::LoadError("Division of 0 ticks per quarter note");
    }
  } else {
    // SMPTE timing (two's-complement FPS in high byte, subframes in low byte)
    h.isPPQN = false;
    h.smpte_fps = 256 - ((h.division >> 8) & 0xFF); // e.g., 24, 25, 29, 30
    h.smpte_sub = static_cast<int>(h.division & 0xFF);
  }

  return h;
}

// Read `n` bytes at `offset` into a Bytes cursor (short at end of file).
Bytes read_slice(io::ByteSource &src, std::uint64_t offset, std::size_t n) {
  std::vector<std::uint8_t> tmp(n);
  const std::size_t got = src.read_at(offset, tmp.data(), n);
  tmp.resize(got);
  return Bytes(tmp);
}

} // namespace

namespace midi {

SmfLayout read_layout(io::ByteSource &src) {
  SmfLayout layout;
  layout.fileSize = src.size();

  try {
    Bytes r = read_slice(src, 0, 14);
    layout.header = parse_header(r);
  } catch (const EndOfData &) {
    throw LoadError("File too short for a MIDI header");
  }
  if (layout.header.nTracks == 0) {
    throw LoadError("MIDI header announces no tracks");
  }

  // Walk the chunk list. Every chunk is "id" + 32-bit big-endian length.
  std::uint64_t offset = 14;
  while (layout.tracks.size() < layout.header.nTracks) {
    if (offset + 8 > layout.fileSize) {
      // Fewer chunks than announced
      layout.truncated = true;
      break;
    }
    Bytes r = read_slice(src, offset, 8);
    const std::uint32_t id = r.be32();
    const std::uint32_t len = r.be32();
    const std::uint64_t payload = offset + 8;

    // Unknown chunk types are skipped
    if (id == kMTrk) {
      layout.tracks.push_back(ChunkRef{payload, len});
    }

    if (payload + len > layout.fileSize) {
      layout.truncated = true;
      break;
    }
    offset = payload + len;
  }

  if (layout.tracks.empty()) {
    throw LoadError("No 'MTrk' chunk found");
  }
  return layout;
}

Song parse_smf(const std::vector<std::uint8_t> &bytes) {
  io::MemorySource src(bytes);

  Song song;
  song.layout = read_layout(src);
  if (song.layout.truncated) {
    throw LoadError("Truncated MIDI file: data ends before the announced "
                    "track length");
  }

  try {
    EventMerger merger(src, song.layout);
    MidiEvent ev;
    song.events.reserve(4096);
    while (merger.next(ev)) {
      song.events.push_back(ev);
    }
    song.length = merger.last_time();
    song.decodeErrors = merger.decode_errors();
  } catch (const DecodeError &e) {
    throw LoadError(std::string("Corrupt MIDI file: ") + e.what());
  }
  return song;
}

} // namespace midi
