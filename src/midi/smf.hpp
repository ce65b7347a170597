// src/midi/smf.hpp
// Public API: locate and decode the contents of a Standard MIDI File (SMF).
// - No printing here; pure data extraction.
// - Throws LoadError on a malformed header or an unusable file.

#pragma once
#include <cstdint>
#include <vector>

#include "io/io.hpp"
#include "midi/events.hpp"

namespace midi {

// Parse the MThd chunk and index every MTrk chunk that follows it.
// Unknown chunk types are skipped. A chunk that runs past the end of the
// file is kept (its announced length intact) and the layout is marked
// truncated; deciding whether that is fatal is up to the caller.
SmfLayout read_layout(io::ByteSource &src);

// Decode an entire SMF already loaded in memory into a Song: every channel
// event merged across tracks with its absolute time. Malformed events are
// skipped and counted; truncation or any structural failure throws
// LoadError.
Song parse_smf(const std::vector<std::uint8_t> &bytes);

} // namespace midi
