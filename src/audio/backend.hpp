// src/audio/backend.hpp
// The seam between playback and a concrete synthesizer.
//
// Implementations:
//  - SoundfontSynth (XSynth capability): TinySoundFont + miniaudio device.
//  - KdmapiSynth (Kdmapi capability): OmniMIDI's KDMAPI, loaded at runtime.
// Tests plug in their own recording backend.
//
// push_event() and reset() are called from the playback thread and must not
// block on the audio thread. Operations a backend cannot honor are explicit
// no-ops, never errors.

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace audio {

enum class SynthKind { XSynth, Kdmapi };

const char *to_string(SynthKind kind);

class SynthBackend {
public:
  virtual ~SynthBackend() = default;

  virtual const char *name() const = 0;

  // Queue a packed channel message (status | d1 << 8 | d2 << 16).
  // False when the event could not be accepted (queue full).
  virtual bool push_event(std::uint32_t raw) = 0;

  // Silence every voice. Events pushed before the call are discarded.
  virtual void reset() = 0;

  // Active voices, 0 when the backend does not track them.
  virtual std::uint64_t voice_count() const = 0;

  // Max simultaneous voices per channel/key; std::nullopt for no limit.
  virtual void set_layer_count(std::optional<std::size_t> layers) = 0;

  // Throws std::runtime_error when the soundfont cannot be loaded.
  virtual void set_soundfont(const std::filesystem::path &path) = 0;
};

} // namespace audio
