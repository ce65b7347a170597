// src/audio/dispatch.hpp
// AudioDispatch: the playback engine's only view of the synthesizer.
//
// Owns one backend for the whole session (it survives file loads and gets a
// reset() between files). Applies the velocity-ignore range, counts events
// the backend rejected, and forwards everything else unchanged.

#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "audio/backend.hpp"
#include "midi/events.hpp"

namespace audio {

class AudioDispatch {
public:
  AudioDispatch(SynthKind kind, std::unique_ptr<SynthBackend> backend,
                std::optional<midi::VelocityRange> velIgnore = std::nullopt);

  // Never blocks. Suppressed note-ons are not forwarded; rejected events are
  // counted in dropped_events(). True when the backend accepted the event.
  bool push_event(std::uint32_t raw);

  void reset();
  std::uint64_t get_voice_count() const;
  void set_layer_count(std::optional<std::size_t> layers);
  void set_soundfont(const std::filesystem::path &path);

  // True for a note-on velocity that falls in the ignore range.
  bool suppresses(std::uint8_t velocity) const {
    return velIgnore_ && velIgnore_->contains(velocity);
  }
  const std::optional<midi::VelocityRange> &velocity_ignore() const {
    return velIgnore_;
  }

  std::uint64_t dropped_events() const {
    return dropped_.load(std::memory_order_relaxed);
  }
  SynthKind kind() const { return kind_; }
  const SynthBackend &backend() const { return *backend_; }

private:
  SynthKind kind_;
  std::unique_ptr<SynthBackend> backend_;
  std::optional<midi::VelocityRange> velIgnore_;
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace audio
