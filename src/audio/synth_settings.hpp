// src/audio/synth_settings.hpp
// Everything needed to build the audio backend.

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

#include "audio/backend.hpp"
#include "midi/events.hpp"

namespace audio {

struct SynthSettings {
  SynthKind synth = SynthKind::XSynth;
  std::filesystem::path sfz_path; // soundfont for XSynth
  std::uint32_t buffer_ms = 10;   // device period for XSynth
  bool limit_layers = true;
  std::size_t layer_count = 4; // per channel/key, when limit_layers
  std::optional<midi::VelocityRange> vel_ignore;
  bool fade_out_kill = true; // release voices on reset instead of cutting
  bool linear_envelope = false;
  bool use_effects = true;

  std::optional<std::size_t> layer_limit() const {
    if (!limit_layers)
      return std::nullopt;
    return layer_count;
  }
};

} // namespace audio
