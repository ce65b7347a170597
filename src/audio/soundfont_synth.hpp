// src/audio/soundfont_synth.hpp
// Realtime SoundFont synthesizer: TinySoundFont rendering through a miniaudio
// playback device.
//
// The playback thread pushes packed MIDI messages into an EventQueue; the
// device callback drains it, applies the messages to the synth and renders
// interleaved stereo s16. Nothing on the playback side waits for the audio
// thread:
//  - reset() starts a new queue generation; the callback drops the messages
//    of older generations and stops all voices.
//  - set_soundfont() loads the new file on the calling thread and hands it
//    over through an atomic pointer; the callback swaps it in between two
//    buffers and hands the old one back to be freed.
//
// The .cpp contains the single-header library implementations, so headers
// elsewhere stay clean.

#pragma once
#include <memory>

#include "audio/backend.hpp"
#include "audio/synth_settings.hpp"

namespace audio {

class SoundfontSynth final : public SynthBackend {
public:
  // Opens and starts the device. Throws std::runtime_error when the
  // soundfont cannot be loaded or the device cannot be opened.
  explicit SoundfontSynth(const SynthSettings &settings);
  ~SoundfontSynth() override;

  SoundfontSynth(const SoundfontSynth &) = delete;
  SoundfontSynth &operator=(const SoundfontSynth &) = delete;

  const char *name() const override { return "xsynth"; }
  bool push_event(std::uint32_t raw) override;
  void reset() override;
  std::uint64_t voice_count() const override;
  void set_layer_count(std::optional<std::size_t> layers) override;
  void set_soundfont(const std::filesystem::path &path) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace audio
