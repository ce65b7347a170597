// src/audio/kdmapi_synth.hpp
// Pass-through to OmniMIDI's Keppy's Direct MIDI API (KDMAPI).
//
// The library is loaded at runtime (libOmniMIDI.so / OmniMIDI.dll) so the
// player does not need it installed unless this backend is selected.
// OmniMIDI owns its own synth and audio thread: events go straight to
// SendDirectData, voices are not reported, and layer/soundfont settings are
// OmniMIDI's own configuration (no-ops here).

#pragma once
#include "audio/backend.hpp"

namespace audio {

class KdmapiSynth final : public SynthBackend {
public:
  // Throws std::runtime_error when the library or its entry points are
  // missing, or the stream cannot be initialized.
  KdmapiSynth();
  ~KdmapiSynth() override;

  KdmapiSynth(const KdmapiSynth &) = delete;
  KdmapiSynth &operator=(const KdmapiSynth &) = delete;

  const char *name() const override { return "kdmapi"; }
  bool push_event(std::uint32_t raw) override;
  void reset() override;
  std::uint64_t voice_count() const override { return 0; }
  void set_layer_count(std::optional<std::size_t> layers) override;
  void set_soundfont(const std::filesystem::path &path) override;

private:
  using InitializeFn = bool (*)();
  using TerminateFn = bool (*)();
  using ResetFn = void (*)();
  using SendDirectDataFn = void (*)(unsigned int);

  void *library_ = nullptr;
  InitializeFn initialize_ = nullptr;
  TerminateFn terminate_ = nullptr;
  ResetFn resetStream_ = nullptr;
  SendDirectDataFn sendDirectData_ = nullptr;
};

} // namespace audio
