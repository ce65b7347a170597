// src/audio/factory.cpp

#include "audio/factory.hpp"

#include "audio/kdmapi_synth.hpp"
#include "audio/soundfont_synth.hpp"

namespace audio {

std::unique_ptr<AudioDispatch> make_dispatch(const SynthSettings &settings) {
  std::unique_ptr<SynthBackend> backend;
  switch (settings.synth) {
  case SynthKind::XSynth:
    backend = std::make_unique<SoundfontSynth>(settings);
    break;
  case SynthKind::Kdmapi:
    backend = std::make_unique<KdmapiSynth>();
    break;
  }
  return std::make_unique<AudioDispatch>(settings.synth, std::move(backend),
                                         settings.vel_ignore);
}

} // namespace audio
