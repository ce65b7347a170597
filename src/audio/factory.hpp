// src/audio/factory.hpp
// Build the configured backend wrapped in its dispatch façade.

#pragma once
#include <memory>

#include "audio/dispatch.hpp"
#include "audio/synth_settings.hpp"

namespace audio {

// Throws std::runtime_error when the backend cannot start.
std::unique_ptr<AudioDispatch> make_dispatch(const SynthSettings &settings);

} // namespace audio
