// src/audio/dispatch.cpp

#include "audio/dispatch.hpp"

#include <stdexcept>

#include "common/logger.hpp"

namespace audio {

const char *to_string(SynthKind kind) {
  switch (kind) {
  case SynthKind::XSynth:
    return "xsynth";
  case SynthKind::Kdmapi:
    return "kdmapi";
  }
  return "unknown";
}

AudioDispatch::AudioDispatch(SynthKind kind,
                             std::unique_ptr<SynthBackend> backend,
                             std::optional<midi::VelocityRange> velIgnore)
    : kind_(kind), backend_(std::move(backend)), velIgnore_(velIgnore) {
  if (!backend_)
    throw std::runtime_error("AudioDispatch needs a backend");
}

bool AudioDispatch::push_event(std::uint32_t raw) {
  const midi::MidiEvent ev{0.0, raw, 0};
  if (ev.is_note_on() && suppresses(ev.data2()))
    return false;

  if (backend_->push_event(raw))
    return true;

  const std::uint64_t dropped =
      dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
  // Reported at 1, 2, 4, 8, ... drops
  if ((dropped & (dropped - 1)) == 0) {
    logging::warning("%s: event queue full, %llu events dropped so far",
                     backend_->name(), static_cast<unsigned long long>(dropped));
  }
  return false;
}

void AudioDispatch::reset() { backend_->reset(); }

std::uint64_t AudioDispatch::get_voice_count() const {
  return backend_->voice_count();
}

void AudioDispatch::set_layer_count(std::optional<std::size_t> layers) {
  backend_->set_layer_count(layers);
}

void AudioDispatch::set_soundfont(const std::filesystem::path &path) {
  backend_->set_soundfont(path);
}

} // namespace audio
