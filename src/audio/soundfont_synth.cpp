// src/audio/soundfont_synth.cpp
// Turn queued MIDI messages into sound with TinySoundFont + miniaudio.

#define TSF_IMPLEMENTATION
#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"
#include "tsf.h"

#include "audio/soundfont_synth.hpp"

#include <array>
#include <atomic>
#include <stdexcept>
#include <string>

#include "audio/event_queue.hpp"
#include "common/logger.hpp"

namespace audio {
namespace {

constexpr ma_uint32 kSampleRate = 44100; // safe, common default
constexpr std::size_t kQueueCapacity = 65536;
constexpr int kMaxVoices = 512;
constexpr float kVolume = 0.8f; // modest headroom

// Load a soundfont and prepare it for rendering. Runs on the control thread:
// everything that allocates happens here, never in the callback.
tsf *load_soundfont(const std::filesystem::path &path) {
  tsf *synth = tsf_load_filename(path.string().c_str());
  if (synth == nullptr)
    throw std::runtime_error("Failed to load SoundFont: " + path.string());

  tsf_set_output(synth, TSF_STEREO_INTERLEAVED, static_cast<int>(kSampleRate),
                 0.0f);
  tsf_set_volume(synth, kVolume);
  tsf_set_max_voices(synth, kMaxVoices);

  // GM1 Acoustic Grand everywhere until a Program Change says otherwise;
  // channel 10 gets the drum kit.
  for (int ch = 0; ch < 16; ++ch) {
    tsf_channel_set_presetnumber(synth, ch, 0, ch == 9);
  }
  return synth;
}

} // namespace

struct SoundfontSynth::Impl {
  explicit Impl(const SynthSettings &settings)
      : queue(kQueueCapacity), fadeOutKill(settings.fade_out_kill) {
    const auto limit = settings.layer_limit();
    layerLimit.store(limit ? *limit : 0, std::memory_order_relaxed);
  }

  // --- audio thread only ---
  tsf *synth = nullptr;
  std::array<std::uint32_t, 16 * 128> layers{}; // note-ons held per ch/key

  // --- shared ---
  EventQueue queue;
  std::atomic<tsf *> pending{nullptr}; // new soundfont waiting to be adopted
  std::atomic<tsf *> retired{nullptr}; // old soundfont waiting to be freed
  std::atomic<std::size_t> layerLimit{0}; // 0 = unlimited
  std::atomic<std::uint64_t> voices{0};
  bool fadeOutKill;

  ma_device device;

  static void data_callback(ma_device *device, void *pOutput,
                            const void *pInput, ma_uint32 frameCount);
  void adopt_pending_soundfont();
  void apply_event(std::uint32_t raw);
  void kill_voices();
};

void SoundfontSynth::Impl::adopt_pending_soundfont() {
  // The control thread has not freed the previous one yet
  if (retired.load(std::memory_order_acquire) != nullptr)
    return;
  tsf *next = pending.exchange(nullptr, std::memory_order_acq_rel);
  if (next == nullptr)
    return;
  retired.store(synth, std::memory_order_release);
  synth = next;
  layers.fill(0);
}

void SoundfontSynth::Impl::kill_voices() {
  if (fadeOutKill) {
    // Release phase, like a Note Off on every key
    tsf_note_off_all(synth);
  } else {
    for (int ch = 0; ch < 16; ++ch) {
      tsf_channel_sounds_off_all(synth, ch);
    }
  }
  layers.fill(0);
}

void SoundfontSynth::Impl::apply_event(std::uint32_t raw) {
  const int status = raw & 0xFF;
  const int ch = status & 0x0F;
  const int d1 = (raw >> 8) & 0x7F;
  const int d2 = (raw >> 16) & 0x7F;
  std::uint32_t &held = layers[ch * 128 + d1];

  switch (status & 0xF0) {
  case 0x90:
    if (d2 != 0) {
      // Over the layer limit: drop the oldest voice on this key first
      const std::size_t limit = layerLimit.load(std::memory_order_relaxed);
      if (limit != 0 && held >= limit) {
        tsf_channel_note_off(synth, ch, d1);
        --held;
      }
      tsf_channel_note_on(synth, ch, d1, d2 / 127.0f);
      ++held;
      break;
    }
    // Note On with velocity 0 is a Note Off
    [[fallthrough]];
  case 0x80:
    if (held > 0) {
      tsf_channel_note_off(synth, ch, d1);
      --held;
    }
    break;
  case 0xB0:
    tsf_channel_midi_control(synth, ch, d1, d2);
    break;
  case 0xC0:
    tsf_channel_set_presetnumber(synth, ch, d1, ch == 9);
    break;
  case 0xE0:
    tsf_channel_set_pitchwheel(synth, ch, d1 | (d2 << 7));
    break;
  default:
    // Aftertouch: TinySoundFont has no use for it
    break;
  }
}

// Real-time callback: apply queued events, then render interleaved stereo s16.
void SoundfontSynth::Impl::data_callback(ma_device *device, void *pOutput,
                                         const void * /*pInput*/,
                                         ma_uint32 frameCount) {
  auto *st = reinterpret_cast<Impl *>(device->pUserData);
  short *out = reinterpret_cast<short *>(pOutput);

  st->adopt_pending_soundfont();
  st->queue.drain([st] { st->kill_voices(); },
                  [st](std::uint32_t raw) { st->apply_event(raw); });

  tsf_render_short(st->synth, out, static_cast<int>(frameCount), 0);
  st->voices.store(static_cast<std::uint64_t>(tsf_active_voice_count(st->synth)),
                   std::memory_order_relaxed);
}

SoundfontSynth::SoundfontSynth(const SynthSettings &settings)
    : impl_(std::make_unique<Impl>(settings)) {
  if (settings.linear_envelope) {
    logging::warning("xsynth: linear envelopes are not supported by "
                     "TinySoundFont; using SoundFont envelopes");
  }
  if (settings.use_effects) {
    logging::info("xsynth: TinySoundFont renders without reverb/chorus");
  }

  impl_->synth = load_soundfont(settings.sfz_path);

  // --- Miniaudio device setup ---
  ma_device_config config = ma_device_config_init(ma_device_type_playback);
  config.playback.format = ma_format_s16; // matches tsf_render_short
  config.playback.channels = 2;           // stereo
  config.sampleRate = kSampleRate;
  config.periodSizeInMilliseconds = settings.buffer_ms;
  config.dataCallback = Impl::data_callback;
  config.pUserData = impl_.get();

  if (ma_device_init(nullptr, &config, &impl_->device) != MA_SUCCESS) {
    tsf_close(impl_->synth);
    throw std::runtime_error("Failed to open playback device");
  }

  if (ma_device_start(&impl_->device) != MA_SUCCESS) {
    ma_device_uninit(&impl_->device);
    tsf_close(impl_->synth);
    throw std::runtime_error("Failed to start playback device");
  }

  logging::info("xsynth: %s, %u ms buffer, layer limit %zu",
                settings.sfz_path.filename().string().c_str(),
                static_cast<unsigned>(settings.buffer_ms),
                impl_->layerLimit.load(std::memory_order_relaxed));
}

SoundfontSynth::~SoundfontSynth() {
  // Stops the callback; after this every pointer is ours again
  ma_device_uninit(&impl_->device);
  tsf_close(impl_->synth);
  if (tsf *p = impl_->pending.exchange(nullptr))
    tsf_close(p);
  if (tsf *r = impl_->retired.exchange(nullptr))
    tsf_close(r);
}

bool SoundfontSynth::push_event(std::uint32_t raw) {
  return impl_->queue.push(raw);
}

void SoundfontSynth::reset() { impl_->queue.reset(); }

std::uint64_t SoundfontSynth::voice_count() const {
  return impl_->voices.load(std::memory_order_relaxed);
}

void SoundfontSynth::set_layer_count(std::optional<std::size_t> layers) {
  impl_->layerLimit.store(layers ? *layers : 0, std::memory_order_relaxed);
}

void SoundfontSynth::set_soundfont(const std::filesystem::path &path) {
  tsf *fresh = load_soundfont(path);

  // Free whatever the callback handed back from an earlier swap
  if (tsf *old = impl_->retired.exchange(nullptr, std::memory_order_acq_rel))
    tsf_close(old);

  // A soundfont published earlier but never adopted is ours to free
  if (tsf *stale = impl_->pending.exchange(fresh, std::memory_order_acq_rel))
    tsf_close(stale);

  logging::info("xsynth: soundfont set to %s",
                path.filename().string().c_str());
}

} // namespace audio
