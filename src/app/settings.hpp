// src/app/settings.hpp
// How the MIDI file itself is loaded and shown. Audio settings live in
// audio/synth_settings.hpp.

#pragma once
#include "playback/timeline.hpp"

namespace app {

struct MidiSettings {
  playback::MidiLoading midi_loading = playback::MidiLoading::Ram;
  bool random_colors = false; // otherwise one hue per channel
  double start = 0.0;         // seconds; playback starts here
};

} // namespace app
