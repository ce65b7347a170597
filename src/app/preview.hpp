// src/app/preview.hpp
// Compact console output for the headless player.
// - print_summary: file name, length, note count, backend
// - print_stats: one status line per second while playing

#pragma once
#include <iomanip>
#include <iostream>
#include <optional>

#include "audio/dispatch.hpp"
#include "playback/engine.hpp"

namespace app {

inline void print_summary(const std::filesystem::path &midiPath,
                          const playback::PlaybackEngine &engine,
                          const audio::AudioDispatch &dispatch) {
  const playback::PlaybackStats st = engine.stats();
  std::cout << "File:    " << midiPath.filename().string() << "\n";
  if (const std::optional<double> len = engine.midi_length()) {
    std::cout << "Length:  " << std::fixed << std::setprecision(2) << *len
              << " s\n";
  } else {
    std::cout << "Length:  unknown\n";
  }
  std::cout << "Notes:   " << st.total_notes << "\n";
  if (st.decode_errors != 0) {
    std::cout << "Skipped: " << st.decode_errors << " malformed events\n";
  }
  std::cout << "Synth:   " << audio::to_string(dispatch.kind()) << "\n";
}

inline void print_stats(const playback::PlaybackEngine &engine) {
  const playback::PlaybackStats st = engine.stats();
  std::cout << "t=" << std::fixed << std::setprecision(1)
            << engine.get_time().count() << "s  notes " << st.notes_rendered
            << "/" << st.total_notes << "  voices " << st.voice_count;
  if (st.dropped_events != 0) {
    std::cout << "  dropped " << st.dropped_events;
  }
  std::cout << "\n";
}

} // namespace app
