// src/main.cpp
// Headless player: parse the command line, start the audio backend, open the
// file and drive the playback engine at roughly display rate until the song
// (plus a short tail) has played.

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

#include "app/cli.hpp"
#include "app/preview.hpp"
#include "audio/factory.hpp"
#include "common/logger.hpp"
#include "playback/engine.hpp"

namespace {

constexpr auto kFrame = std::chrono::microseconds(16667); // ~60 ticks/s
constexpr double kTailSec = 2.0; // played after the last event

int run(int argc, char **argv) {
  const app::Cli cli = app::parse_cli(argc, argv);

  auto dispatch = audio::make_dispatch(cli.synth);

  playback::PlaybackEngine engine(*dispatch);
  playback::LoadOptions options;
  options.loading = cli.midi.midi_loading;
  options.random_colors = cli.midi.random_colors;
  engine.open(cli.midiPath, options);

  app::print_summary(cli.midiPath, engine, *dispatch);

  if (cli.midi.start > 0.0) {
    engine.seek(playback::Seconds(cli.midi.start));
  }
  engine.play();

  // A streamed file that failed its scan has no known length; it plays until
  // tick() throws at the damaged spot.
  const std::optional<double> length = engine.midi_length();
  auto nextStats = std::chrono::steady_clock::now();
  while (!length || engine.get_time().count() < *length + kTailSec) {
    engine.tick();

    const auto now = std::chrono::steady_clock::now();
    if (now >= nextStats) {
      app::print_stats(engine);
      nextStats = now + std::chrono::seconds(1);
    }
    std::this_thread::sleep_for(kFrame);
  }

  app::print_stats(engine);
  engine.close();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  int code = 1;
  try {
    code = run(argc, argv);
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
  }
  logging::flush();
  return code;
}
