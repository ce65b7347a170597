// src/app/cli.hpp
// Minimal, robust CLI parsing for the headless player.
// Responsibilities:
//  - Extract the positional MIDI path.
//  - Fill SynthSettings / MidiSettings from the optional flags.
//  - Resolve the SoundFont (by name under ./soundfonts/, or by path).
//  - Validate early with a clear error.
//
// Header-only; throws std::runtime_error on problems, main() catches and
// prints.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   cli.midiPath  --> std::filesystem::path to the .mid file
//   cli.synth     --> audio::SynthSettings
//   cli.midi      --> app::MidiSettings

#pragma once
#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/settings.hpp"
#include "audio/synth_settings.hpp"

namespace app {

struct Cli {
  std::filesystem::path midiPath;
  audio::SynthSettings synth;
  MidiSettings midi;
};

inline const char *kSoundfontDir = "soundfonts";

inline std::string usage(const std::string &argv0) {
  return "Usage:\n  " + argv0 +
         " <file.mid> [options]\n"
         "Options:\n"
         "  --sf <name-or-path>   SoundFont by name (in soundfonts/) or path\n"
         "  --synth xsynth|kdmapi Audio backend (default xsynth)\n"
         "  --buffer-ms <N>       Audio buffer length (default 10)\n"
         "  --layers <N>|none     Voices per channel/key (default 4)\n"
         "  --vel-ignore <lo,hi>  Skip note-ons with velocity in [lo, hi]\n"
         "  --live                Stream the file instead of loading it\n"
         "  --random-colors       Random note colors per channel\n"
         "  --start <SEC>         Start position in seconds\n"
         "  --no-fade-kill        Cut voices on reset instead of releasing\n"
         "  --linear-envelope     Linear envelopes (if the synth has them)\n"
         "  --no-effects          Disable synth effects\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline unsigned long parse_uint(const std::string &flag,
                                const std::string &value) {
  std::size_t used = 0;
  unsigned long v = 0;
  try {
    v = std::stoul(value, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used != value.size() || value.empty() || value[0] == '-') {
    throw std::runtime_error(flag + " expects a non-negative integer, got '" +
                             value + "'");
  }
  return v;
}

inline double parse_seconds(const std::string &flag, const std::string &value) {
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(value, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used != value.size() || value.empty() || v < 0.0) {
    throw std::runtime_error(flag + " expects seconds >= 0, got '" + value +
                             "'");
  }
  return v;
}

// "lo,hi" with 0 <= lo <= hi <= 127
inline midi::VelocityRange parse_velocity_range(const std::string &value) {
  const auto comma = value.find(',');
  if (comma == std::string::npos) {
    throw std::runtime_error("--vel-ignore expects lo,hi");
  }
  const unsigned long lo = parse_uint("--vel-ignore", value.substr(0, comma));
  const unsigned long hi = parse_uint("--vel-ignore", value.substr(comma + 1));
  if (lo > hi || hi > 127) {
    throw std::runtime_error("--vel-ignore range must satisfy 0 <= lo <= hi "
                             "<= 127");
  }
  return midi::VelocityRange{static_cast<std::uint8_t>(lo),
                             static_cast<std::uint8_t>(hi)};
}

// A name or path given with --sf, or the first .sf2 in soundfonts/.
inline std::filesystem::path
resolve_soundfont(const std::optional<std::string> &nameOrPath,
                  const std::filesystem::path &dir = kSoundfontDir) {
  namespace fs = std::filesystem;
  if (nameOrPath) {
    const fs::path asGiven = *nameOrPath;
    const std::vector<fs::path> candidates = {
        asGiven, dir / asGiven, dir / (asGiven.string() + ".sf2")};
    for (const auto &c : candidates) {
      if (fs::is_regular_file(c))
        return c;
    }
    throw std::runtime_error("SoundFont not found: " + *nameOrPath);
  }

  std::vector<fs::path> found;
  if (fs::is_directory(dir)) {
    for (const auto &entry : fs::directory_iterator(dir)) {
      if (entry.is_regular_file() && entry.path().extension() == ".sf2")
        found.push_back(entry.path());
    }
  }
  if (found.empty()) {
    throw std::runtime_error("No SoundFont given and none found in " +
                             dir.string() + "/ (use --sf)");
  }
  std::sort(found.begin(), found.end());
  return found.front();
}

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] must be the MIDI file path (positional).
//  - Throws std::runtime_error on any invalid input.
inline Cli parse_cli(int argc, char **argv) {
  if (argc < 2) {
    throw std::runtime_error(usage(argv[0]));
  }

  // 1) Positional MIDI path
  std::filesystem::path midiPath = argv[1];
  if (midiPath == "--help" || midiPath == "-h") {
    throw std::runtime_error(usage(argv[0]));
  }
  if (is_flag_like(midiPath.string())) {
    throw std::runtime_error(
        "First argument must be a MIDI file path, not a flag.");
  }
  if (!std::filesystem::exists(midiPath) ||
      !std::filesystem::is_regular_file(midiPath)) {
    throw std::runtime_error("MIDI file not found: " + midiPath.string());
  }

  // 2) Optional flags
  Cli cli;
  std::optional<std::string> sfOverride;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::runtime_error(a + " requires a value");
      }
      return argv[++i];
    };

    if (a == "--help" || a == "-h") {
      throw std::runtime_error(usage(argv[0]));
    } else if (a == "--sf") {
      sfOverride = value();
    } else if (a == "--synth") {
      const std::string v = value();
      if (v == "xsynth")
        cli.synth.synth = audio::SynthKind::XSynth;
      else if (v == "kdmapi")
        cli.synth.synth = audio::SynthKind::Kdmapi;
      else
        throw std::runtime_error("--synth must be xsynth or kdmapi");
    } else if (a == "--buffer-ms") {
      const unsigned long ms = parse_uint(a, value());
      if (ms == 0 || ms > 1000)
        throw std::runtime_error("--buffer-ms must be in 1..1000");
      cli.synth.buffer_ms = static_cast<std::uint32_t>(ms);
    } else if (a == "--layers") {
      const std::string v = value();
      if (v == "none") {
        cli.synth.limit_layers = false;
      } else {
        const unsigned long n = parse_uint(a, v);
        if (n == 0)
          throw std::runtime_error("--layers must be at least 1 (or none)");
        cli.synth.limit_layers = true;
        cli.synth.layer_count = n;
      }
    } else if (a == "--vel-ignore") {
      cli.synth.vel_ignore = parse_velocity_range(value());
    } else if (a == "--live") {
      cli.midi.midi_loading = playback::MidiLoading::Live;
    } else if (a == "--random-colors") {
      cli.midi.random_colors = true;
    } else if (a == "--start") {
      cli.midi.start = parse_seconds(a, value());
    } else if (a == "--no-fade-kill") {
      cli.synth.fade_out_kill = false;
    } else if (a == "--linear-envelope") {
      cli.synth.linear_envelope = true;
    } else if (a == "--no-effects") {
      cli.synth.use_effects = false;
    } else {
      throw std::runtime_error("Unknown option: " + a);
    }
  }

  // 3) The soundfont only matters for the built-in synth
  if (cli.synth.synth == audio::SynthKind::XSynth) {
    cli.synth.sfz_path = resolve_soundfont(sfOverride);
  }

  cli.midiPath = std::filesystem::canonical(midiPath); // nice absolute path
  return cli;
}

} // namespace app
