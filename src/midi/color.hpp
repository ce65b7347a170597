// src/midi/color.hpp
// Note colors for the piano roll and keyboard highlighting.
//  - MidiColor: plain RGB.
//  - ColorPalette: one color per MIDI channel, materialized the first time a
//    note-on on that channel asks for it. Per-channel hues are spread evenly
//    around the color wheel; with random colors each channel gets a random
//    bright color instead.

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <random>

namespace midi {

struct MidiColor {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  std::uint8_t red() const { return r; }
  std::uint8_t green() const { return g; }
  std::uint8_t blue() const { return b; }
};

inline bool operator==(const MidiColor &a, const MidiColor &b) {
  return a.r == b.r && a.g == b.g && a.b == b.b;
}
inline bool operator!=(const MidiColor &a, const MidiColor &b) {
  return !(a == b);
}

// Fully saturated color for a hue in degrees [0, 360).
MidiColor color_from_hue(double hue);

class ColorPalette {
public:
  explicit ColorPalette(bool randomColors,
                        std::uint32_t seed = std::random_device{}());

  MidiColor color_for(std::uint8_t channel);
  bool random_colors() const { return random_; }

private:
  bool random_;
  std::mt19937 rng_;
  std::array<std::optional<MidiColor>, 16> colors_{};
};

} // namespace midi
