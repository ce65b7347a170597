// src/midi/color.cpp

#include "midi/color.hpp"

#include <cmath>

namespace midi {

MidiColor color_from_hue(double hue) {
  // HSV -> RGB with S = V = 1
  const double h = std::fmod(std::fmod(hue, 360.0) + 360.0, 360.0) / 60.0;
  const double x = 1.0 - std::fabs(std::fmod(h, 2.0) - 1.0);
  double r = 0, g = 0, b = 0;
  switch (static_cast<int>(h)) {
  case 0: r = 1; g = x; break;
  case 1: r = x; g = 1; break;
  case 2: g = 1; b = x; break;
  case 3: g = x; b = 1; break;
  case 4: r = x; b = 1; break;
  default: r = 1; b = x; break;
  }
  auto to8 = [](double v) {
    return static_cast<std::uint8_t>(std::lround(v * 255.0));
  };
  return MidiColor{to8(r), to8(g), to8(b)};
}

ColorPalette::ColorPalette(bool randomColors, std::uint32_t seed)
    : random_(randomColors), rng_(seed) {}

MidiColor ColorPalette::color_for(std::uint8_t channel) {
  auto &slot = colors_[channel & 0x0F];
  if (!slot) {
    if (random_) {
      // Random hue, kept bright so notes stand out on a dark background
      std::uniform_real_distribution<double> hue(0.0, 360.0);
      slot = color_from_hue(hue(rng_));
    } else {
      // 16 channels spread around the wheel; step by 7 so neighbours differ
      slot = color_from_hue(((channel & 0x0F) * 7 % 16) * (360.0 / 16.0));
    }
  }
  return *slot;
}

} // namespace midi
