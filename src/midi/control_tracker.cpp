// src/midi/control_tracker.cpp
// Track the last program, controller values and pitch bend per channel.

#include "midi/control_tracker.hpp"

namespace midi {
namespace {

constexpr std::uint8_t kResetAllControllers = 121;
constexpr std::uint8_t kVolume = 7;
constexpr std::uint8_t kPan = 10;
constexpr int kDefaultVolume = 100;
constexpr int kDefaultPan = 64;
constexpr int kBendCenter = 0x2000;

} // namespace

void ControlTracker::clear() {
  for (auto &ch : channels_) {
    reset_controllers(ch);
    ch.program = -1;
  }
}

void ControlTracker::reset_controllers(Channel &ch) {
  ch.cc.fill(-1);
  ch.bend = -1;
}

void ControlTracker::apply(const MidiEvent &ev) {
  Channel &ch = channels_[ev.channel()];
  switch (ev.type()) {
  case 0xB0:
    if (ev.data1() == kResetAllControllers) {
      reset_controllers(ch);
    } else if (ev.data1() < kControllers) {
      ch.cc[ev.data1()] = ev.data2() & 0x7F;
    }
    break;
  case 0xC0:
    ch.program = ev.data1() & 0x7F;
    break;
  case 0xE0:
    ch.bend = static_cast<std::int16_t>((ev.data1() & 0x7F) |
                                        ((ev.data2() & 0x7F) << 7));
    break;
  default:
    break;
  }
}

int ControlTracker::controller(std::uint8_t channel, std::uint8_t cc) const {
  if (cc >= kControllers)
    return -1;
  return channels_[channel & 0x0F].cc[cc];
}

std::vector<std::uint32_t> ControlTracker::messages() const {
  std::vector<std::uint32_t> out;
  for (std::uint8_t c = 0; c < 16; ++c) {
    const Channel &ch = channels_[c];
    const auto control = static_cast<std::uint8_t>(0xB0 | c);

    // 1) Start from a clean slate
    out.push_back(pack(control, kResetAllControllers, 0));

    // 2) Controllers, with defaults for the ones Reset All Controllers
    //    leaves alone
    for (std::uint8_t cc = 0; cc < kControllers; ++cc) {
      int value = ch.cc[cc];
      if (value < 0 && cc == kVolume)
        value = kDefaultVolume;
      if (value < 0 && cc == kPan)
        value = kDefaultPan;
      if (value >= 0)
        out.push_back(pack(control, cc, static_cast<std::uint8_t>(value)));
    }

    // 3) Program and pitch bend
    const int program = ch.program < 0 ? 0 : ch.program;
    out.push_back(pack(static_cast<std::uint8_t>(0xC0 | c),
                       static_cast<std::uint8_t>(program)));
    const int bend = ch.bend < 0 ? kBendCenter : ch.bend;
    out.push_back(pack(static_cast<std::uint8_t>(0xE0 | c),
                       static_cast<std::uint8_t>(bend & 0x7F),
                       static_cast<std::uint8_t>((bend >> 7) & 0x7F)));
  }
  return out;
}

} // namespace midi
