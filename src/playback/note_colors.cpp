// src/playback/note_colors.cpp

#include "playback/note_colors.hpp"

#include <numeric>

namespace playback {

void NoteColorState::note_on(std::uint8_t key, std::uint8_t channel,
                             midi::MidiColor color) {
  key &= 0x7F;
  Holder &h = holders_[key][channel & 0x0F];
  ++h.count;
  h.order = ++stamp_;
  h.color = color;
  ++active_[key];
}

void NoteColorState::note_off(std::uint8_t key, std::uint8_t channel) {
  key &= 0x7F;
  Holder &h = holders_[key][channel & 0x0F];
  if (h.count == 0)
    return;
  --h.count;
  --active_[key];
}

void NoteColorState::clear() {
  for (auto &key : holders_) {
    key.fill(Holder{});
  }
  active_.fill(0);
  stamp_ = 0;
}

std::optional<midi::MidiColor> NoteColorState::color(std::uint8_t key) const {
  key &= 0x7F;
  if (active_[key] == 0)
    return std::nullopt;
  const Holder *latest = nullptr;
  for (const auto &h : holders_[key]) {
    if (h.count > 0 && (!latest || h.order > latest->order))
      latest = &h;
  }
  return latest->color;
}

std::uint64_t NoteColorState::active_count() const {
  return std::accumulate(active_.begin(), active_.end(), std::uint64_t{0});
}

std::vector<std::optional<midi::MidiColor>> NoteColorState::colors() const {
  std::vector<std::optional<midi::MidiColor>> out(kKeyCount);
  for (std::size_t k = 0; k < kKeyCount; ++k) {
    out[k] = color(static_cast<std::uint8_t>(k));
  }
  return out;
}

} // namespace playback
