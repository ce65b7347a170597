// src/midi/event_merger.cpp

#include "midi/event_merger.hpp"

namespace midi {

EventMerger::EventMerger(io::ByteSource &src, const SmfLayout &layout)
    : tempo_(layout.header) {
  cursors_.reserve(layout.tracks.size());
  for (std::size_t i = 0; i < layout.tracks.size(); ++i) {
    cursors_.emplace_back(src, layout.fileSize, layout.tracks[i],
                          static_cast<std::uint16_t>(i));
  }
  rewind();
}

void EventMerger::rewind() {
  for (auto &c : cursors_) {
    c.rewind();
  }
  tempo_.restore(TempoSeg{0u, 0.0, 500000.0});
  index_ = 0;
  lastTime_ = 0.0;
  failure_.reset();
  rebuild_heap();
}

void EventMerger::rebuild_heap() {
  heads_ = decltype(heads_)();
  for (const auto &c : cursors_) {
    if (c.has_head()) {
      heads_.emplace(c.head().tick, c.index());
    }
  }
}

bool EventMerger::next(MidiEvent &out) {
  if (failure_)
    throw *failure_;
  while (!heads_.empty()) {
    const HeadKey top = heads_.top();
    heads_.pop();

    TrackCursor &cursor = cursors_[top.second];
    const TrackItem item = cursor.head();
    const double time = tempo_.seconds_at(item.tick);
    lastTime_ = time;

    // The item in hand is intact even when decoding the one after it fails;
    // hand it out first and report the failure on the following call
    try {
      cursor.pop();
    } catch (const DecodeError &e) {
      failure_ = e;
    }
    if (!failure_ && cursor.has_head()) {
      heads_.emplace(cursor.head().tick, cursor.index());
    }

    switch (item.kind) {
    case TrackItem::Kind::Tempo:
      tempo_.set_tempo(item.tick, item.usPerQN);
      break;
    case TrackItem::Kind::EndOfTrack:
      break;
    case TrackItem::Kind::Channel:
      out = MidiEvent{time, item.raw, cursor.index()};
      ++index_;
      return true;
    }
    if (failure_)
      throw *failure_;
  }
  return false;
}

MergerState EventMerger::snapshot() const {
  MergerState state;
  state.tracks.reserve(cursors_.size());
  for (const auto &c : cursors_) {
    state.tracks.push_back(c.head_state());
  }
  state.tempo = tempo_.segment();
  state.index = index_;
  state.lastTime = lastTime_;
  return state;
}

void EventMerger::restore(const MergerState &state) {
  for (std::size_t i = 0; i < cursors_.size() && i < state.tracks.size();
       ++i) {
    cursors_[i].restore(state.tracks[i]);
  }
  tempo_.restore(state.tempo);
  index_ = state.index;
  lastTime_ = state.lastTime;
  failure_.reset();
  rebuild_heap();
}

std::uint64_t EventMerger::decode_errors() const {
  std::uint64_t total = 0;
  for (const auto &c : cursors_) {
    total += c.decode_errors();
  }
  return total;
}

void EventMerger::set_quiet(bool quiet) {
  for (auto &c : cursors_) {
    c.set_quiet(quiet);
  }
}

} // namespace midi
