// src/playback/streamed_timeline.cpp
// Live-decoding timeline: one scan pass for checkpoints, then a lookahead
// deque fed by an EventMerger reading the file in place.

#include "playback/streamed_timeline.hpp"

#include <algorithm>
#include <string>

#include "common/logger.hpp"
#include "midi/smf.hpp"

namespace playback {

StreamedTimeline::StreamedTimeline(std::unique_ptr<io::ByteSource> source,
                                   const TimelineOptions &options)
    : source_(std::move(source)),
      layout_(midi::read_layout(*source_)),
      stride_(std::max<std::size_t>(1, options.checkpoint_stride)),
      lookahead_(std::max(0.0, options.lookahead)),
      held_(options.vel_ignore) {
  try {
    decoder_ = std::make_unique<midi::EventMerger>(*source_, layout_);
  } catch (const midi::DecodeError &e) {
    // Not even the first event of every track is readable
    throw midi::LoadError(std::string("Corrupt MIDI file: ") + e.what());
  }
  decoder_->set_quiet(true);
  scan(options);
}

void StreamedTimeline::scan(const TimelineOptions &options) {
  midi::EventMerger merger(*source_, layout_);
  midi::NoteTracker tracker(options.vel_ignore);
  midi::ControlTracker controls;
  midi::MidiEvent ev;

  try {
    while (true) {
      if (merger.index() % stride_ == 0) {
        checkpoints_.push_back(
            Checkpoint{merger.index() == 0 ? 0.0 : merger.last_time(),
                       merger.snapshot(), tracker.sounding(), controls});
      }
      if (!merger.next(ev))
        break;
      tracker.apply(ev);
      controls.apply(ev);
      if (midi::counts_as_note(ev, options.vel_ignore)) {
        ++totalNotes_;
      }
    }
    length_ = merger.last_time();
  } catch (const midi::DecodeError &e) {
    logging::warning("Corrupt MIDI data at byte %llu (%s); playback will stop "
                     "at %.2f s",
                     static_cast<unsigned long long>(e.offset), e.what(),
                     merger.last_time());
    failure_ = e;
  }
  decodeErrors_ = merger.decode_errors();
}

void StreamedTimeline::fill(double horizon) {
  while (!exhausted_ && (pending_.empty() || pending_.back().time <= horizon)) {
    midi::MidiEvent ev;
    try {
      if (!decoder_->next(ev)) {
        exhausted_ = true;
        break;
      }
    } catch (const midi::DecodeError &e) {
      fillFailure_ = e;
      exhausted_ = true;
      break;
    }
    pending_.push_back(ev);
  }
}

void StreamedTimeline::restore(const Checkpoint &cp) {
  pending_.clear();
  decoder_->restore(cp.state);
  exhausted_ = false;
  fillFailure_.reset();
  held_.restore(cp.held);
  controls_ = cp.controls;
}

void StreamedTimeline::consume(const midi::MidiEvent &ev) {
  held_.apply(ev);
  controls_.apply(ev);
}

void StreamedTimeline::advance(double until,
                               std::vector<midi::MidiEvent> &out) {
  if (until <= position_)
    return;
  fill(until + lookahead_);

  const std::size_t before = out.size();
  while (!pending_.empty() && pending_.front().time <= until) {
    consume(pending_.front());
    out.push_back(pending_.front());
    pending_.pop_front();
  }
  // Everything decodable has been played; the next step is the corrupt data
  if (fillFailure_ && pending_.empty() && out.size() == before) {
    throw *fillFailure_;
  }
  position_ = until;
}

void StreamedTimeline::seek(double t, std::vector<midi::SoundingNote> &sounding,
                            std::vector<std::uint32_t> &controls) {
  // 1) Closest checkpoint at or before t; checkpoint 0 is the file start
  auto it = std::upper_bound(
      checkpoints_.begin(), checkpoints_.end(), t,
      [](double time, const Checkpoint &cp) { return time < cp.time; });
  if (it != checkpoints_.begin())
    --it;

  // 2) Restore it unless the live decoder is already between it and t
  const bool backward = t < position_;
  if (backward || it->state.index > decoder_->index()) {
    restore(*it);
  }

  // 3) Decode up to t and consume without yielding
  fill(t);
  while (!pending_.empty() && pending_.front().time <= t) {
    consume(pending_.front());
    pending_.pop_front();
  }
  if (fillFailure_ && pending_.empty() && t > decoder_->last_time()) {
    throw *fillFailure_;
  }

  position_ = t;
  sounding = held_.sounding();
  controls = controls_.messages();
}

} // namespace playback
