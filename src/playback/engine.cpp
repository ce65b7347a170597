// src/playback/engine.cpp
// Session lifecycle and the per-frame tick: advance or resync the timeline,
// then route each event to the audio dispatch and the note colors.

#include "playback/engine.hpp"

#include <algorithm>

#include "common/logger.hpp"

namespace playback {

const char *to_string(EngineState state) {
  switch (state) {
  case EngineState::Idle:
    return "idle";
  case EngineState::LoadedPaused:
    return "paused";
  case EngineState::LoadedPlaying:
    return "playing";
  case EngineState::Closed:
    return "closed";
  }
  return "unknown";
}

PlaybackEngine::PlaybackEngine(audio::AudioDispatch &dispatch,
                               ClockSource clock)
    : dispatch_(dispatch), clockSource_(std::move(clock)) {}

PlaybackEngine::~PlaybackEngine() { close(); }

void PlaybackEngine::open(const std::filesystem::path &path,
                          const LoadOptions &options) {
  close();

  TimelineOptions tlOptions;
  tlOptions.vel_ignore = dispatch_.velocity_ignore();
  tlOptions.checkpoint_stride = options.checkpoint_stride;
  tlOptions.lookahead = options.lookahead;

  open(open_timeline(path, options.loading, tlOptions), options);
}

void PlaybackEngine::open(std::unique_ptr<Timeline> timeline,
                          const LoadOptions &options) {
  close();
  session_ = std::make_unique<Session>(clockSource_, std::move(timeline),
                                       options.random_colors);
  lastError_.reset();
  state_ = EngineState::LoadedPaused;
}

void PlaybackEngine::close() {
  if (session_) {
    // The backend must be silent before the timeline goes away
    dispatch_.reset();
    session_.reset();
  }
  colors_.clear();
  state_ = EngineState::Idle;
}

void PlaybackEngine::play() {
  if (!session_)
    return;
  session_->clock.play();
  state_ = EngineState::LoadedPlaying;
}

void PlaybackEngine::pause() {
  if (!session_)
    return;
  session_->clock.pause();
  state_ = EngineState::LoadedPaused;
}

void PlaybackEngine::toggle_pause() {
  if (state_ == EngineState::LoadedPlaying)
    pause();
  else
    play();
}

void PlaybackEngine::seek(Seconds target) {
  if (!session_)
    return;
  Session &s = *session_;
  s.clock.seek(target);
  const double t = std::max(0.0, target.count());
  if (t != s.lastTime)
    s.seekPending = true;
}

void PlaybackEngine::tick() {
  if (!session_)
    return;
  Session &s = *session_;
  const double now = s.clock.get_time().count();

  try {
    // 1) Explicit seek or the clock went backward: rebuild from scratch
    if (s.seekPending || now < s.lastTime) {
      resync(s, now);
    } else if (now > s.lastTime) {
      // 2) Forward: dispatch (lastTime, now] in timeline order
      s.events.clear();
      s.timeline->advance(now, s.events);
      for (const auto &ev : s.events) {
        dispatch(s, ev);
      }
      s.lastTime = now;
    }
  } catch (const midi::DecodeError &e) {
    halt(e);
    throw;
  }
}

void PlaybackEngine::resync(Session &s, double now) {
  // --- silence everything from the old position ---
  dispatch_.reset();
  colors_.clear();
  s.suppressed.fill(0);
  s.notesRendered = 0;

  // --- reposition ---
  s.sounding.clear();
  s.controls.clear();
  s.timeline->seek(now, s.sounding, s.controls);

  // 1) Channel state first so the notes below use the right program
  for (const auto raw : s.controls) {
    dispatch_.push_event(raw);
  }

  // 2) Sound the held layers again. Ignored layers only need their
  //    note-offs swallowed later.
  for (const auto &note : s.sounding) {
    const std::size_t slot = note.channel * 128u + (note.key & 0x7F);
    s.suppressed[slot] = note.layers - note.audible;

    const midi::MidiEvent on{
        now,
        midi::pack(static_cast<std::uint8_t>(0x90 | note.channel), note.key,
                   note.audibleVelocity),
        0};
    for (std::uint32_t layer = 0; layer < note.audible; ++layer) {
      dispatch(s, on);
    }
  }

  s.lastTime = now;
  s.seekPending = false;
}

void PlaybackEngine::dispatch(Session &s, const midi::MidiEvent &ev) {
  const std::size_t slot = ev.channel() * 128u + (ev.data1() & 0x7F);

  if (ev.is_note_on()) {
    if (dispatch_.suppresses(ev.data2())) {
      ++s.suppressed[slot];
      return;
    }
    if (dispatch_.push_event(ev.raw))
      ++s.notesRendered;
    colors_.note_on(ev.data1(), ev.channel(),
                    s.palette.color_for(ev.channel()));
  } else if (ev.is_note_off()) {
    if (s.suppressed[slot] > 0) {
      --s.suppressed[slot];
      return;
    }
    dispatch_.push_event(ev.raw);
    colors_.note_off(ev.data1(), ev.channel());
  } else {
    dispatch_.push_event(ev.raw);
  }
}

void PlaybackEngine::halt(const midi::DecodeError &e) {
  logging::error("Playback stopped: %s (byte %llu)", e.what(),
                 static_cast<unsigned long long>(e.offset));
  dispatch_.reset();
  session_.reset();
  colors_.clear();
  lastError_ = e.what();
  state_ = EngineState::Closed;
}

Seconds PlaybackEngine::get_time() const {
  if (!session_)
    return Seconds(0.0);
  return session_->clock.get_time();
}

std::optional<double> PlaybackEngine::midi_length() const {
  if (!session_)
    return std::nullopt;
  return session_->timeline->length();
}

PlaybackStats PlaybackEngine::stats() const {
  PlaybackStats out;
  out.voice_count = dispatch_.get_voice_count();
  out.dropped_events = dispatch_.dropped_events();
  if (session_) {
    out.total_notes = session_->timeline->total_notes();
    out.notes_rendered = session_->notesRendered;
    out.decode_errors = session_->timeline->decode_errors();
  }
  return out;
}

} // namespace playback
