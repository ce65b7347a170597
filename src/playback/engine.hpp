// src/playback/engine.hpp
// PlaybackEngine: clock + timeline + audio dispatch, driven once per frame.
//
// Lifecycle:
//   Idle --open--> LoadedPaused <--play/pause--> LoadedPlaying
//   any loaded state --close--> Idle
//   any loaded state --fatal decode error in tick()--> Closed --close--> Idle
//
// Each tick() reads the clock. Moving forward dispatches the events in
// (last tick, now] and updates the note colors. An explicit seek, or the
// clock moving backward, resynchronizes instead: the backend is reset, colors
// cleared, the timeline repositioned without dispatching, every channel's
// program, controllers and pitch bend replayed, and the audible notes held at
// the new position sounded again.
//
// The audio dispatch outlives sessions; it is reset whenever a session ends.

#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "audio/dispatch.hpp"
#include "midi/color.hpp"
#include "playback/clock.hpp"
#include "playback/note_colors.hpp"
#include "playback/timeline.hpp"

namespace playback {

enum class EngineState { Idle, LoadedPaused, LoadedPlaying, Closed };

const char *to_string(EngineState state);

struct LoadOptions {
  MidiLoading loading = MidiLoading::Ram;
  bool random_colors = false;
  std::size_t checkpoint_stride = 4096;
  double lookahead = 0.5;
};

struct PlaybackStats {
  std::uint64_t total_notes = 0;    // fixed at load
  std::uint64_t notes_rendered = 0; // note-ons dispatched since the last reset
  std::uint64_t voice_count = 0;    // 0 when the backend does not track it
  std::uint64_t dropped_events = 0;
  std::uint64_t decode_errors = 0;
};

class PlaybackEngine {
public:
  explicit PlaybackEngine(audio::AudioDispatch &dispatch,
                          ClockSource clock = &std::chrono::steady_clock::now);
  ~PlaybackEngine();

  PlaybackEngine(const PlaybackEngine &) = delete;
  PlaybackEngine &operator=(const PlaybackEngine &) = delete;

  // Closes the current file first. Throws midi::LoadError and stays Idle.
  void open(const std::filesystem::path &path, const LoadOptions &options);
  void open(std::unique_ptr<Timeline> timeline, const LoadOptions &options);
  void close();

  void play();
  void pause();
  void toggle_pause();
  // Takes effect on the next tick().
  void seek(Seconds target);

  // Throws midi::DecodeError after moving to Closed.
  void tick();

  EngineState state() const { return state_; }
  Seconds get_time() const;
  std::optional<double> midi_length() const;
  PlaybackStats stats() const;
  const NoteColorState &note_colors() const { return colors_; }
  // Why the last session was closed, if it failed.
  const std::optional<std::string> &last_error() const { return lastError_; }

private:
  struct Session {
    Session(const ClockSource &source, std::unique_ptr<Timeline> tl,
            bool randomColors)
        : clock(source), timeline(std::move(tl)), palette(randomColors) {}

    PlaybackClock clock;
    std::unique_ptr<Timeline> timeline;
    midi::ColorPalette palette;
    // Note-ons held back by velocity-ignore, per channel/key, so their
    // note-offs are held back too.
    std::array<std::uint32_t, 16 * 128> suppressed{};
    std::uint64_t notesRendered = 0;
    double lastTime = kBeforeStart;
    bool seekPending = false;

    std::vector<midi::MidiEvent> events;
    std::vector<midi::SoundingNote> sounding;
    std::vector<std::uint32_t> controls;
  };

  void resync(Session &s, double now);
  void dispatch(Session &s, const midi::MidiEvent &ev);
  void halt(const midi::DecodeError &e);

  audio::AudioDispatch &dispatch_;
  ClockSource clockSource_;
  std::unique_ptr<Session> session_;
  NoteColorState colors_;
  EngineState state_ = EngineState::Idle;
  std::optional<std::string> lastError_;
};

} // namespace playback
