#include <gtest/gtest.h>

#include <algorithm>

#include "audio/dispatch.hpp"
#include "fake_backend.hpp"
#include "midi/events.hpp"
#include "playback/engine.hpp"
#include "smf_builder.hpp"

using audio::AudioDispatch;
using audio::SynthKind;
using midi::pack;
using playback::EngineState;
using playback::LoadOptions;
using playback::MidiLoading;
using playback::PlaybackEngine;
using playback::Seconds;
using testing_support::BackendLog;
using testing_support::build_smf;
using testing_support::ManualClock;
using testing_support::random_song;
using testing_support::RecordingBackend;
using testing_support::single_note_song;
using testing_support::TrackBuilder;
using testing_support::write_temp;

namespace {

std::size_t count_note_ons(const std::vector<std::uint32_t> &events) {
  return static_cast<std::size_t>(
      std::count_if(events.begin(), events.end(), [](std::uint32_t raw) {
        midi::MidiEvent ev;
        ev.raw = raw;
        return ev.is_note_on();
      }));
}

std::size_t count_note_offs(const std::vector<std::uint32_t> &events) {
  return static_cast<std::size_t>(
      std::count_if(events.begin(), events.end(), [](std::uint32_t raw) {
        midi::MidiEvent ev;
        ev.raw = raw;
        return ev.is_note_off();
      }));
}

// Drop the channel state a resync replays, keep the notes.
std::vector<std::uint32_t> notes_only(const std::vector<std::uint32_t> &events) {
  std::vector<std::uint32_t> out;
  for (const auto raw : events) {
    midi::MidiEvent ev;
    ev.raw = raw;
    if (ev.is_note_on() || ev.is_note_off())
      out.push_back(raw);
  }
  return out;
}

// Key 60 on channel 0 twice, once below the ignored velocity range, then two
// note-offs half a second apart.
std::vector<std::uint8_t> ignored_layer_song() {
  TrackBuilder t;
  t.note_on(0, 0, 60, 10)
      .note_on(0, 0, 60, 100)
      .note_off(480, 0, 60)
      .note_off(480, 0, 60)
      .end(480);
  return build_smf({t}, 480);
}

} // namespace

class EngineTest : public ::testing::TestWithParam<MidiLoading> {
protected:
  void open(const std::vector<std::uint8_t> &bytes, const std::string &name) {
    LoadOptions options;
    options.loading = GetParam();
    options.checkpoint_stride = 16;
    options.lookahead = 0.1;
    engine_.open(write_temp(bytes, file_name(name)), options);
  }

  std::string file_name(const std::string &name) const {
    return name + (GetParam() == MidiLoading::Ram ? "_ram.mid" : "_live.mid");
  }

  // Frame loop at 60 Hz until the playback clock passes t.
  void run_until(double t) {
    while (engine_.get_time().count() < t) {
      wall_.advance(1.0 / 60.0);
      engine_.tick();
    }
  }

  std::shared_ptr<BackendLog> log_ = std::make_shared<BackendLog>();
  AudioDispatch dispatch_{SynthKind::XSynth,
                          std::make_unique<RecordingBackend>(log_)};
  ManualClock wall_;
  PlaybackEngine engine_{dispatch_, wall_.source()};
};

TEST_P(EngineTest, IdleEngineIgnoresControls) {
  EXPECT_EQ(engine_.state(), EngineState::Idle);
  engine_.play();
  engine_.seek(Seconds(3.0));
  engine_.tick();
  EXPECT_EQ(engine_.state(), EngineState::Idle);
  EXPECT_DOUBLE_EQ(engine_.get_time().count(), 0.0);
  EXPECT_FALSE(engine_.midi_length().has_value());
  EXPECT_EQ(engine_.stats().total_notes, 0u);
  EXPECT_TRUE(log_->events.empty());
  EXPECT_TRUE(log_->resetsAt.empty());
}

TEST_P(EngineTest, LifecycleTransitions) {
  open(single_note_song(), "lifecycle");
  EXPECT_EQ(engine_.state(), EngineState::LoadedPaused);
  ASSERT_TRUE(engine_.midi_length().has_value());
  EXPECT_DOUBLE_EQ(*engine_.midi_length(), 2.5);
  EXPECT_EQ(engine_.stats().total_notes, 1u);

  engine_.play();
  EXPECT_EQ(engine_.state(), EngineState::LoadedPlaying);
  engine_.toggle_pause();
  EXPECT_EQ(engine_.state(), EngineState::LoadedPaused);
  engine_.toggle_pause();
  EXPECT_EQ(engine_.state(), EngineState::LoadedPlaying);
  engine_.pause();
  EXPECT_EQ(engine_.state(), EngineState::LoadedPaused);

  engine_.close();
  EXPECT_EQ(engine_.state(), EngineState::Idle);
  EXPECT_EQ(log_->resetsAt.size(), 1u);
  EXPECT_STREQ(playback::to_string(engine_.state()), "idle");
}

TEST_P(EngineTest, PausedClockDoesNotMove) {
  open(single_note_song(), "paused");
  engine_.tick();
  wall_.advance(5.0);
  engine_.tick();
  EXPECT_DOUBLE_EQ(engine_.get_time().count(), 0.0);
  EXPECT_TRUE(log_->events.empty());
}

TEST_P(EngineTest, FirstTickPlaysEventsAtTimeZero) {
  TrackBuilder t;
  t.note_on(0, 2, 64, 90).note_off(480, 2, 64).end();
  open(build_smf({t}), "time_zero");

  engine_.tick();
  ASSERT_EQ(log_->events.size(), 1u);
  EXPECT_EQ(log_->events[0], pack(0x92, 64, 90));
  EXPECT_TRUE(engine_.note_colors().color(64).has_value());
}

TEST_P(EngineTest, ForwardPlayDispatchesEachWindowOnce) {
  open(single_note_song(), "forward");
  engine_.play();
  engine_.tick();
  EXPECT_TRUE(log_->events.empty());

  wall_.advance(1.0);
  engine_.tick();
  ASSERT_EQ(log_->events.size(), 1u);
  EXPECT_EQ(log_->events[0], pack(0x90, 60, 100));
  EXPECT_TRUE(engine_.note_colors().color(60).has_value());

  engine_.tick(); // same instant, nothing new
  EXPECT_EQ(log_->events.size(), 1u);

  wall_.advance(1.0);
  engine_.tick();
  ASSERT_EQ(log_->events.size(), 2u);
  EXPECT_EQ(log_->events[1], pack(0x80, 60, 0));
  EXPECT_FALSE(engine_.note_colors().color(60).has_value());
  EXPECT_TRUE(log_->resetsAt.empty());
  EXPECT_EQ(engine_.stats().notes_rendered, 1u);
}

TEST_P(EngineTest, SeekResynthesizesHeldNotes) {
  open(single_note_song(), "seek_held");

  engine_.seek(Seconds(1.5));
  EXPECT_TRUE(log_->resetsAt.empty()); // applied on the next tick
  engine_.tick();
  ASSERT_EQ(log_->resetsAt.size(), 1u);
  EXPECT_EQ(notes_only(log_->events_since_last_reset()),
            std::vector<std::uint32_t>{pack(0x90, 60, 100)});
  EXPECT_TRUE(engine_.note_colors().color(60).has_value());
  EXPECT_EQ(engine_.stats().notes_rendered, 1u);

  engine_.seek(Seconds(0.5));
  engine_.tick();
  ASSERT_EQ(log_->resetsAt.size(), 2u);
  EXPECT_TRUE(notes_only(log_->events_since_last_reset()).empty());
  EXPECT_FALSE(engine_.note_colors().color(60).has_value());
  EXPECT_EQ(engine_.stats().notes_rendered, 0u);
}

TEST_P(EngineTest, SeekingToTheCurrentPositionIsANoOp) {
  open(single_note_song(), "seek_twice");
  engine_.seek(Seconds(1.5));
  engine_.tick();
  engine_.seek(Seconds(1.5));
  engine_.tick();

  EXPECT_EQ(log_->resetsAt.size(), 1u);
  EXPECT_EQ(notes_only(log_->events).size(), 1u);
}

TEST_P(EngineTest, NegativeSeekClampsToStart) {
  open(single_note_song(), "seek_negative");
  engine_.seek(Seconds(-4.0));
  engine_.tick();
  EXPECT_DOUBLE_EQ(engine_.get_time().count(), 0.0);
  EXPECT_EQ(log_->resetsAt.size(), 1u);
}

TEST_P(EngineTest, ClockMovingBackIsTreatedAsASeek) {
  open(single_note_song(), "backward");
  engine_.play();
  wall_.advance(1.5);
  engine_.tick();
  ASSERT_EQ(log_->events.size(), 1u);

  wall_.advance(-0.3);
  engine_.tick();
  ASSERT_EQ(log_->resetsAt.size(), 1u);
  EXPECT_EQ(notes_only(log_->events_since_last_reset()),
            std::vector<std::uint32_t>{pack(0x90, 60, 100)});
  EXPECT_TRUE(engine_.note_colors().color(60).has_value());
}

TEST_P(EngineTest, ResyncSoundsEveryLayer) {
  TrackBuilder a, b;
  a.note_on(0, 0, 60, 80).note_off(960, 0, 60).end();
  b.note_on(240, 0, 60, 90).note_off(240, 0, 60).end();
  open(build_smf({a, b}), "layers");

  engine_.seek(Seconds(0.3));
  engine_.tick();
  EXPECT_EQ(notes_only(log_->events_since_last_reset()),
            (std::vector<std::uint32_t>{pack(0x90, 60, 90), pack(0x90, 60, 90)}));
  EXPECT_EQ(engine_.stats().notes_rendered, 2u);
}

TEST_P(EngineTest, SeekRestoresProgramAndControllers) {
  TrackBuilder t;
  t.event(0, {0xC0, 0x28})
      .event(0, {0xB0, 0x07, 0x1E})
      .note_on(960, 0, 60, 100)
      .note_off(960, 0, 60)
      .end();
  open(build_smf({t}, 480), "seek_controls");

  engine_.seek(Seconds(1.5));
  engine_.tick();
  const auto since = log_->events_since_last_reset();
  const auto at = [&](std::uint32_t raw) {
    return std::find(since.begin(), since.end(), raw) - since.begin();
  };
  const auto program = at(pack(0xC0, 0x28));
  const auto volume = at(pack(0xB0, 0x07, 0x1E));
  const auto note = at(pack(0x90, 60, 100));
  const auto end = static_cast<std::ptrdiff_t>(since.size());
  ASSERT_LT(program, end);
  ASSERT_LT(volume, end);
  ASSERT_LT(note, end);
  EXPECT_LT(program, note);
  EXPECT_LT(volume, note);
  // Volume 100 is the default; the file's 30 replaces it
  EXPECT_EQ(at(pack(0xB0, 0x07, 100)), end);
  // Other channels go back to their defaults
  EXPECT_LT(at(pack(0xC1, 0)), end);
  EXPECT_LT(at(pack(0xB1, 121, 0)), end);

  // Back to the start: the program set at time zero is replayed
  engine_.seek(Seconds(0.0));
  engine_.tick();
  const auto rewound = log_->events_since_last_reset();
  EXPECT_NE(std::find(rewound.begin(), rewound.end(), pack(0xC0, 0x28)),
            rewound.end());
}

TEST_P(EngineTest, SeekBeforeAnyControlChangeSendsDefaults) {
  open(single_note_song(), "seek_defaults");
  engine_.seek(Seconds(0.5));
  engine_.tick();
  const auto since = log_->events_since_last_reset();
  EXPECT_NE(std::find(since.begin(), since.end(), pack(0xC0, 0)), since.end());
  EXPECT_NE(std::find(since.begin(), since.end(), pack(0xE0, 0x00, 0x40)),
            since.end());
  EXPECT_EQ(engine_.stats().notes_rendered, 0u);
}

TEST_P(EngineTest, FullPlayRendersEveryNote) {
  open(random_song(5, 4, 200), "full_play");
  ASSERT_TRUE(engine_.midi_length().has_value());

  engine_.play();
  run_until(*engine_.midi_length() + 0.5);

  const auto stats = engine_.stats();
  EXPECT_GT(stats.total_notes, 0u);
  EXPECT_EQ(stats.notes_rendered, stats.total_notes);
  EXPECT_EQ(stats.dropped_events, 0u);
  EXPECT_EQ(count_note_ons(log_->events), stats.total_notes);
  EXPECT_EQ(engine_.note_colors().active_count(), 0u);
}

TEST_P(EngineTest, RejectedEventsAreCountedAsDropped) {
  log_->capacity = 8; // never drained
  open(random_song(8, 3, 150), "overflow");
  engine_.play();
  run_until(*engine_.midi_length() + 0.5);

  const auto stats = engine_.stats();
  EXPECT_LT(stats.notes_rendered, stats.total_notes);
  EXPECT_GT(stats.dropped_events, 0u);
  EXPECT_LE(stats.total_notes - stats.notes_rendered, stats.dropped_events);
}

TEST_P(EngineTest, FailedOpenLeavesEngineIdle) {
  open(single_note_song(), "before_failure");
  engine_.play();
  engine_.tick();

  LoadOptions options;
  options.loading = GetParam();
  const auto missing = testing_support::temp_dir() / "no_such_file.mid";
  EXPECT_THROW(engine_.open(missing, options), midi::LoadError);
  EXPECT_EQ(engine_.state(), EngineState::Idle);
  // The previous session was closed first
  EXPECT_EQ(log_->resetsAt.size(), 1u);
}

TEST_P(EngineTest, ReportsDecodeErrorsAndVoices) {
  TrackBuilder t;
  t.note_on(0, 0, 60, 100).event(0, {0xF4}).note_off(480, 0, 60).end();
  open(build_smf({t}), "stats");
  log_->tracksVoices = true;
  log_->voices = 5;

  const auto stats = engine_.stats();
  EXPECT_EQ(stats.decode_errors, 1u);
  EXPECT_EQ(stats.voice_count, 5u);
}

INSTANTIATE_TEST_SUITE_P(BothLoadingModes, EngineTest,
                         ::testing::Values(MidiLoading::Ram,
                                           MidiLoading::Live));

class VelocityIgnoreTest : public ::testing::Test {
protected:
  std::shared_ptr<BackendLog> log_ = std::make_shared<BackendLog>();
  AudioDispatch dispatch_{SynthKind::XSynth,
                          std::make_unique<RecordingBackend>(log_),
                          midi::VelocityRange{1, 20}};
  ManualClock wall_;
  PlaybackEngine engine_{dispatch_, wall_.source()};
};

TEST_F(VelocityIgnoreTest, SuppressedNoteOnTakesItsNoteOffWithIt) {
  engine_.open(write_temp(ignored_layer_song(), "ignored_layer.mid"), {});
  EXPECT_EQ(engine_.stats().total_notes, 1u);

  engine_.play();
  engine_.tick();
  EXPECT_EQ(log_->events, std::vector<std::uint32_t>{pack(0x90, 60, 100)});

  // The first note-off pairs with the suppressed note-on
  wall_.advance(0.5);
  engine_.tick();
  EXPECT_EQ(log_->events.size(), 1u);
  EXPECT_TRUE(engine_.note_colors().color(60).has_value());

  wall_.advance(0.5);
  engine_.tick();
  ASSERT_EQ(log_->events.size(), 2u);
  EXPECT_EQ(log_->events[1], pack(0x80, 60, 0));
  EXPECT_FALSE(engine_.note_colors().color(60).has_value());
  EXPECT_EQ(engine_.stats().notes_rendered, 1u);
}

TEST_F(VelocityIgnoreTest, ForwardedNoteOnsAndOffsBalance) {
  engine_.open(write_temp(random_song(13, 4, 200), "ignored_random.mid"), {});
  engine_.play();
  while (engine_.get_time().count() < *engine_.midi_length() + 0.5) {
    wall_.advance(1.0 / 60.0);
    engine_.tick();
  }

  const auto stats = engine_.stats();
  EXPECT_EQ(stats.notes_rendered, stats.total_notes);
  EXPECT_EQ(count_note_ons(log_->events), count_note_offs(log_->events));
}

TEST(EngineFailureTest, CorruptStreamClosesTheSession) {
  TrackBuilder t;
  for (int i = 0; i < 20; ++i) {
    t.note_on(0, 0, 60, 100).note_off(480, 0, 60);
  }
  t.end();
  auto bytes = build_smf({t}, 480);
  bytes.resize(bytes.size() - 10);
  const auto path = write_temp(bytes, "engine_truncated.mid");

  auto log = std::make_shared<BackendLog>();
  AudioDispatch dispatch(SynthKind::Kdmapi,
                         std::make_unique<RecordingBackend>(log));
  ManualClock wall;
  PlaybackEngine engine(dispatch, wall.source());

  LoadOptions options;
  options.loading = MidiLoading::Ram;
  EXPECT_THROW(engine.open(path, options), midi::LoadError);
  EXPECT_EQ(engine.state(), EngineState::Idle);

  options.loading = MidiLoading::Live;
  options.lookahead = 0.0;
  engine.open(path, options);
  EXPECT_FALSE(engine.midi_length().has_value());
  engine.play();
  engine.tick();
  EXPECT_FALSE(log->events.empty());

  // Everything before the corrupt bytes is still played
  wall.advance(100.0);
  engine.tick();
  EXPECT_EQ(count_note_ons(log->events), engine.stats().total_notes);

  wall.advance(1.0);
  EXPECT_THROW(engine.tick(), midi::DecodeError);
  EXPECT_EQ(engine.state(), EngineState::Closed);
  ASSERT_TRUE(engine.last_error().has_value());
  EXPECT_EQ(log->resetsAt.size(), 1u);
  EXPECT_EQ(engine.note_colors().active_count(), 0u);

  EXPECT_NO_THROW(engine.tick());
  engine.close();
  EXPECT_EQ(engine.state(), EngineState::Idle);

  options.loading = MidiLoading::Ram;
  engine.open(write_temp(single_note_song(), "engine_recovered.mid"), options);
  EXPECT_FALSE(engine.last_error().has_value());
}

TEST(EngineFailureTest, TruncatedStreamPlaysEveryNoteBeforeTheDamage) {
  TrackBuilder t;
  for (int i = 0; i < 20; ++i) {
    t.note_on(0, 0, 60, 100).note_off(480, 0, 60);
  }
  t.end();
  auto bytes = build_smf({t}, 480);
  bytes.resize(bytes.size() - 10);
  const auto path = write_temp(bytes, "engine_truncated_lookahead.mid");

  auto log = std::make_shared<BackendLog>();
  AudioDispatch dispatch(SynthKind::Kdmapi,
                         std::make_unique<RecordingBackend>(log));
  ManualClock wall;
  PlaybackEngine engine(dispatch, wall.source());

  LoadOptions options;
  options.loading = MidiLoading::Live; // default lookahead
  engine.open(path, options);
  const auto total = engine.stats().total_notes;
  EXPECT_GE(total, 19u);
  engine.play();

  bool failed = false;
  for (int frame = 0; frame < 60 * 30 && !failed; ++frame) {
    wall.advance(1.0 / 60.0);
    try {
      engine.tick();
    } catch (const midi::DecodeError &) {
      failed = true;
    }
  }
  EXPECT_TRUE(failed);
  EXPECT_EQ(engine.state(), EngineState::Closed);
  EXPECT_EQ(count_note_ons(log->events), total);
}

TEST_F(VelocityIgnoreTest, ResyncKeepsAudibleLayerUnderAnIgnoredOne) {
  // An audible note-on, then an ignored one on the same key; the ignored
  // layer is released first
  TrackBuilder t;
  t.note_on(0, 0, 60, 100)
      .note_on(240, 0, 60, 10)
      .note_off(480, 0, 60)
      .note_off(480, 0, 60)
      .end();
  const auto path = write_temp(build_smf({t}, 480), "ignored_on_top.mid");

  for (const auto loading : {MidiLoading::Ram, MidiLoading::Live}) {
    SCOPED_TRACE(loading == MidiLoading::Ram ? "ram" : "live");
    LoadOptions options;
    options.loading = loading;
    engine_.open(path, options);

    engine_.seek(Seconds(0.5));
    engine_.tick();
    EXPECT_EQ(notes_only(log_->events_since_last_reset()),
              std::vector<std::uint32_t>{pack(0x90, 60, 100)});
    EXPECT_TRUE(engine_.note_colors().color(60).has_value());
    EXPECT_EQ(engine_.stats().notes_rendered, 1u);

    // The note-off at 0.75 s pairs with the ignored layer
    engine_.play();
    wall_.advance(0.5);
    engine_.tick();
    EXPECT_EQ(notes_only(log_->events_since_last_reset()).size(), 1u);
    EXPECT_TRUE(engine_.note_colors().color(60).has_value());

    wall_.advance(0.5);
    engine_.tick();
    EXPECT_EQ(notes_only(log_->events_since_last_reset()).back(),
              pack(0x80, 60, 0));
    EXPECT_FALSE(engine_.note_colors().color(60).has_value());
    engine_.close();
  }
}
