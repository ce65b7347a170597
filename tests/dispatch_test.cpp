#include <gtest/gtest.h>

#include "audio/dispatch.hpp"
#include "fake_backend.hpp"
#include "midi/events.hpp"

using audio::AudioDispatch;
using audio::SynthKind;
using midi::pack;
using testing_support::BackendLog;
using testing_support::RecordingBackend;

namespace {

std::unique_ptr<AudioDispatch>
make_dispatch(std::shared_ptr<BackendLog> log,
              std::optional<midi::VelocityRange> velIgnore = std::nullopt) {
  return std::make_unique<AudioDispatch>(
      SynthKind::XSynth, std::make_unique<RecordingBackend>(log), velIgnore);
}

} // namespace

TEST(AudioDispatchTest, ForwardsEventsUnchanged) {
  auto log = std::make_shared<BackendLog>();
  auto dispatch = make_dispatch(log);

  EXPECT_TRUE(dispatch->push_event(pack(0x90, 60, 100)));
  EXPECT_TRUE(dispatch->push_event(pack(0xB3, 7, 90)));
  EXPECT_TRUE(dispatch->push_event(pack(0xC1, 5)));
  ASSERT_EQ(log->events.size(), 3u);
  EXPECT_EQ(log->events[0], pack(0x90, 60, 100));
  EXPECT_EQ(log->events[1], pack(0xB3, 7, 90));
  EXPECT_EQ(log->events[2], pack(0xC1, 5));
  EXPECT_EQ(dispatch->kind(), SynthKind::XSynth);
}

TEST(AudioDispatchTest, SuppressesNoteOnsInIgnoredVelocityRange) {
  auto log = std::make_shared<BackendLog>();
  auto dispatch = make_dispatch(log, midi::VelocityRange{1, 20});

  EXPECT_TRUE(dispatch->suppresses(1));
  EXPECT_TRUE(dispatch->suppresses(20));
  EXPECT_FALSE(dispatch->suppresses(21));

  EXPECT_FALSE(dispatch->push_event(pack(0x90, 60, 10)));
  EXPECT_TRUE(dispatch->push_event(pack(0x90, 61, 64)));
  // Note-offs and other messages are never filtered here
  EXPECT_TRUE(dispatch->push_event(pack(0x80, 60, 10)));
  EXPECT_TRUE(dispatch->push_event(pack(0x90, 62, 0)));
  EXPECT_TRUE(dispatch->push_event(pack(0xB0, 64, 10)));

  EXPECT_EQ(log->events.size(), 4u);
  EXPECT_EQ(dispatch->dropped_events(), 0u);
}

TEST(AudioDispatchTest, CountsEventsTheBackendRejects) {
  auto log = std::make_shared<BackendLog>();
  log->capacity = 3;
  auto dispatch = make_dispatch(log);

  for (int i = 0; i < 10; ++i) {
    dispatch->push_event(pack(0x90, static_cast<std::uint8_t>(40 + i), 100));
  }
  EXPECT_EQ(log->events.size(), 3u);
  EXPECT_EQ(dispatch->dropped_events(), 7u);
}

TEST(AudioDispatchTest, ResetReachesBackend) {
  auto log = std::make_shared<BackendLog>();
  auto dispatch = make_dispatch(log);
  dispatch->push_event(pack(0x90, 60, 100));
  dispatch->reset();
  ASSERT_EQ(log->resetsAt.size(), 1u);
  EXPECT_EQ(log->resetsAt[0], 1u);
}

TEST(AudioDispatchTest, VoiceCountIsZeroWithoutTelemetry) {
  auto log = std::make_shared<BackendLog>();
  auto dispatch = make_dispatch(log);
  log->voices = 17;
  EXPECT_EQ(dispatch->get_voice_count(), 0u);

  log->tracksVoices = true;
  EXPECT_EQ(dispatch->get_voice_count(), 17u);
}

TEST(AudioDispatchTest, ForwardsReconfiguration) {
  auto log = std::make_shared<BackendLog>();
  auto dispatch = make_dispatch(log);

  dispatch->set_layer_count(8);
  EXPECT_EQ(log->layers, std::optional<std::size_t>(8));
  dispatch->set_layer_count(std::nullopt);
  EXPECT_FALSE(log->layers.has_value());

  dispatch->set_soundfont("piano.sf2");
  EXPECT_EQ(log->soundfont, std::filesystem::path("piano.sf2"));
}

TEST(AudioDispatchTest, NeedsABackend) {
  EXPECT_THROW(AudioDispatch(SynthKind::Kdmapi, nullptr), std::runtime_error);
}

TEST(AudioDispatchTest, KindNames) {
  EXPECT_STREQ(audio::to_string(SynthKind::XSynth), "xsynth");
  EXPECT_STREQ(audio::to_string(SynthKind::Kdmapi), "kdmapi");
}
