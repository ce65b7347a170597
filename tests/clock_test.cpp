#include <gtest/gtest.h>

#include "fake_backend.hpp"
#include "playback/clock.hpp"

using playback::PlaybackClock;
using playback::Seconds;
using testing_support::ManualClock;

class PlaybackClockTest : public ::testing::Test {
protected:
  ManualClock wall;
  PlaybackClock clock{wall.source()};
};

TEST_F(PlaybackClockTest, StartsPausedAtZero) {
  EXPECT_TRUE(clock.is_paused());
  wall.advance(3.0);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 0.0);
}

TEST_F(PlaybackClockTest, FollowsWallTimeWhilePlaying) {
  clock.play();
  wall.advance(1.25);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 1.25);
  // A stalled caller still sees all elapsed time
  wall.advance(10.0);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 11.25);
}

TEST_F(PlaybackClockTest, PauseFreezesAndPlayResumes) {
  clock.play();
  wall.advance(2.0);
  clock.pause();
  wall.advance(5.0);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 2.0);
  clock.play();
  wall.advance(0.5);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 2.5);
}

TEST_F(PlaybackClockTest, PlayAndPauseAreIdempotent) {
  clock.play();
  wall.advance(1.0);
  clock.play();
  wall.advance(1.0);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 2.0);

  clock.pause();
  wall.advance(1.0);
  clock.pause();
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 2.0);
  EXPECT_TRUE(clock.is_paused());
}

TEST_F(PlaybackClockTest, TogglePauseFlipsState) {
  clock.toggle_pause();
  EXPECT_FALSE(clock.is_paused());
  wall.advance(1.0);
  clock.toggle_pause();
  EXPECT_TRUE(clock.is_paused());
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 1.0);
}

TEST_F(PlaybackClockTest, SeekMovesImmediatelyInEitherRunState) {
  clock.seek(Seconds(42.0));
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 42.0);
  EXPECT_TRUE(clock.is_paused());

  clock.play();
  wall.advance(1.0);
  clock.seek(Seconds(3.0));
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 3.0);
  wall.advance(0.5);
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 3.5);
}

TEST_F(PlaybackClockTest, NegativeSeekClampsToZero) {
  clock.seek(Seconds(-5.0));
  EXPECT_DOUBLE_EQ(clock.get_time().count(), 0.0);
}

TEST_F(PlaybackClockTest, MonotonicWhilePlayingForward) {
  clock.play();
  double last = clock.get_time().count();
  for (int i = 0; i < 100; ++i) {
    wall.advance(0.016);
    const double now = clock.get_time().count();
    EXPECT_GE(now, last);
    EXPECT_GE(now, 0.0);
    last = now;
  }
}

TEST(PlaybackClockSteadyTest, DefaultSourceNeverGoesNegative) {
  PlaybackClock clock;
  clock.play();
  EXPECT_GE(clock.get_time().count(), 0.0);
}
