#include "activityDetector.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace std::chrono_literals;

class ActivityDetectorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    detector.setCallbacks([this]()
                          { ++starts; },
                          [this]()
                          { ++ends; });
  }

  ActivityDetectorConfig config()
  {
    ActivityDetectorConfig c;
    c.energyThreshold = 0.01f;
    c.minSpeechFrames = 3;
    c.silenceTimeoutMs = 1500;
    return c;
  }

  ActivityDetector detector{config()};
  int starts = 0;
  int ends = 0;
  ActivityDetector::Clock::time_point t0 = ActivityDetector::Clock::now();

  static constexpr int16_t LOUD = 8000;
  static constexpr int16_t QUIET = 10;
};

TEST_F(ActivityDetectorTest, FrameEnergyIsNormalizedRms)
{
  EXPECT_FLOAT_EQ(ActivityDetector::frameEnergy({}), 0.0f);
  EXPECT_NEAR(ActivityDetector::frameEnergy(std::vector<int16_t>(100, 16384)), 0.5f, 1e-4);
}

TEST_F(ActivityDetectorTest, TooFewSpeechFramesNeverStart)
{
  detector.processFrame(makeFrame(LOUD, t0));
  detector.processFrame(makeFrame(LOUD, t0 + 20ms));
  for (int i = 2; i < 200; ++i)
  {
    detector.processFrame(makeFrame(QUIET, t0 + i * 20ms));
  }
  detector.poll(t0 + 10s);

  EXPECT_EQ(starts, 0);
  EXPECT_EQ(ends, 0);
}

TEST_F(ActivityDetectorTest, ExactlyMinSpeechFramesStart)
{
  for (int i = 0; i < 3; ++i)
  {
    detector.processFrame(makeFrame(LOUD, t0 + i * 20ms));
  }
  EXPECT_EQ(starts, 1);
  EXPECT_TRUE(detector.isSpeaking());

  // Further speech does not re-fire the start edge.
  detector.processFrame(makeFrame(LOUD, t0 + 60ms));
  EXPECT_EQ(starts, 1);
}

TEST_F(ActivityDetectorTest, SilenceDeadlineFiresEndOnce)
{
  for (int i = 0; i < 3; ++i)
  {
    detector.processFrame(makeFrame(LOUD, t0 + i * 20ms));
  }
  const auto lastSpeech = t0 + 40ms;

  detector.poll(lastSpeech + 1499ms);
  EXPECT_EQ(ends, 0);
  detector.poll(lastSpeech + 1500ms);
  EXPECT_EQ(ends, 1);
  detector.poll(lastSpeech + 3000ms);
  EXPECT_EQ(ends, 1);
  EXPECT_FALSE(detector.isSpeaking());
}

TEST_F(ActivityDetectorTest, SpeechJustBeforeDeadlineReschedulesIt)
{
  for (int i = 0; i < 3; ++i)
  {
    detector.processFrame(makeFrame(LOUD, t0 + i * 20ms));
  }
  const auto firstDeadline = t0 + 40ms + 1500ms;

  detector.processFrame(makeFrame(LOUD, firstDeadline - 1ms));
  detector.poll(firstDeadline);
  EXPECT_EQ(ends, 0);

  detector.poll(firstDeadline - 1ms + 1500ms);
  EXPECT_EQ(ends, 1);
}

TEST_F(ActivityDetectorTest, QuietFrameAfterDeadlineEndsWithoutPolling)
{
  for (int i = 0; i < 3; ++i)
  {
    detector.processFrame(makeFrame(LOUD, t0 + i * 20ms));
  }
  detector.processFrame(makeFrame(QUIET, t0 + 2s));
  EXPECT_EQ(ends, 1);
}

TEST_F(ActivityDetectorTest, ResetMidUtteranceLeavesNoLateEnd)
{
  for (int i = 0; i < 3; ++i)
  {
    detector.processFrame(makeFrame(LOUD, t0 + i * 20ms));
  }
  detector.reset();
  detector.poll(t0 + 10s);
  detector.processFrame(makeFrame(QUIET, t0 + 11s));

  EXPECT_EQ(starts, 1);
  EXPECT_EQ(ends, 0);
  EXPECT_FALSE(detector.isSpeaking());
}

TEST_F(ActivityDetectorTest, ConcurrentPollFiresNoEndAfterReset)
{
  ActivityDetector shared(config());
  std::atomic<bool> resetReturned{false};
  std::atomic<int> lateEnds{0};
  shared.setCallbacks(nullptr, [&]()
                      {
    if (resetReturned.load())
    {
      ++lateEnds;
    } });

  std::atomic<bool> running{true};
  std::thread poller([&]()
                     {
    while (running.load())
    {
      shared.poll(t0 + 10s);
    } });

  for (int round = 0; round < 50; ++round)
  {
    resetReturned = false;
    for (int i = 0; i < 3; ++i)
    {
      shared.processFrame(makeFrame(LOUD, t0 + i * 20ms));
    }
    shared.reset();
    resetReturned = true;
    std::this_thread::sleep_for(1ms);
  }
  running = false;
  poller.join();

  EXPECT_EQ(lateEnds.load(), 0);
}

TEST_F(ActivityDetectorTest, SilenceTimeoutCanBeChanged)
{
  detector.setSilenceTimeout(300);
  for (int i = 0; i < 3; ++i)
  {
    detector.processFrame(makeFrame(LOUD, t0 + i * 20ms));
  }
  detector.poll(t0 + 40ms + 300ms);
  EXPECT_EQ(ends, 1);
}
