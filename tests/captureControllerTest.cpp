#include "captureController.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <future>
#include <thread>

using namespace std::chrono_literals;

namespace
{
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 2000ms)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline)
  {
    if (predicate())
    {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}
}

class CaptureControllerTest : public ::testing::Test
{
protected:
  std::shared_ptr<FakeAudioDevice> device = std::make_shared<FakeAudioDevice>();
  std::shared_ptr<FakeTranscriptionEngine> engine = std::make_shared<FakeTranscriptionEngine>();
  std::shared_ptr<CoordinationChannel> channel =
      std::make_shared<CoordinationChannel>(std::make_shared<MemorySignalStore>(), 0ms);
  FakeHotkeySource *hotkey = nullptr;

  std::unique_ptr<CaptureController> makeController(CaptureControllerConfig config = CaptureControllerConfig())
  {
    auto source = std::make_unique<FakeHotkeySource>();
    hotkey = source.get();
    config.tickMs = 5;
    return std::make_unique<CaptureController>(device, engine, channel, std::move(source), config);
  }

  void feed(int frames, int16_t amplitude)
  {
    for (int i = 0; i < frames; ++i)
    {
      device->emit(makeFrame(amplitude, std::chrono::steady_clock::now()));
    }
  }
};

TEST_F(CaptureControllerTest, StartAndStopLifecycle)
{
  auto controller = makeController();

  Status started = controller->start(StartOptions());
  ASSERT_TRUE(started.ok()) << started.message;
  EXPECT_EQ(controller->state(), CaptureState::Armed);
  EXPECT_TRUE(device->isCapturing());
  EXPECT_TRUE(hotkey->active());

  EXPECT_EQ(controller->start(StartOptions()).code, VoiceError::AlreadyActive);

  EXPECT_TRUE(controller->stop().ok());
  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_FALSE(device->isCapturing());
  EXPECT_FALSE(hotkey->active());

  EXPECT_EQ(controller->stop().code, VoiceError::NotActive);
}

TEST_F(CaptureControllerTest, StartValidatesArguments)
{
  auto controller = makeController();

  StartOptions badKey;
  badKey.key = "hyper_q";
  EXPECT_EQ(controller->start(badKey).code, VoiceError::InvalidInput);

  StartOptions badSilence;
  badSilence.silenceMs = 0;
  EXPECT_EQ(controller->start(badSilence).code, VoiceError::InvalidParameter);

  StartOptions badEcho;
  badEcho.echoDelayMs = -1;
  EXPECT_EQ(controller->start(badEcho).code, VoiceError::InvalidParameter);

  EXPECT_EQ(controller->state(), CaptureState::Idle);
}

TEST_F(CaptureControllerTest, DeviceOpenFailureStaysIdle)
{
  device->failOpen = true;
  auto controller = makeController();

  EXPECT_EQ(controller->start(StartOptions()).code, VoiceError::DeviceError);
  EXPECT_EQ(controller->state(), CaptureState::Idle);
}

TEST_F(CaptureControllerTest, ManualSessionTranscribesWholeBuffer)
{
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());

  hotkey->press();
  EXPECT_EQ(controller->state(), CaptureState::Recording);

  // 2 s of speech then 0.5 s of silence; manual mode ignores the pause.
  feed(100, 8000);
  feed(25, 0);

  std::future<std::string> result = std::async(std::launch::async, [&]()
                                                { return controller->getResult(true, 3000ms); });
  std::this_thread::sleep_for(20ms);
  hotkey->press();

  EXPECT_EQ(result.get(), "hello world");
  EXPECT_EQ(engine->calls.load(), 1);
  EXPECT_EQ(engine->lastSampleCount.load(), 125u * 320u);
  EXPECT_TRUE(eventually([&]()
                         { return controller->state() == CaptureState::Armed; }));
}

TEST_F(CaptureControllerTest, FramesOutsideRecordingAreDropped)
{
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());

  feed(50, 8000);
  ASSERT_TRUE(controller->toggle().ok());
  feed(10, 8000);

  EXPECT_EQ(controller->transcribeNow(3000ms), "hello world");
  EXPECT_EQ(engine->lastSampleCount.load(), 10u * 320u);
}

TEST_F(CaptureControllerTest, FramesDiscardedWhileSpeakerTalks)
{
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());

  channel->markSpeaking(true);
  feed(20, 8000);
  channel->markSpeaking(false);
  feed(5, 8000);

  EXPECT_EQ(controller->transcribeNow(3000ms), "hello world");
  EXPECT_EQ(engine->lastSampleCount.load(), 5u * 320u);
}

TEST_F(CaptureControllerTest, VoiceActivityStartsAndEndsSession)
{
  CaptureControllerConfig config;
  config.autoStop = true;
  config.silenceMs = 100;
  auto controller = makeController(config);
  ASSERT_TRUE(controller->start(StartOptions()).ok());

  feed(3, 8000);
  EXPECT_EQ(controller->state(), CaptureState::Recording);
  // Speech onset asks the speaker to stop.
  EXPECT_TRUE(channel->consumeStopSignal());

  feed(10, 8000);
  std::string text = controller->getResult(true, 3000ms);

  EXPECT_EQ(text, "hello world");
  // The three debounce frames are kept as pre-roll.
  EXPECT_GE(engine->lastSampleCount.load(), 13u * 320u);
}

TEST_F(CaptureControllerTest, EmptyTranscriptionYieldsMarker)
{
  engine->text = "";
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());
  feed(5, 8000);

  EXPECT_EQ(controller->transcribeNow(3000ms), ResultMarker::NoSpeech);
}

TEST_F(CaptureControllerTest, FailedTranscriptionIsReported)
{
  engine->fail = true;
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());
  feed(5, 8000);

  EXPECT_EQ(controller->transcribeNow(3000ms), "[Transcription failed: engine offline]");
  EXPECT_TRUE(eventually([&]()
                         { return controller->state() == CaptureState::Armed; }));
}

TEST_F(CaptureControllerTest, ResultMarkersDescribeState)
{
  engine->delay = 200ms;
  auto controller = makeController();
  EXPECT_EQ(controller->getResult(false, 0ms), ResultMarker::Ready);

  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());
  EXPECT_EQ(controller->getResult(false, 0ms), ResultMarker::Recording);

  feed(5, 8000);
  ASSERT_TRUE(controller->toggle().ok());
  EXPECT_EQ(controller->getResult(false, 0ms), ResultMarker::Transcribing);

  EXPECT_EQ(controller->getResult(true, 2000ms), "hello world");
  EXPECT_EQ(controller->getResult(false, 0ms), "hello world");
}

TEST_F(CaptureControllerTest, WaitingNeverReturnsStaleResult)
{
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());
  feed(5, 8000);
  ASSERT_EQ(controller->transcribeNow(3000ms), "hello world");

  EXPECT_EQ(controller->getResult(true, 50ms), ResultMarker::Timeout);
}

TEST_F(CaptureControllerTest, StopDiscardsInFlightTranscription)
{
  engine->delay = 150ms;
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());
  feed(5, 8000);
  ASSERT_TRUE(controller->toggle().ok());

  ASSERT_TRUE(controller->stop().ok());
  std::this_thread::sleep_for(300ms);

  EXPECT_EQ(engine->calls.load(), 1);
  EXPECT_FALSE(controller->getStatus().hasResult);
  EXPECT_EQ(controller->state(), CaptureState::Idle);
}

TEST_F(CaptureControllerTest, RecordingLimitEndsSession)
{
  CaptureControllerConfig config;
  config.maxRecordingMs = 50;
  auto controller = makeController(config);
  ASSERT_TRUE(controller->start(StartOptions()).ok());
  ASSERT_TRUE(controller->toggle().ok());
  feed(5, 8000);

  EXPECT_EQ(controller->getResult(true, 2000ms), "hello world");
}

TEST_F(CaptureControllerTest, InterruptStopsCaptureAndCancelsSpeech)
{
  auto controller = makeController();
  int cancelled = 0;
  controller->setCancelHook([&cancelled]()
                            { ++cancelled; return static_cast<size_t>(2); });
  ASSERT_TRUE(controller->start(StartOptions()).ok());

  Status status = controller->interrupt("user said stop");
  EXPECT_TRUE(status.ok());
  EXPECT_NE(status.message.find("2 queued utterance(s) cleared"), std::string::npos);
  EXPECT_EQ(controller->state(), CaptureState::Idle);
  EXPECT_TRUE(channel->consumeStopSignal());
  EXPECT_EQ(cancelled, 1);

  // Idempotent.
  EXPECT_TRUE(controller->interrupt("").ok());
  EXPECT_EQ(cancelled, 2);
}

TEST_F(CaptureControllerTest, DeviceFailureReturnsToIdle)
{
  auto controller = makeController();
  ASSERT_TRUE(controller->start(StartOptions()).ok());

  device->fail("stream read error");

  EXPECT_TRUE(eventually([&]()
                         { return controller->state() == CaptureState::Idle && !device->isCapturing(); }));
  EXPECT_TRUE(controller->start(StartOptions()).ok());
  EXPECT_EQ(device->openCount.load(), 2);
}

TEST_F(CaptureControllerTest, AutoResumeWaitsForEchoDelay)
{
  auto controller = makeController();
  StartOptions options;
  options.autoResume = true;
  options.echoDelayMs = 400;
  ASSERT_TRUE(controller->start(options).ok());

  ASSERT_TRUE(controller->toggle().ok());
  feed(5, 8000);
  ASSERT_EQ(controller->transcribeNow(3000ms), "hello world");
  ASSERT_TRUE(eventually([&]()
                         { return controller->state() == CaptureState::Armed; }));

  // No reply spoken yet: stays armed.
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(controller->state(), CaptureState::Armed);

  std::this_thread::sleep_for(5ms);
  channel->markSpeaking(true);
  std::this_thread::sleep_for(50ms);
  channel->markSpeaking(false);
  const auto finishedAt = std::chrono::steady_clock::now();

  std::this_thread::sleep_for(250ms);
  EXPECT_EQ(controller->state(), CaptureState::Armed);

  ASSERT_TRUE(eventually([&]()
                         { return controller->state() == CaptureState::Recording; }, 1000ms));
  EXPECT_GE(std::chrono::steady_clock::now() - finishedAt, 390ms);
}

TEST_F(CaptureControllerTest, StatusReflectsOptions)
{
  auto controller = makeController();
  StartOptions options;
  options.key = "ctrl_r+m";
  options.autoStop = true;
  ASSERT_TRUE(controller->start(options).ok());

  CaptureStatus status = controller->getStatus();
  EXPECT_EQ(status.state, CaptureState::Armed);
  EXPECT_TRUE(status.autoStopEnabled);
  EXPECT_FALSE(status.autoResumeEnabled);
  EXPECT_TRUE(status.hotkeyActive);
  EXPECT_EQ(status.key, "ctrl_r+m");
  EXPECT_EQ(hotkey->lastBinding.keyCodes.size(), 2u);
}
