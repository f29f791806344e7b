#include "activityDetector.hpp"
#include <cmath>

ActivityDetector::ActivityDetector(const ActivityDetectorConfig &config)
    : config_(config)
{
}

void ActivityDetector::setCallbacks(Callback onSpeechStart, Callback onSpeechEnd)
{
  std::lock_guard<std::mutex> lock(mutex_);
  onSpeechStart_ = std::move(onSpeechStart);
  onSpeechEnd_ = std::move(onSpeechEnd);
}

void ActivityDetector::setSilenceTimeout(int silenceTimeoutMs)
{
  std::lock_guard<std::mutex> lock(mutex_);
  config_.silenceTimeoutMs = silenceTimeoutMs;
}

float ActivityDetector::frameEnergy(const std::vector<int16_t> &samples)
{
  if (samples.empty())
  {
    return 0.0f;
  }

  double sum_sq = 0.0;
  for (int16_t sample : samples)
  {
    double normalized = static_cast<double>(sample) / 32768.0;
    sum_sq += normalized * normalized;
  }
  return static_cast<float>(std::sqrt(sum_sq / samples.size()));
}

bool ActivityDetector::checkDeadline(Clock::time_point now)
{
  if (!speaking_)
  {
    return false;
  }
  if (now - lastSpeechAt_ < std::chrono::milliseconds(config_.silenceTimeoutMs))
  {
    return false;
  }

  speaking_ = false;
  speechFrameCount_ = 0;
  return true;
}

bool ActivityDetector::processFrame(const AudioFrame &frame)
{
  const bool isSpeech = frameEnergy(frame.samples) > config_.energyThreshold;
  bool started = false;
  bool ended = false;
  Callback startCallback;
  Callback endCallback;
  uint64_t generation = 0;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (isSpeech)
    {
      // Any speech frame moves the silence deadline.
      lastSpeechAt_ = frame.capturedAt;
      ++speechFrameCount_;

      if (!speaking_ && speechFrameCount_ >= config_.minSpeechFrames)
      {
        speaking_ = true;
        started = true;
      }
    }
    else
    {
      speechFrameCount_ = 0;
      ended = checkDeadline(frame.capturedAt);
    }
    startCallback = onSpeechStart_;
    endCallback = onSpeechEnd_;
    generation = generation_;
  }

  if (started)
  {
    fireIfCurrent(startCallback, generation);
  }
  if (ended)
  {
    fireIfCurrent(endCallback, generation);
  }
  return isSpeech;
}

void ActivityDetector::poll(Clock::time_point now)
{
  Callback endCallback;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!checkDeadline(now))
    {
      return;
    }
    endCallback = onSpeechEnd_;
    generation = generation_;
  }
  fireIfCurrent(endCallback, generation);
}

void ActivityDetector::fireIfCurrent(const Callback &callback, uint64_t generation)
{
  if (!callback)
  {
    return;
  }
  std::lock_guard<std::recursive_mutex> firing(firingMutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_)
    {
      return;
    }
  }
  callback();
}

void ActivityDetector::reset()
{
  std::lock_guard<std::recursive_mutex> firing(firingMutex_);
  std::lock_guard<std::mutex> lock(mutex_);
  speaking_ = false;
  speechFrameCount_ = 0;
  lastSpeechAt_ = Clock::time_point();
  ++generation_;
}

bool ActivityDetector::isSpeaking() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return speaking_;
}
