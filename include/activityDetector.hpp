#pragma once

#include "audioDevice.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

struct ActivityDetectorConfig
{
  float energyThreshold = 0.01f; // RMS, full scale = 1.0
  int minSpeechFrames = 3;
  int silenceTimeoutMs = 1500;
};

// Energy based voice activity detection with debounced speech-start and a silence
// deadline measured from the last speech frame.
class ActivityDetector
{
public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void()>;

  explicit ActivityDetector(const ActivityDetectorConfig &config = ActivityDetectorConfig());

  void setCallbacks(Callback onSpeechStart, Callback onSpeechEnd);

  void setSilenceTimeout(int silenceTimeoutMs);

  // Returns true when the frame classified as speech.
  bool processFrame(const AudioFrame &frame);

  // Fires onSpeechEnd if the silence deadline passed without new frames.
  void poll(Clock::time_point now);

  // Clears the debounce and any pending end. Waits for a callback running on another
  // thread; no edge decided before the reset fires after this returns. Must not be
  // called while holding a lock that the callbacks take.
  void reset();

  bool isSpeaking() const;

  static float frameEnergy(const std::vector<int16_t> &samples);

private:
  ActivityDetectorConfig config_;
  Callback onSpeechStart_;
  Callback onSpeechEnd_;

  // Held while a callback runs; reentrant so a callback may call reset().
  std::recursive_mutex firingMutex_;
  mutable std::mutex mutex_;
  bool speaking_ = false;
  int speechFrameCount_ = 0;
  Clock::time_point lastSpeechAt_;
  uint64_t generation_ = 0;

  // Fires callback unless reset() ran since the edge was decided at generation.
  void fireIfCurrent(const Callback &callback, uint64_t generation);

  // Expects mutex_ held; returns true when the end edge fired.
  bool checkDeadline(Clock::time_point now);
};
