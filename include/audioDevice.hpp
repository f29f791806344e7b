#pragma once

#include "wav.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <portaudio.h>

struct AudioFrame
{
  std::vector<int16_t> samples;
  std::chrono::steady_clock::time_point capturedAt;
};

using FrameCallback = std::function<void(const AudioFrame &)>;
using CaptureErrorCallback = std::function<void(const std::string &)>;
using StopPredicate = std::function<bool()>;

enum class PlaybackResult
{
  Completed,
  Stopped,
  Failed
};

// Duplex microphone/speaker access. Capture frames arrive on a reader thread owned by
// the device; playback blocks the caller until the buffer is played or stopped.
class AudioDevice
{
public:
  virtual ~AudioDevice() = default;

  virtual bool openCapture(const FrameCallback &onFrame, const CaptureErrorCallback &onError, std::string &error) = 0;
  virtual void closeCapture() = 0;
  virtual bool isCapturing() const = 0;

  // shouldStop is checked between chunks; returning true aborts the stream.
  virtual PlaybackResult play(const AudioBuffer &audio, const StopPredicate &shouldStop, std::string &error) = 0;

  // Safe from any thread; the playing call returns Stopped at the next chunk boundary.
  virtual void abortPlayback() = 0;

  virtual int sampleRate() const = 0;
  virtual int frameSamples() const = 0;
};

class PortAudioDevice : public AudioDevice
{
public:
  PortAudioDevice(int sampleRate = 16000, int frameMs = 20, int playbackChunkMs = 50);

  ~PortAudioDevice() override;

  bool isInitialized() const;

  bool openCapture(const FrameCallback &onFrame, const CaptureErrorCallback &onError, std::string &error) override;
  void closeCapture() override;
  bool isCapturing() const override;

  PlaybackResult play(const AudioBuffer &audio, const StopPredicate &shouldStop, std::string &error) override;
  void abortPlayback() override;

  int sampleRate() const override { return sampleRate_; }
  int frameSamples() const override { return frameSize_; }

private:
  bool initialized;
  int sampleRate_;
  int frameSize_;
  int playbackChunkMs_;

  std::mutex captureMutex_;
  std::thread readerThread_;
  std::atomic<bool> capturing_{false};

  std::mutex playbackMutex_;
  std::atomic<bool> abortRequested_{false};

  void readerLoop(PaStream *stream, FrameCallback onFrame, CaptureErrorCallback onError);
  void joinReader();
};
