#include "audioDevice.hpp"
#include "AppLogger.hpp"
#include <algorithm>

PortAudioDevice::PortAudioDevice(int sampleRate, int frameMs, int playbackChunkMs)
    : initialized(false),
      sampleRate_(sampleRate),
      frameSize_(sampleRate * frameMs / 1000),
      playbackChunkMs_(std::max(5, playbackChunkMs))
{
  PaError err = Pa_Initialize();
  if (err == paNoError)
  {
    initialized = true;
    AppLogger::getInstance().info("PortAudio initialized successfully.");
  }
  else
  {
    AppLogger::getInstance().error("PortAudio initialization failed: " + std::string(Pa_GetErrorText(err)));
  }
}

PortAudioDevice::~PortAudioDevice()
{
  closeCapture();
  joinReader();
  if (initialized)
  {
    PaError err = Pa_Terminate();
    if (err != paNoError)
    {
      AppLogger::getInstance().warning("PortAudio termination failed: " + std::string(Pa_GetErrorText(err)));
    }
  }
}

bool PortAudioDevice::isInitialized() const
{
  return initialized;
}

bool PortAudioDevice::isCapturing() const
{
  return capturing_.load();
}

void PortAudioDevice::joinReader()
{
  if (readerThread_.joinable() && readerThread_.get_id() != std::this_thread::get_id())
  {
    readerThread_.join();
  }
}

bool PortAudioDevice::openCapture(const FrameCallback &onFrame, const CaptureErrorCallback &onError, std::string &error)
{
  std::lock_guard<std::mutex> lock(captureMutex_);
  if (!initialized)
  {
    error = "PortAudio not initialized";
    return false;
  }
  if (capturing_.load())
  {
    error = "capture already open";
    return false;
  }
  // A reader that ended on its own (read error) is still joinable.
  joinReader();

  PaStream *stream = nullptr;
  PaError err = Pa_OpenDefaultStream(&stream,
                                     1,
                                     0,
                                     paInt16,
                                     sampleRate_,
                                     frameSize_,
                                     nullptr, nullptr);
  if (err != paNoError)
  {
    error = "could not open audio input device: " + std::string(Pa_GetErrorText(err));
    AppLogger::getInstance().error(error);
    return false;
  }

  err = Pa_StartStream(stream);
  if (err != paNoError)
  {
    error = "could not start audio input stream: " + std::string(Pa_GetErrorText(err));
    AppLogger::getInstance().error(error);
    Pa_CloseStream(stream);
    return false;
  }

  capturing_ = true;
  readerThread_ = std::thread(&PortAudioDevice::readerLoop, this, stream, onFrame, onError);
  AppLogger::getInstance().info("Audio capture started (" + std::to_string(sampleRate_) + " Hz, " +
                                std::to_string(frameSize_) + " samples per frame).");
  return true;
}

void PortAudioDevice::readerLoop(PaStream *stream, FrameCallback onFrame, CaptureErrorCallback onError)
{
  std::vector<int16_t> frameBuffer(frameSize_);
  std::string failure;

  while (capturing_.load())
  {
    PaError err = Pa_ReadStream(stream, frameBuffer.data(), frameSize_);
    if (err == paInputOverflowed)
    {
      AppLogger::getInstance().debug("Audio input overflow, frame kept.");
    }
    else if (err != paNoError)
    {
      failure = "error reading from input stream: " + std::string(Pa_GetErrorText(err));
      break;
    }

    if (!capturing_.load())
    {
      break;
    }

    AudioFrame frame;
    frame.samples = frameBuffer;
    frame.capturedAt = std::chrono::steady_clock::now();
    onFrame(frame);
  }

  // The reader owns the stream once started, so it is released on whichever path ends the loop.
  Pa_StopStream(stream);
  Pa_CloseStream(stream);
  capturing_ = false;
  AppLogger::getInstance().info("Audio capture stopped, microphone released.");

  if (!failure.empty())
  {
    AppLogger::getInstance().error(failure);
    if (onError)
    {
      onError(failure);
    }
  }
}

void PortAudioDevice::closeCapture()
{
  std::lock_guard<std::mutex> lock(captureMutex_);
  capturing_ = false;
  // Called from the reader itself (error callback) the thread is joined on the next open.
  joinReader();
}

void PortAudioDevice::abortPlayback()
{
  abortRequested_ = true;
}

PlaybackResult PortAudioDevice::play(const AudioBuffer &audio, const StopPredicate &shouldStop, std::string &error)
{
  std::lock_guard<std::mutex> lock(playbackMutex_);
  abortRequested_ = false;

  if (!initialized)
  {
    error = "PortAudio not initialized";
    return PlaybackResult::Failed;
  }
  if (audio.empty() || audio.channels <= 0)
  {
    error = "empty audio buffer";
    return PlaybackResult::Failed;
  }

  PaStream *stream = nullptr;
  PaError err = Pa_OpenDefaultStream(&stream,
                                     0,
                                     audio.channels,
                                     paInt16,
                                     audio.sampleRate,
                                     paFramesPerBufferUnspecified,
                                     nullptr, nullptr);
  if (err != paNoError)
  {
    error = "could not open audio output device: " + std::string(Pa_GetErrorText(err));
    return PlaybackResult::Failed;
  }

  err = Pa_StartStream(stream);
  if (err != paNoError)
  {
    error = "could not start playback stream: " + std::string(Pa_GetErrorText(err));
    Pa_CloseStream(stream);
    return PlaybackResult::Failed;
  }

  // Chunk length bounds how long a stop request waits.
  const size_t chunkFrames = std::max<size_t>(1, static_cast<size_t>(audio.sampleRate) * playbackChunkMs_ / 1000);
  const int16_t *audioData = audio.samples.data();
  const size_t totalFrames = audio.samples.size() / audio.channels;
  size_t framesPlayed = 0;
  PlaybackResult result = PlaybackResult::Completed;

  while (framesPlayed < totalFrames)
  {
    if (abortRequested_.load() || (shouldStop && shouldStop()))
    {
      result = PlaybackResult::Stopped;
      break;
    }

    size_t framesToPlay = std::min(chunkFrames, totalFrames - framesPlayed);
    err = Pa_WriteStream(stream, audioData + (framesPlayed * audio.channels), static_cast<unsigned long>(framesToPlay));
    if (err != paNoError && err != paOutputUnderflowed)
    {
      error = "error during playback: " + std::string(Pa_GetErrorText(err));
      result = PlaybackResult::Failed;
      break;
    }

    framesPlayed += framesToPlay;
  }

  if (result == PlaybackResult::Completed)
  {
    Pa_StopStream(stream);
  }
  else
  {
    Pa_AbortStream(stream);
  }
  Pa_CloseStream(stream);
  return result;
}
