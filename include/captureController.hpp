#pragma once

#include "activityDetector.hpp"
#include "audioDevice.hpp"
#include "captureStateMachine.hpp"
#include "coordination.hpp"
#include "hotkey.hpp"
#include "transcription.hpp"
#include "voiceStatus.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct ResultMarker
{
  static constexpr const char *Ready = "[Ready]";
  static constexpr const char *Recording = "[Recording...]";
  static constexpr const char *Transcribing = "[Transcribing...]";
  static constexpr const char *Timeout = "[Timeout]";
  static constexpr const char *NoSpeech = "[No speech recognized]";
};

struct CaptureControllerConfig
{
  std::string defaultKey = "ctrl_r";
  bool autoStop = false;
  int silenceMs = 1500;
  bool autoResume = false;
  int echoDelayMs = 400;
  int maxRecordingMs = 60000;
  int tickMs = 20;
  ActivityDetectorConfig vad;
  bool saveDebugAudio = false;
  std::string debugAudioFile = "debug_capture.wav";
};

// Per-call overrides for start(); unset fields fall back to the configuration.
struct StartOptions
{
  std::string key;
  std::optional<bool> autoStop;
  std::optional<int> silenceMs;
  std::optional<bool> autoResume;
  std::optional<int> echoDelayMs;
};

struct CaptureStatus
{
  CaptureState state = CaptureState::Idle;
  bool autoStopEnabled = false;
  bool autoResumeEnabled = false;
  bool speaking = false;
  bool hasResult = false;
  std::string lastResultPreview;
  bool hotkeyActive = false;
  std::string key;
};

// Push-to-talk / voice-activated capture. Owns the input device while active and hands
// each finished recording to the transcription engine.
class CaptureController
{
public:
  using CancelHook = std::function<size_t()>;

  CaptureController(std::shared_ptr<AudioDevice> device,
                    std::shared_ptr<TranscriptionEngine> engine,
                    std::shared_ptr<CoordinationChannel> channel,
                    std::unique_ptr<HotkeySource> hotkey,
                    const CaptureControllerConfig &config = CaptureControllerConfig());
  ~CaptureController();

  CaptureController(const CaptureController &) = delete;
  CaptureController &operator=(const CaptureController &) = delete;

  Status start(const StartOptions &options);
  Status stop();
  Status interrupt(const std::string &reason);
  Status toggle();

  CaptureStatus getStatus();

  std::string getResult(bool wait, std::chrono::milliseconds timeout);

  // Ends the current recording and waits for its transcript.
  std::string transcribeNow(std::chrono::milliseconds timeout);

  // Lets interrupt() cancel speech directly when the speaker lives in this process.
  void setCancelHook(CancelHook hook);

  CaptureState state() const;

  static std::string formatResult(const TranscriptionResult &result);

private:
  struct CaptureSession
  {
    uint64_t id = 0;
    std::vector<AudioFrame> frames;
    std::chrono::steady_clock::time_point startedAt;
  };

  struct TranscriptionJob
  {
    uint64_t sessionId = 0;
    AudioBuffer audio;
  };

  // Work left for after mutex_ is released.
  struct Effects
  {
    std::optional<TranscriptionJob> job;
    bool resetDetector = false;
  };

  struct Transcriber
  {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::shared_ptr<AudioDevice> device_;
  std::shared_ptr<TranscriptionEngine> engine_;
  std::shared_ptr<CoordinationChannel> channel_;
  std::unique_ptr<HotkeySource> hotkey_;
  CaptureControllerConfig config_;
  ActivityDetector detector_;

  // Serializes start/stop/interrupt; never taken by device or detector callbacks.
  std::mutex lifecycleMutex_;
  std::thread monitor_;

  mutable std::mutex mutex_;
  std::condition_variable stateChanged_;
  std::condition_variable resultReady_;
  CaptureState state_ = CaptureState::Idle;
  CaptureOptions options_;
  std::string key_;
  std::chrono::milliseconds echoDelay_{400};
  CaptureSession session_;
  uint64_t sessionCounter_ = 0;
  std::deque<AudioFrame> preroll_;
  std::optional<TranscriptionResult> lastResult_;
  uint64_t resultSeq_ = 0;
  uint64_t claimedSeq_ = 0;
  bool awaitingResume_ = false;
  std::chrono::system_clock::time_point completedAt_;
  bool hotkeyActive_ = false;
  CancelHook cancelHook_;

  std::mutex transcribersMutex_;
  std::list<Transcriber> transcribers_;

  bool dispatch(CaptureEvent event);
  // Expects mutex_ held. The detector is reset by the caller once mutex_ is released,
  // since reset() waits for detector callbacks that take mutex_.
  bool applyLocked(CaptureEvent event, Effects &effects);
  void launchTranscription(TranscriptionJob job);
  void finishTranscription(uint64_t sessionId, const TranscriptionResult &result);

  void onFrame(const AudioFrame &frame);
  void onSpeechStart();
  void onSpeechEnd();
  void onDeviceError(const std::string &message);

  void monitorLoop();
  void tick();
  bool resumeDue(std::chrono::system_clock::time_point completedAt);
  void releaseDevices();
  void joinMonitor();

  // Expects mutex_ held.
  std::string waitForResult(std::unique_lock<std::mutex> &lock, uint64_t after, std::chrono::milliseconds timeout);
};
