#include "captureController.hpp"
#include "AppLogger.hpp"

#include <algorithm>

namespace
{
std::string preview(const std::string &text)
{
  return text.size() > 60 ? text.substr(0, 60) + "..." : text;
}

const char *markerFor(CaptureState state)
{
  switch (state)
  {
  case CaptureState::Recording:
    return ResultMarker::Recording;
  case CaptureState::Transcribing:
    return ResultMarker::Transcribing;
  case CaptureState::Idle:
  case CaptureState::Armed:
    break;
  }
  return ResultMarker::Ready;
}
}

CaptureController::CaptureController(std::shared_ptr<AudioDevice> device,
                                     std::shared_ptr<TranscriptionEngine> engine,
                                     std::shared_ptr<CoordinationChannel> channel,
                                     std::unique_ptr<HotkeySource> hotkey,
                                     const CaptureControllerConfig &config)
    : device_(std::move(device)),
      engine_(std::move(engine)),
      channel_(std::move(channel)),
      hotkey_(std::move(hotkey)),
      config_(config),
      detector_(config.vad),
      key_(config.defaultKey)
{
  detector_.setCallbacks([this]()
                         { onSpeechStart(); },
                         [this]()
                         { onSpeechEnd(); });
}

CaptureController::~CaptureController()
{
  {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    dispatch(CaptureEvent::Stop);
    joinMonitor();
  }

  std::lock_guard<std::mutex> lock(transcribersMutex_);
  for (Transcriber &transcriber : transcribers_)
  {
    if (transcriber.thread.joinable())
    {
      transcriber.thread.join();
    }
  }
  transcribers_.clear();
}

void CaptureController::setCancelHook(CancelHook hook)
{
  std::lock_guard<std::mutex> lock(mutex_);
  cancelHook_ = std::move(hook);
}

CaptureState CaptureController::state() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string CaptureController::formatResult(const TranscriptionResult &result)
{
  if (!result.ok)
  {
    return "[Transcription failed: " + result.error + "]";
  }
  if (result.text.empty())
  {
    return ResultMarker::NoSpeech;
  }
  return result.text;
}

Status CaptureController::start(const StartOptions &options)
{
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CaptureState::Idle)
    {
      return Status::failure(VoiceError::AlreadyActive,
                             std::string("Capture already active (") + toString(state_) + ")");
    }
  }

  const std::string key = options.key.empty() ? config_.defaultKey : options.key;
  HotkeyBinding binding;
  if (!parseHotkey(key, binding))
  {
    return Status::failure(VoiceError::InvalidInput, "Unknown key '" + key + "'");
  }

  const int silenceMs = options.silenceMs.value_or(config_.silenceMs);
  if (silenceMs <= 0)
  {
    return Status::failure(VoiceError::InvalidParameter, "silence_ms must be positive");
  }
  const int echoDelayMs = options.echoDelayMs.value_or(config_.echoDelayMs);
  if (echoDelayMs < 0)
  {
    return Status::failure(VoiceError::InvalidParameter, "echo_delay_ms must not be negative");
  }

  // A previous run may have ended on a device failure; its monitor is already winding down.
  joinMonitor();

  CaptureOptions captureOptions;
  captureOptions.autoStop = options.autoStop.value_or(config_.autoStop);
  captureOptions.autoResume = options.autoResume.value_or(config_.autoResume);

  detector_.setSilenceTimeout(silenceMs);
  detector_.reset();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = captureOptions;
    key_ = key;
    echoDelay_ = std::chrono::milliseconds(echoDelayMs);
    awaitingResume_ = false;
    preroll_.clear();
  }

  std::string error;
  if (!device_->openCapture([this](const AudioFrame &frame)
                            { onFrame(frame); },
                            [this](const std::string &message)
                            { onDeviceError(message); },
                            error))
  {
    AppLogger::getInstance().error("Capture start failed: " + error);
    return Status::failure(VoiceError::DeviceError, "Could not open input device: " + error);
  }

  bool hotkeyActive = false;
  if (hotkey_)
  {
    std::string hotkeyError;
    hotkeyActive = hotkey_->start(binding, [this]()
                                  { toggle(); },
                                  hotkeyError);
    if (!hotkeyActive)
    {
      AppLogger::getInstance().warning("Hotkey '" + key + "' unavailable: " + hotkeyError);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    hotkeyActive_ = hotkeyActive;
  }
  dispatch(CaptureEvent::Start);
  monitor_ = std::thread(&CaptureController::monitorLoop, this);

  std::string message = captureOptions.autoStop
                            ? "Listening with voice activity detection (silence " + std::to_string(silenceMs) + " ms)"
                            : "Listening; press " + key + " to start and stop recording";
  if (captureOptions.autoResume)
  {
    message += ", auto-resume after " + std::to_string(echoDelayMs) + " ms";
  }
  if (hotkey_ && !hotkeyActive)
  {
    message += " (hotkey unavailable, use toggle)";
  }
  AppLogger::getInstance().info(message);
  return Status::success(message);
}

Status CaptureController::stop()
{
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  const bool wasActive = dispatch(CaptureEvent::Stop);
  joinMonitor();
  if (!wasActive)
  {
    return Status::failure(VoiceError::NotActive, "Capture is not active");
  }
  return Status::success("Capture stopped");
}

Status CaptureController::interrupt(const std::string &reason)
{
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  const bool wasActive = dispatch(CaptureEvent::Stop);
  joinMonitor();

  channel_->signalStop();

  CancelHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hook = cancelHook_;
  }

  std::string message = "Interrupted";
  if (!reason.empty())
  {
    message += " (" + reason + ")";
  }
  message += wasActive ? ": capture stopped" : ": capture was idle";
  message += ", speech stop requested";
  if (hook)
  {
    message += ", " + std::to_string(hook()) + " queued utterance(s) cleared";
  }
  message += ".";

  AppLogger::getInstance().info(message);
  return Status::success(message);
}

Status CaptureController::toggle()
{
  CaptureState before = state();
  if (before == CaptureState::Idle)
  {
    return Status::failure(VoiceError::NotActive, "Capture is not active");
  }
  if (!dispatch(CaptureEvent::Toggle))
  {
    return Status::failure(VoiceError::AlreadyActive,
                           std::string("Toggle ignored while ") + toString(state()));
  }
  return Status::success(before == CaptureState::Armed ? "Recording started" : "Recording stopped, transcribing");
}

CaptureStatus CaptureController::getStatus()
{
  CaptureStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status.state = state_;
    status.autoStopEnabled = options_.autoStop;
    status.autoResumeEnabled = options_.autoResume;
    status.hasResult = lastResult_.has_value();
    if (lastResult_)
    {
      status.lastResultPreview = preview(formatResult(*lastResult_));
    }
    status.hotkeyActive = hotkeyActive_;
    status.key = key_;
  }
  status.hotkeyActive = status.hotkeyActive && hotkey_ && hotkey_->active();
  status.speaking = channel_->isSpeaking();
  return status;
}

std::string CaptureController::waitForResult(std::unique_lock<std::mutex> &lock, uint64_t after, std::chrono::milliseconds timeout)
{
  bool arrived = resultReady_.wait_for(lock, timeout, [this, after]()
                                       { return resultSeq_ > std::max(after, claimedSeq_); });
  if (!arrived)
  {
    return ResultMarker::Timeout;
  }
  // Only one waiter receives each result.
  claimedSeq_ = resultSeq_;
  return formatResult(*lastResult_);
}

std::string CaptureController::getResult(bool wait, std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(mutex_);
  if (!wait)
  {
    return lastResult_ ? formatResult(*lastResult_) : markerFor(state_);
  }
  return waitForResult(lock, resultSeq_, timeout);
}

std::string CaptureController::transcribeNow(std::chrono::milliseconds timeout)
{
  uint64_t after = 0;
  CaptureState current;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    after = resultSeq_;
    current = state_;
  }

  if (current == CaptureState::Recording)
  {
    dispatch(CaptureEvent::Toggle);
  }
  else if (current != CaptureState::Transcribing)
  {
    return markerFor(current);
  }

  std::unique_lock<std::mutex> lock(mutex_);
  return waitForResult(lock, after, timeout);
}

bool CaptureController::dispatch(CaptureEvent event)
{
  Effects effects;
  bool accepted = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepted = applyLocked(event, effects);
  }
  if (effects.resetDetector)
  {
    detector_.reset();
  }
  if (accepted)
  {
    stateChanged_.notify_all();
  }
  if (effects.job)
  {
    launchTranscription(std::move(*effects.job));
  }
  return accepted;
}

bool CaptureController::applyLocked(CaptureEvent event, Effects &effects)
{
  const CaptureTransition next = transition(state_, event, options_);
  if (!next.accepted)
  {
    AppLogger::getInstance().debug(std::string("Capture: ignored ") + toString(event) + " while " + toString(state_));
    return false;
  }

  const CaptureState previous = state_;
  state_ = next.next;
  AppLogger::getInstance().info(std::string("Capture: ") + toString(previous) + " -> " + toString(state_) +
                                " (" + toString(event) + ")");

  switch (state_)
  {
  case CaptureState::Recording:
    session_ = CaptureSession();
    session_.id = ++sessionCounter_;
    session_.startedAt = std::chrono::steady_clock::now();
    if (event == CaptureEvent::SpeechStart)
    {
      // Keep the debounce frames so the onset is not lost.
      session_.frames.assign(preroll_.begin(), preroll_.end());
    }
    else
    {
      effects.resetDetector = true;
    }
    preroll_.clear();
    awaitingResume_ = false;
    break;

  case CaptureState::Transcribing:
  {
    TranscriptionJob pendingJob;
    pendingJob.sessionId = session_.id;
    pendingJob.audio.sampleRate = device_->sampleRate();
    for (const AudioFrame &frame : session_.frames)
    {
      pendingJob.audio.samples.insert(pendingJob.audio.samples.end(), frame.samples.begin(), frame.samples.end());
    }
    session_.frames.clear();
    effects.resetDetector = true;
    effects.job = std::move(pendingJob);
    break;
  }

  case CaptureState::Armed:
    preroll_.clear();
    effects.resetDetector = true;
    break;

  case CaptureState::Idle:
    // Any transcription still running belongs to a discarded session.
    session_ = CaptureSession();
    preroll_.clear();
    awaitingResume_ = false;
    effects.resetDetector = true;
    break;
  }
  return true;
}

void CaptureController::launchTranscription(TranscriptionJob job)
{
  AppLogger::getInstance().info("Transcribing session #" + std::to_string(job.sessionId) + " (" +
                                std::to_string(job.audio.durationSeconds()) + "s)");
  if (config_.saveDebugAudio && !job.audio.empty())
  {
    if (!writeWavFile(config_.debugAudioFile, job.audio))
    {
      AppLogger::getInstance().warning("Could not save debug audio to " + config_.debugAudioFile);
    }
  }

  std::lock_guard<std::mutex> lock(transcribersMutex_);
  for (auto it = transcribers_.begin(); it != transcribers_.end();)
  {
    if (it->done->load())
    {
      it->thread.join();
      it = transcribers_.erase(it);
    }
    else
    {
      ++it;
    }
  }

  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([this, job = std::move(job), done]()
                     {
    TranscriptionResult result;
    if (job.audio.empty())
    {
      result.ok = true;
    }
    else
    {
      result = engine_->transcribe(job.audio);
    }
    finishTranscription(job.sessionId, result);
    *done = true; });
  transcribers_.push_back(Transcriber{std::move(worker), done});
}

void CaptureController::finishTranscription(uint64_t sessionId, const TranscriptionResult &result)
{
  Effects effects;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CaptureState::Transcribing || session_.id != sessionId)
    {
      AppLogger::getInstance().info("Discarding transcript of abandoned session #" + std::to_string(sessionId));
      return;
    }

    lastResult_ = result;
    ++resultSeq_;
    completedAt_ = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    awaitingResume_ = options_.autoResume;

    applyLocked(CaptureEvent::TranscriptionDone, effects);
  }
  if (effects.resetDetector)
  {
    detector_.reset();
  }

  if (result.ok)
  {
    AppLogger::getInstance().info("Transcript #" + std::to_string(sessionId) + ": " + preview(formatResult(result)));
  }
  else
  {
    AppLogger::getInstance().error("Transcription of session #" + std::to_string(sessionId) + " failed: " + result.error);
  }
  resultReady_.notify_all();
  stateChanged_.notify_all();
}

void CaptureController::onFrame(const AudioFrame &frame)
{
  // Turn-taking: nothing heard while we are talking.
  if (channel_->isSpeaking())
  {
    return;
  }

  bool feedDetector = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_)
    {
    case CaptureState::Armed:
      if (options_.autoStop)
      {
        preroll_.push_back(frame);
        while (preroll_.size() > static_cast<size_t>(std::max(1, config_.vad.minSpeechFrames)))
        {
          preroll_.pop_front();
        }
        feedDetector = true;
      }
      break;
    case CaptureState::Recording:
      session_.frames.push_back(frame);
      feedDetector = options_.autoStop;
      break;
    case CaptureState::Idle:
    case CaptureState::Transcribing:
      break;
    }
  }

  if (feedDetector)
  {
    detector_.processFrame(frame);
  }
}

void CaptureController::onSpeechStart()
{
  CaptureState current = state();
  if (current != CaptureState::Armed && current != CaptureState::Recording)
  {
    return;
  }
  channel_->signalStop();
  dispatch(CaptureEvent::SpeechStart);
}

void CaptureController::onSpeechEnd()
{
  dispatch(CaptureEvent::SpeechEnd);
}

void CaptureController::onDeviceError(const std::string &message)
{
  AppLogger::getInstance().error("Input device failure: " + message);
  dispatch(CaptureEvent::DeviceFailure);
}

void CaptureController::monitorLoop()
{
  const std::chrono::milliseconds interval(std::max(1, config_.tickMs));
  while (true)
  {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      stateChanged_.wait_for(lock, interval, [this]()
                             { return state_ == CaptureState::Idle; });
      if (state_ == CaptureState::Idle)
      {
        break;
      }
    }
    tick();
  }
  releaseDevices();
}

void CaptureController::tick()
{
  const auto now = std::chrono::steady_clock::now();
  detector_.poll(now);

  bool limitReached = false;
  bool checkResume = false;
  std::chrono::system_clock::time_point completedAt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CaptureState::Recording &&
        now - session_.startedAt >= std::chrono::milliseconds(config_.maxRecordingMs))
    {
      limitReached = true;
    }
    else if (state_ == CaptureState::Armed && awaitingResume_ && options_.autoResume)
    {
      checkResume = true;
      completedAt = completedAt_;
    }
  }

  if (limitReached)
  {
    AppLogger::getInstance().warning("Maximum recording length reached (" + std::to_string(config_.maxRecordingMs) + " ms)");
    dispatch(CaptureEvent::LimitReached);
  }
  else if (checkResume && resumeDue(completedAt))
  {
    dispatch(CaptureEvent::ResumeReady);
  }
}

bool CaptureController::resumeDue(std::chrono::system_clock::time_point completedAt)
{
  // Wait for a reply that started and finished after the transcript was delivered.
  std::optional<std::chrono::system_clock::time_point> finishedAt = channel_->lastFinishedAt();
  if (!finishedAt || *finishedAt < completedAt)
  {
    return false;
  }
  if (channel_->isSpeaking())
  {
    return false;
  }

  std::chrono::milliseconds echoDelay;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    echoDelay = echoDelay_;
  }
  return std::chrono::system_clock::now() >= *finishedAt + echoDelay;
}

void CaptureController::releaseDevices()
{
  if (hotkey_)
  {
    hotkey_->stop();
  }
  device_->closeCapture();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hotkeyActive_ = false;
  }
  AppLogger::getInstance().info("Capture released the input device");
}

void CaptureController::joinMonitor()
{
  if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id())
  {
    monitor_.join();
  }
}
