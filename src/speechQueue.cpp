#include "speechQueue.hpp"
#include "AppLogger.hpp"
#include "configLoader.hpp"

#include <algorithm>

const char *toString(UtteranceOutcome outcome)
{
  switch (outcome)
  {
  case UtteranceOutcome::Completed:
    return "completed";
  case UtteranceOutcome::Cancelled:
    return "cancelled";
  case UtteranceOutcome::Undeliverable:
    return "undeliverable";
  }
  return "unknown";
}

namespace
{
std::string preview(const std::string &text)
{
  return text.size() > 50 ? text.substr(0, 50) + "..." : text;
}
}

SpeechQueue::SpeechQueue(std::vector<std::shared_ptr<SynthesisBackend>> backends,
                         std::shared_ptr<CoordinationChannel> channel,
                         const SpeechQueueConfig &config)
    : backends_(std::move(backends)), channel_(std::move(channel)), config_(config)
{
  worker_ = std::thread(&SpeechQueue::workerLoop, this);
}

SpeechQueue::~SpeechQueue()
{
  shutdown();
}

void SpeechQueue::shutdown()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_)
    {
      return;
    }
    stopping_ = true;
  }
  cancelAll();
  workAvailable_.notify_all();
  if (worker_.joinable())
  {
    worker_.join();
  }
}

Status SpeechQueue::validate(const std::string &text, std::optional<float> speed) const
{
  if (trim(text).empty())
  {
    return Status::failure(VoiceError::InvalidInput, "text is empty");
  }
  if (speed && (*speed < config_.minSpeed || *speed > config_.maxSpeed))
  {
    return Status::failure(VoiceError::InvalidParameter,
                           "speed must be between " + std::to_string(config_.minSpeed) +
                               " and " + std::to_string(config_.maxSpeed));
  }
  return Status::success("");
}

uint64_t SpeechQueue::push(const std::string &text, const std::optional<std::string> &voice, float speed, bool blocking, size_t &position)
{
  std::lock_guard<std::mutex> lock(mutex_);
  Utterance utterance;
  utterance.id = nextId_++;
  utterance.text = text;
  utterance.voiceOverride = voice;
  utterance.speedFactor = speed;
  utterance.blocking = blocking;

  position = pending_.size() + (session_ ? 1 : 0);
  pending_.push_back(utterance);
  workAvailable_.notify_one();
  return utterance.id;
}

EnqueueResult SpeechQueue::enqueue(const std::string &text, const std::optional<std::string> &voice, std::optional<float> speed)
{
  EnqueueResult result;
  result.status = validate(text, speed);
  if (!result.status.ok())
  {
    return result;
  }

  result.id = push(text, voice, speed.value_or(config_.defaultSpeed), false, result.position);
  result.status = Status::success("Added to queue: " + preview(text));
  AppLogger::getInstance().info("Queued utterance #" + std::to_string(result.id) + " (" +
                                std::to_string(result.position) + " ahead)");
  return result;
}

WaitResult SpeechQueue::enqueueAndWait(const std::string &text,
                                       const std::optional<std::string> &voice,
                                       std::optional<float> speed,
                                       std::chrono::milliseconds timeout)
{
  WaitResult result;
  result.status = validate(text, speed);
  if (!result.status.ok())
  {
    return result;
  }

  size_t position = 0;
  const uint64_t id = push(text, voice, speed.value_or(config_.defaultSpeed), true, position);
  AppLogger::getInstance().info("Queued blocking utterance #" + std::to_string(id) + " (" +
                                std::to_string(position) + " ahead)");

  std::unique_lock<std::mutex> lock(mutex_);
  bool done = settled_.wait_for(lock, timeout, [this, id]()
                                { return settledThrough_ >= id; });
  if (!done)
  {
    abandoned_.insert(id);
    result.status = Status::failure(VoiceError::Timeout, "speech still in progress");
    return result;
  }

  auto it = outcomes_.find(id);
  result.outcome = it != outcomes_.end() ? it->second : UtteranceOutcome::Cancelled;
  if (it != outcomes_.end())
  {
    outcomes_.erase(it);
  }

  switch (result.outcome)
  {
  case UtteranceOutcome::Completed:
    result.status = Status::success("Speech completed");
    break;
  case UtteranceOutcome::Cancelled:
    result.status = Status::success("Speech cancelled");
    break;
  case UtteranceOutcome::Undeliverable:
    result.status = Status::failure(VoiceError::BackendUnavailable, "all synthesis backends failed");
    break;
  }
  return result;
}

void SpeechQueue::recordOutcome(const Utterance &utterance, UtteranceOutcome outcome)
{
  if (!utterance.blocking)
  {
    return;
  }
  if (abandoned_.erase(utterance.id) > 0)
  {
    return;
  }
  outcomes_[utterance.id] = outcome;
}

size_t SpeechQueue::cancelAll()
{
  size_t cleared = 0;
  bool playing = false;
  uint64_t playingId = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cleared = pending_.size();
    const uint64_t lastCleared = pending_.empty() ? 0 : pending_.back().id;
    for (const Utterance &utterance : pending_)
    {
      recordOutcome(utterance, UtteranceOutcome::Cancelled);
    }
    pending_.clear();

    playing = session_.has_value();
    if (playing)
    {
      playingId = session_->utterance.id;
      // Settled together with the in-flight utterance so joins stay in order.
      cancelCurrent_ = true;
      clearedThrough_ = std::max(clearedThrough_, lastCleared);
    }
    else
    {
      settledThrough_ = std::max(settledThrough_, lastCleared);
    }
  }
  settled_.notify_all();

  if (playing)
  {
    abortBackends(playingId);
  }
  AppLogger::getInstance().info("Speech cancelled: " + std::to_string(cleared) + " queued utterance(s) cleared" +
                                (playing ? ", playback stopped." : "."));
  return cleared;
}

bool SpeechQueue::skip()
{
  uint64_t playingId = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_)
    {
      return false;
    }
    playingId = session_->utterance.id;
    cancelCurrent_ = true;
  }
  abortBackends(playingId);
  return true;
}

void SpeechQueue::abortBackends(uint64_t utteranceId)
{
  // Backends drop the abort if the worker has already moved on to a later utterance.
  for (const auto &backend : backends_)
  {
    backend->abort(utteranceId);
  }
}

size_t SpeechQueue::pendingCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

bool SpeechQueue::isPlaying() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_.has_value();
}

std::optional<PlaybackSession> SpeechQueue::currentSession() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return session_;
}

std::vector<std::string> SpeechQueue::listVoices()
{
  for (const auto &backend : backends_)
  {
    if (!backend->available())
    {
      continue;
    }
    std::vector<std::string> voices = backend->listVoices();
    if (!voices.empty())
    {
      return voices;
    }
  }
  return {};
}

void SpeechQueue::setPlaybackListener(PlaybackListener listener)
{
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

UtteranceOutcome SpeechQueue::play(const Utterance &utterance, std::string &backendUsed)
{
  // Latches: a consumed stop signal must keep this utterance stopped.
  bool stopSeen = false;
  StopPredicate shouldStop = [this, &stopSeen]()
  {
    if (!stopSeen && (cancelCurrent_.load() || channel_->consumeStopSignal()))
    {
      stopSeen = true;
    }
    return stopSeen;
  };

  for (const auto &backend : backends_)
  {
    if (shouldStop())
    {
      return UtteranceOutcome::Cancelled;
    }
    if (!backend->available())
    {
      AppLogger::getInstance().debug("Skipping unavailable synthesis backend '" + backend->name() + "'");
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (session_)
      {
        session_->backendInUse = backend->name();
      }
    }
    backendUsed = backend->name();

    std::string error;
    switch (backend->speak(utterance, shouldStop, error))
    {
    case SynthesisResult::Completed:
      return UtteranceOutcome::Completed;
    case SynthesisResult::Stopped:
      return UtteranceOutcome::Cancelled;
    case SynthesisResult::Failed:
      break;
    }

    AppLogger::getInstance().error("Synthesis backend '" + backend->name() + "' failed on utterance #" +
                                   std::to_string(utterance.id) + ": " + error + "; trying next backend.");
    backend->markUnavailable();
  }

  AppLogger::getInstance().error("Utterance #" + std::to_string(utterance.id) + " undeliverable: no synthesis backend succeeded.");
  return UtteranceOutcome::Undeliverable;
}

void SpeechQueue::workerLoop()
{
  while (true)
  {
    Utterance utterance;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      workAvailable_.wait(lock, [this]()
                          { return stopping_ || !pending_.empty(); });
      if (stopping_)
      {
        return;
      }
      utterance = pending_.front();
      pending_.pop_front();
      settledThrough_ = std::max(settledThrough_, utterance.id - 1);
      cancelCurrent_ = false;
      session_ = PlaybackSession{utterance, "", std::chrono::steady_clock::now()};
    }

    // A stop raised while nothing was playing belongs to no utterance.
    if (channel_->consumeStopSignal())
    {
      AppLogger::getInstance().debug("Discarded stale stop signal before utterance #" + std::to_string(utterance.id));
    }
    channel_->markSpeaking(true);

    AppLogger::getInstance().info("Speaking #" + std::to_string(utterance.id) + ": " + preview(utterance.text));
    std::string backendUsed;
    UtteranceOutcome outcome = play(utterance, backendUsed);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      session_.reset();
    }
    channel_->markSpeaking(false);

    PlaybackListener listener;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      settledThrough_ = std::max({settledThrough_, utterance.id, clearedThrough_});
      recordOutcome(utterance, outcome);
      listener = listener_;
    }
    settled_.notify_all();

    AppLogger::getInstance().info("Utterance #" + std::to_string(utterance.id) + " " + toString(outcome) +
                                  (backendUsed.empty() ? "" : " (" + backendUsed + ")"));
    if (listener)
    {
      listener(utterance, outcome, backendUsed);
    }
  }
}
