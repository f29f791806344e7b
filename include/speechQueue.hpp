#pragma once

#include "coordination.hpp"
#include "synthesis.hpp"
#include "voiceStatus.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct SpeechQueueConfig
{
  float defaultSpeed = 1.1f;
  float minSpeed = 0.5f;
  float maxSpeed = 2.0f;
};

enum class UtteranceOutcome
{
  Completed,
  Cancelled,
  Undeliverable
};

const char *toString(UtteranceOutcome outcome);

struct EnqueueResult
{
  Status status;
  uint64_t id = 0;
  size_t position = 0; // items ahead of this one, including the one playing
};

struct WaitResult
{
  Status status;
  UtteranceOutcome outcome = UtteranceOutcome::Cancelled;
};

// The utterance being played right now and the backend playing it.
struct PlaybackSession
{
  Utterance utterance;
  std::string backendInUse;
  std::chrono::steady_clock::time_point startedAt;
};

// FIFO of outgoing utterances played one at a time by a single worker thread. Backends
// are tried in rank order; the speaking flag on the channel tracks the live session.
class SpeechQueue
{
public:
  using PlaybackListener = std::function<void(const Utterance &, UtteranceOutcome, const std::string &backend)>;

  SpeechQueue(std::vector<std::shared_ptr<SynthesisBackend>> backends,
              std::shared_ptr<CoordinationChannel> channel,
              const SpeechQueueConfig &config = SpeechQueueConfig());
  ~SpeechQueue();

  SpeechQueue(const SpeechQueue &) = delete;
  SpeechQueue &operator=(const SpeechQueue &) = delete;

  EnqueueResult enqueue(const std::string &text,
                        const std::optional<std::string> &voice = std::nullopt,
                        std::optional<float> speed = std::nullopt);

  // Returns once every utterance queued up to and including this one has settled,
  // or with a Timeout status (playback continues).
  WaitResult enqueueAndWait(const std::string &text,
                            const std::optional<std::string> &voice,
                            std::optional<float> speed,
                            std::chrono::milliseconds timeout);

  // Clears pending utterances and stops the one playing. Returns the number cleared
  // from the queue.
  size_t cancelAll();

  // Stops only the utterance playing. False when nothing was playing.
  bool skip();

  size_t pendingCount() const;
  bool isPlaying() const;
  std::optional<PlaybackSession> currentSession() const;

  std::vector<std::string> listVoices();

  // Invoked on the worker thread after each utterance settles.
  void setPlaybackListener(PlaybackListener listener);

  void shutdown();

private:
  std::vector<std::shared_ptr<SynthesisBackend>> backends_;
  std::shared_ptr<CoordinationChannel> channel_;
  SpeechQueueConfig config_;

  mutable std::mutex mutex_;
  std::condition_variable workAvailable_;
  std::condition_variable settled_;

  std::deque<Utterance> pending_;
  uint64_t nextId_ = 1;
  uint64_t settledThrough_ = 0;
  uint64_t clearedThrough_ = 0;
  std::optional<PlaybackSession> session_;
  std::map<uint64_t, UtteranceOutcome> outcomes_;
  std::set<uint64_t> abandoned_;
  PlaybackListener listener_;
  bool stopping_ = false;

  std::atomic<bool> cancelCurrent_{false};
  std::thread worker_;

  Status validate(const std::string &text, std::optional<float> speed) const;
  uint64_t push(const std::string &text, const std::optional<std::string> &voice, float speed, bool blocking, size_t &position);
  void workerLoop();
  UtteranceOutcome play(const Utterance &utterance, std::string &backendUsed);
  // Expects mutex_ held.
  void recordOutcome(const Utterance &utterance, UtteranceOutcome outcome);
  void abortBackends(uint64_t utteranceId);
};
