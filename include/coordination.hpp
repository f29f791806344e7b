#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Minimal key/value signal surface shared by the speaking and listening pipelines.
class SignalStore
{
public:
  virtual ~SignalStore() = default;

  virtual bool set(const std::string &key, const std::string &value) = 0;

  // Atomically reads and removes the key. Exactly one concurrent caller sees true.
  virtual bool testAndClear(const std::string &key) = 0;

  virtual std::optional<std::string> get(const std::string &key) const = 0;

  virtual void clear(const std::string &key) = 0;
};

// Used when both pipelines live in one process.
class MemorySignalStore : public SignalStore
{
public:
  bool set(const std::string &key, const std::string &value) override;
  bool testAndClear(const std::string &key) override;
  std::optional<std::string> get(const std::string &key) const override;
  void clear(const std::string &key) override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> values_;
};

// One marker file per key. Writers create a unique temp file and rename() it over the
// marker, so readers never observe a half-written value.
class FileSignalStore : public SignalStore
{
public:
  explicit FileSignalStore(const std::string &directory, const std::string &prefix = "voicelink-");

  bool set(const std::string &key, const std::string &value) override;
  bool testAndClear(const std::string &key) override;
  std::optional<std::string> get(const std::string &key) const override;
  void clear(const std::string &key) override;

  std::string pathFor(const std::string &key) const;

private:
  std::string directory_;
  std::string prefix_;
  std::atomic<unsigned> tempCounter_{0};
};

// Busy/idle handshake and stop signaling between SpeechQueue and CaptureController.
class CoordinationChannel
{
public:
  using WallClock = std::chrono::system_clock;

  static constexpr const char *STOP_KEY = "stop";
  static constexpr const char *SPEECH_KEY = "speech";

  explicit CoordinationChannel(std::shared_ptr<SignalStore> store,
                               std::chrono::milliseconds speakingTtl = std::chrono::milliseconds(250));

  void signalStop();
  bool consumeStopSignal();
  void clearStopSignal();

  void markSpeaking(bool speaking);

  // Local flag, or another process's "speaking" marker whose owner is still alive.
  // The marker lookup is cached for the TTL.
  bool isSpeaking();

  std::optional<WallClock::time_point> lastFinishedAt() const;

  SignalStore &store() { return *store_; }

private:
  struct SpeechMarker
  {
    bool speaking = false;
    long pid = 0;
    WallClock::time_point at;
  };

  std::shared_ptr<SignalStore> store_;
  std::chrono::milliseconds speakingTtl_;

  std::atomic<bool> localSpeaking_{false};

  std::mutex cacheMutex_;
  bool cachedRemoteSpeaking_ = false;
  std::chrono::steady_clock::time_point cacheExpiry_;

  std::optional<SpeechMarker> readMarker() const;
  void invalidateCache();
};

std::string formatSpeechMarker(bool speaking, long pid, std::chrono::system_clock::time_point at);
