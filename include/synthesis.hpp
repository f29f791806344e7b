#pragma once

#include "audioDevice.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

// One outgoing text-to-speech request. Immutable once queued.
struct Utterance
{
  uint64_t id = 0;
  std::string text;
  std::optional<std::string> voiceOverride;
  float speedFactor = 1.0f;
  bool blocking = false;
};

enum class SynthesisResult
{
  Completed,
  Stopped,
  Failed
};

// A ranked speech backend. Health is checked at most once per TTL; a failed
// synthesis marks the backend down until the TTL runs out.
class SynthesisBackend
{
public:
  SynthesisBackend(std::string name, std::chrono::milliseconds healthTtl);
  virtual ~SynthesisBackend() = default;

  const std::string &name() const { return name_; }

  bool available();
  void markUnavailable();

  // Plays the utterance to the end unless shouldStop turns true.
  virtual SynthesisResult speak(const Utterance &utterance, const StopPredicate &shouldStop, std::string &error) = 0;

  // Ends speak() of the given utterance from another thread. Ignored once a later
  // utterance has started on this backend.
  virtual void abort(uint64_t utteranceId);

  virtual std::vector<std::string> listVoices() { return {}; }

protected:
  virtual bool checkHealth() = 0;

  // Called by speak() before any work; drops an abort left over from an earlier utterance.
  void beginUtterance(uint64_t utteranceId);
  bool abortRequested() const { return aborted_.load(); }

  // Interrupts the active utterance. Runs with the abort lock held.
  virtual void onAbort() = 0;

private:
  std::string name_;
  std::chrono::milliseconds healthTtl_;

  std::mutex abortMutex_;
  uint64_t activeUtterance_ = 0;
  std::atomic<bool> aborted_{false};

  std::mutex healthMutex_;
  bool healthy_ = false;
  std::chrono::steady_clock::time_point healthExpiry_;
};

struct HttpSynthesisConfig
{
  std::string host = "127.0.0.1";
  int port = 8123;
  std::string synthesizePath = "/synthesize";
  std::string healthPath = "/health";
  std::string voicesPath = "/voices";
  std::string authToken;
  int timeoutSeconds = 30;
  std::chrono::milliseconds pollInterval{50};
};

// Neural model service or cloud API reached over HTTP. The service returns a WAV
// that is streamed to the output device in short chunks.
class HttpSynthesisBackend : public SynthesisBackend
{
public:
  HttpSynthesisBackend(const std::string &name,
                       const HttpSynthesisConfig &config,
                       std::shared_ptr<AudioDevice> device,
                       std::chrono::milliseconds healthTtl);

  SynthesisResult speak(const Utterance &utterance, const StopPredicate &shouldStop, std::string &error) override;
  std::vector<std::string> listVoices() override;

protected:
  bool checkHealth() override;
  void onAbort() override;

private:
  HttpSynthesisConfig config_;
  std::shared_ptr<AudioDevice> device_;

  // The request is cancelled within one poll interval of shouldStop turning true.
  bool fetchAudio(const Utterance &utterance, const StopPredicate &shouldStop,
                  std::vector<uint8_t> &wavData, std::string &error);
};

struct CommandSynthesisConfig
{
  std::string command = "espeak-ng";
  int wordsPerMinute = 175; // at speed 1.0
  std::chrono::milliseconds pollInterval{50};
};

// OS-native synthesizer run as a child process that plays directly to the speaker.
class CommandSynthesisBackend : public SynthesisBackend
{
public:
  CommandSynthesisBackend(const std::string &name,
                          const CommandSynthesisConfig &config,
                          std::chrono::milliseconds healthTtl);

  SynthesisResult speak(const Utterance &utterance, const StopPredicate &shouldStop, std::string &error) override;
  std::vector<std::string> listVoices() override;

  std::vector<std::string> commandLine(const Utterance &utterance) const;

protected:
  bool checkHealth() override;
  void onAbort() override;

private:
  CommandSynthesisConfig config_;
  std::atomic<pid_t> activePid_{0};
};
