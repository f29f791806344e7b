#pragma once

#include "wav.hpp"

#include <chrono>
#include <string>
#include <vector>

struct TranscriptionResult
{
  bool ok = false;
  std::string text;
  std::string languageTag;
  float confidence = 0.0f;
  std::string error;
};

// Turns one recorded session into text. Called off the capture threads.
class TranscriptionEngine
{
public:
  virtual ~TranscriptionEngine() = default;

  virtual std::string name() const = 0;
  virtual bool available() = 0;
  virtual TranscriptionResult transcribe(const AudioBuffer &audio) = 0;
};

struct HttpTranscriptionConfig
{
  std::string host = "127.0.0.1";
  int port = 8124;
  std::string path = "/transcribe";
  std::string healthPath = "/health";
  std::string authToken;
  int timeoutSeconds = 30;
};

// Posts the session as a multipart WAV upload and reads {text, language, confidence}.
class HttpTranscriptionEngine : public TranscriptionEngine
{
public:
  explicit HttpTranscriptionEngine(const HttpTranscriptionConfig &config);

  std::string name() const override { return "http"; }
  bool available() override;
  TranscriptionResult transcribe(const AudioBuffer &audio) override;

  static bool parseResponse(const std::string &body, TranscriptionResult &result);

private:
  HttpTranscriptionConfig config_;
};

struct CommandTranscriptionConfig
{
  std::string command = "whisper-cli";
  std::vector<std::string> args;
  std::string languageTag = "en";
  std::string workDirectory = "/tmp";
  std::chrono::milliseconds timeout{120000};
};

// Local recognizer run as `<command> <args...> <wavfile>`; the transcript is its stdout.
class CommandTranscriptionEngine : public TranscriptionEngine
{
public:
  explicit CommandTranscriptionEngine(const CommandTranscriptionConfig &config);

  std::string name() const override { return config_.command; }
  bool available() override;
  TranscriptionResult transcribe(const AudioBuffer &audio) override;

private:
  CommandTranscriptionConfig config_;
  unsigned counter_ = 0;
};
