#pragma once

#include "captureController.hpp"
#include "speechQueue.hpp"

#include <chrono>
#include <optional>
#include <string>

// Text responses for the speaking side, as returned to the driving agent.
class SayEndpoint
{
public:
  explicit SayEndpoint(SpeechQueue &queue);

  std::string speak(const std::string &text, const std::optional<std::string> &voice, std::optional<float> speed);
  std::string speakAndWait(const std::string &text,
                           const std::optional<std::string> &voice,
                           std::optional<float> speed,
                           std::chrono::milliseconds timeout);
  std::string stop();
  std::string skip();
  std::string queueStatus();
  std::string listVoices();

private:
  SpeechQueue &queue_;
};

// Text responses for the listening side.
class ListenEndpoint
{
public:
  explicit ListenEndpoint(CaptureController &controller);

  std::string start(const StartOptions &options);
  std::string stop();
  std::string status();
  std::string getResult(bool wait, std::chrono::milliseconds timeout);
  std::string interrupt(const std::string &reason);
  std::string toggle();
  std::string transcribeNow(std::chrono::milliseconds timeout);

private:
  CaptureController &controller_;
};

// "Error (InvalidInput): text is empty" for failures, the bare message otherwise.
std::string describe(const Status &status);
