#include "endpoints.hpp"

#include <sstream>

std::string describe(const Status &status)
{
  if (status.ok())
  {
    return status.message;
  }
  return std::string("Error (") + toString(status.code) + "): " + status.message;
}

SayEndpoint::SayEndpoint(SpeechQueue &queue)
    : queue_(queue)
{
}

std::string SayEndpoint::speak(const std::string &text, const std::optional<std::string> &voice, std::optional<float> speed)
{
  return describe(queue_.enqueue(text, voice, speed).status);
}

std::string SayEndpoint::speakAndWait(const std::string &text,
                                      const std::optional<std::string> &voice,
                                      std::optional<float> speed,
                                      std::chrono::milliseconds timeout)
{
  WaitResult result = queue_.enqueueAndWait(text, voice, speed, timeout);
  if (result.status.code == VoiceError::Timeout)
  {
    return std::string(ResultMarker::Timeout) + " " + result.status.message;
  }
  return describe(result.status);
}

std::string SayEndpoint::stop()
{
  const bool wasPlaying = queue_.isPlaying();
  const size_t cleared = queue_.cancelAll();
  return std::string(wasPlaying ? "Stopped" : "Nothing playing") + ". " +
         std::to_string(cleared) + " message(s) cleared from queue.";
}

std::string SayEndpoint::skip()
{
  if (!queue_.skip())
  {
    return "Nothing playing.";
  }
  return "Skipped current message. " + std::to_string(queue_.pendingCount()) + " message(s) remaining.";
}

std::string SayEndpoint::queueStatus()
{
  std::ostringstream out;
  std::optional<PlaybackSession> session = queue_.currentSession();
  out << "Status: " << (session ? "Speaking" : "Idle") << "\n";
  if (session)
  {
    out << "Current: " << session->utterance.text.substr(0, 50);
    if (!session->backendInUse.empty())
    {
      out << " [" << session->backendInUse << "]";
    }
    out << "\n";
  }
  out << "Messages in queue: " << queue_.pendingCount();
  return out.str();
}

std::string SayEndpoint::listVoices()
{
  std::vector<std::string> voices = queue_.listVoices();
  if (voices.empty())
  {
    return "No voices available.";
  }
  std::ostringstream out;
  out << "Available voices:";
  for (const std::string &voice : voices)
  {
    out << "\n  " << voice;
  }
  return out.str();
}

ListenEndpoint::ListenEndpoint(CaptureController &controller)
    : controller_(controller)
{
}

std::string ListenEndpoint::start(const StartOptions &options)
{
  return describe(controller_.start(options));
}

std::string ListenEndpoint::stop()
{
  Status status = controller_.stop();
  if (status.code == VoiceError::NotActive)
  {
    return "Capture was not active.";
  }
  return describe(status);
}

std::string ListenEndpoint::status()
{
  CaptureStatus status = controller_.getStatus();
  std::ostringstream out;
  out << "State: " << toString(status.state) << "\n"
      << "Mode: " << (status.autoStopEnabled ? "auto-stop (VAD)" : "manual") << "\n"
      << "Auto-resume: " << (status.autoResumeEnabled ? "on" : "off") << "\n"
      << "Speaker busy: " << (status.speaking ? "yes" : "no") << "\n"
      << "Hotkey: " << status.key << (status.hotkeyActive ? "" : " (inactive)");
  if (status.hasResult)
  {
    out << "\nLast result: " << status.lastResultPreview;
  }
  return out.str();
}

std::string ListenEndpoint::getResult(bool wait, std::chrono::milliseconds timeout)
{
  return controller_.getResult(wait, timeout);
}

std::string ListenEndpoint::interrupt(const std::string &reason)
{
  return describe(controller_.interrupt(reason));
}

std::string ListenEndpoint::toggle()
{
  return describe(controller_.toggle());
}

std::string ListenEndpoint::transcribeNow(std::chrono::milliseconds timeout)
{
  return controller_.transcribeNow(timeout);
}
