#include "synthesis.hpp"
#include "AppLogger.hpp"
#include "childProcess.hpp"

#include "httplib.h"
#include <nlohmann/json.hpp>

#include <cmath>
#include <condition_variable>
#include <signal.h>
#include <sstream>
#include <thread>

using json = nlohmann::json;

SynthesisBackend::SynthesisBackend(std::string name, std::chrono::milliseconds healthTtl)
    : name_(std::move(name)), healthTtl_(healthTtl)
{
}

bool SynthesisBackend::available()
{
  const auto now = std::chrono::steady_clock::now();
  {
    std::lock_guard<std::mutex> lock(healthMutex_);
    if (now < healthExpiry_)
    {
      return healthy_;
    }
  }

  bool healthy = checkHealth();

  std::lock_guard<std::mutex> lock(healthMutex_);
  healthy_ = healthy;
  healthExpiry_ = now + healthTtl_;
  if (!healthy)
  {
    AppLogger::getInstance().warning("Synthesis backend '" + name_ + "' failed its health check.");
  }
  return healthy;
}

void SynthesisBackend::markUnavailable()
{
  std::lock_guard<std::mutex> lock(healthMutex_);
  healthy_ = false;
  healthExpiry_ = std::chrono::steady_clock::now() + healthTtl_;
}

void SynthesisBackend::beginUtterance(uint64_t utteranceId)
{
  std::lock_guard<std::mutex> lock(abortMutex_);
  activeUtterance_ = utteranceId;
  aborted_ = false;
}

void SynthesisBackend::abort(uint64_t utteranceId)
{
  std::lock_guard<std::mutex> lock(abortMutex_);
  if (utteranceId != activeUtterance_)
  {
    AppLogger::getInstance().debug(name_ + ": ignored abort of utterance #" + std::to_string(utteranceId) +
                                   ", now on #" + std::to_string(activeUtterance_));
    return;
  }
  aborted_ = true;
  onAbort();
}

HttpSynthesisBackend::HttpSynthesisBackend(const std::string &name,
                                           const HttpSynthesisConfig &config,
                                           std::shared_ptr<AudioDevice> device,
                                           std::chrono::milliseconds healthTtl)
    : SynthesisBackend(name, healthTtl), config_(config), device_(std::move(device))
{
}

bool HttpSynthesisBackend::checkHealth()
{
  httplib::Client cli(config_.host, config_.port);
  cli.set_connection_timeout(std::chrono::seconds(2));
  cli.set_read_timeout(std::chrono::seconds(2));

  httplib::Headers headers;
  if (!config_.authToken.empty())
  {
    headers.emplace("X-Auth", config_.authToken);
  }
  auto res = cli.Get(config_.healthPath.c_str(), headers);
  if (res && res->status == 200)
  {
    return true;
  }

  if (res)
  {
    AppLogger::getInstance().debug(name() + ": health returned status " + std::to_string(res->status));
  }
  else
  {
    AppLogger::getInstance().debug(name() + ": health request failed: " + httplib::to_string(res.error()));
  }
  return false;
}

bool HttpSynthesisBackend::fetchAudio(const Utterance &utterance, const StopPredicate &shouldStop,
                                      std::vector<uint8_t> &wavData, std::string &error)
{
  httplib::Client cli(config_.host, config_.port);
  cli.set_connection_timeout(std::chrono::seconds(5));
  cli.set_read_timeout(std::chrono::seconds(config_.timeoutSeconds));
  cli.set_write_timeout(std::chrono::seconds(config_.timeoutSeconds));
  if (!config_.authToken.empty())
  {
    cli.set_default_headers({{"X-Auth", config_.authToken}});
  }

  json request = {
      {"text", utterance.text},
      {"speed", utterance.speedFactor}};
  if (utterance.voiceOverride)
  {
    request["voice"] = *utterance.voiceOverride;
  }

  // Closes the socket of the blocked Post once a stop arrives. Keeps closing until the
  // request returns, since a stop issued before the connect has no socket to shut.
  std::mutex watchMutex;
  std::condition_variable watchCv;
  bool requestDone = false;
  std::thread watcher([&]()
                      {
    std::unique_lock<std::mutex> lock(watchMutex);
    bool stopping = false;
    while (!watchCv.wait_for(lock, config_.pollInterval, [&]() { return requestDone; }))
    {
      if (stopping || (shouldStop && shouldStop()))
      {
        stopping = true;
        cli.stop();
      }
    } });

  auto res = cli.Post(config_.synthesizePath.c_str(), request.dump(), "application/json");
  {
    std::lock_guard<std::mutex> lock(watchMutex);
    requestDone = true;
  }
  watchCv.notify_all();
  watcher.join();

  if (!res)
  {
    error = "request failed: " + httplib::to_string(res.error());
    return false;
  }
  if (res->status != 200)
  {
    error = "server returned status " + std::to_string(res->status) + ": " + res->body.substr(0, 200);
    return false;
  }

  wavData.assign(res->body.begin(), res->body.end());
  return true;
}

SynthesisResult HttpSynthesisBackend::speak(const Utterance &utterance, const StopPredicate &shouldStop, std::string &error)
{
  beginUtterance(utterance.id);
  auto stopRequested = [&]()
  {
    return abortRequested() || (shouldStop && shouldStop());
  };

  std::vector<uint8_t> wavData;
  if (!fetchAudio(utterance, stopRequested, wavData, error))
  {
    return stopRequested() ? SynthesisResult::Stopped : SynthesisResult::Failed;
  }
  if (stopRequested())
  {
    return SynthesisResult::Stopped;
  }

  AudioBuffer audio;
  if (!decodeWav(wavData, audio, error))
  {
    return SynthesisResult::Failed;
  }

  AppLogger::getInstance().debug(name() + ": playing " + std::to_string(audio.durationSeconds()) + "s of audio");
  switch (device_->play(audio, stopRequested, error))
  {
  case PlaybackResult::Completed:
    return SynthesisResult::Completed;
  case PlaybackResult::Stopped:
    return SynthesisResult::Stopped;
  case PlaybackResult::Failed:
    break;
  }
  return SynthesisResult::Failed;
}

void HttpSynthesisBackend::onAbort()
{
  device_->abortPlayback();
}

std::vector<std::string> HttpSynthesisBackend::listVoices()
{
  httplib::Client cli(config_.host, config_.port);
  cli.set_connection_timeout(std::chrono::seconds(2));
  cli.set_read_timeout(std::chrono::seconds(5));

  auto res = cli.Get(config_.voicesPath.c_str());
  if (!res || res->status != 200)
  {
    return {};
  }

  std::vector<std::string> voices;
  try
  {
    json body = json::parse(res->body);
    for (const auto &voice : body.value("voices", json::array()))
    {
      voices.push_back(voice.get<std::string>());
    }
  }
  catch (const json::exception &e)
  {
    AppLogger::getInstance().warning(name() + ": could not parse voice list: " + e.what());
  }
  return voices;
}

CommandSynthesisBackend::CommandSynthesisBackend(const std::string &name,
                                                 const CommandSynthesisConfig &config,
                                                 std::chrono::milliseconds healthTtl)
    : SynthesisBackend(name, healthTtl), config_(config)
{
}

bool CommandSynthesisBackend::checkHealth()
{
  return ChildProcess::executableExists(config_.command);
}

std::vector<std::string> CommandSynthesisBackend::commandLine(const Utterance &utterance) const
{
  const long wordsPerMinute = std::lround(utterance.speedFactor * config_.wordsPerMinute);

  std::vector<std::string> argv = {config_.command, "-s", std::to_string(wordsPerMinute)};
  if (utterance.voiceOverride && !utterance.voiceOverride->empty())
  {
    argv.push_back("-v");
    argv.push_back(*utterance.voiceOverride);
  }
  // "--" keeps text starting with '-' from being read as an option.
  argv.push_back("--");
  argv.push_back(utterance.text);
  return argv;
}

SynthesisResult CommandSynthesisBackend::speak(const Utterance &utterance, const StopPredicate &shouldStop, std::string &error)
{
  beginUtterance(utterance.id);

  ChildProcess process;
  if (!process.start(commandLine(utterance), false, error))
  {
    return SynthesisResult::Failed;
  }
  activePid_ = process.pid();

  auto stopRequested = [&]()
  {
    return abortRequested() || (shouldStop && shouldStop());
  };

  int exitCode = 0;
  ChildProcess::Outcome outcome = process.wait(stopRequested, config_.pollInterval, std::chrono::milliseconds(0), exitCode);
  activePid_ = 0;

  if (outcome == ChildProcess::Outcome::Stopped || abortRequested())
  {
    return SynthesisResult::Stopped;
  }
  if (outcome == ChildProcess::Outcome::Exited && exitCode == 0)
  {
    return SynthesisResult::Completed;
  }

  error = config_.command + " exited with code " + std::to_string(exitCode);
  return SynthesisResult::Failed;
}

void CommandSynthesisBackend::onAbort()
{
  // The wait loop escalates to SIGKILL if the synthesizer ignores this.
  pid_t pid = activePid_.load();
  if (pid > 0)
  {
    ::kill(-pid, SIGTERM);
  }
}

std::vector<std::string> CommandSynthesisBackend::listVoices()
{
  ChildProcess process;
  std::string error;
  if (!process.start({config_.command, "--voices"}, true, error))
  {
    AppLogger::getInstance().warning(name() + ": " + error);
    return {};
  }

  int exitCode = 0;
  process.wait(nullptr, std::chrono::milliseconds(20), std::chrono::milliseconds(5000), exitCode);

  // espeak-ng columns: Pty Language Age/Gender VoiceName File Other
  std::vector<std::string> voices;
  std::istringstream lines(process.output());
  std::string line;
  std::getline(lines, line); // header
  while (std::getline(lines, line) && voices.size() < 20)
  {
    std::istringstream fields(line);
    std::string priority, language, gender, voiceName;
    if (fields >> priority >> language >> gender >> voiceName)
    {
      voices.push_back(voiceName + " (" + language + ")");
    }
  }
  return voices;
}
