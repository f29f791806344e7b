#include "transcription.hpp"
#include "AppLogger.hpp"
#include "childProcess.hpp"
#include "configLoader.hpp"

#include "httplib.h"
#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <unistd.h>

using json = nlohmann::json;

HttpTranscriptionEngine::HttpTranscriptionEngine(const HttpTranscriptionConfig &config)
    : config_(config)
{
}

bool HttpTranscriptionEngine::available()
{
  httplib::Client cli(config_.host, config_.port);
  cli.set_connection_timeout(std::chrono::seconds(3));
  cli.set_read_timeout(std::chrono::seconds(3));

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

  std::string message = "Transcription service not reachable.";
  if (res)
  {
    message += " Status: " + std::to_string(res->status);
  }
  else
  {
    message += " Error: " + httplib::to_string(res.error());
  }
  AppLogger::getInstance().warning(message);
  return false;
}

bool HttpTranscriptionEngine::parseResponse(const std::string &body, TranscriptionResult &result)
{
  try
  {
    json reply = json::parse(body);
    result.text = trim(reply.value("text", std::string()));
    result.languageTag = reply.value("language", std::string());
    result.confidence = reply.value("confidence", 0.0f);
    result.ok = true;
    return true;
  }
  catch (const json::exception &e)
  {
    result.ok = false;
    result.error = std::string("malformed response: ") + e.what();
    return false;
  }
}

TranscriptionResult HttpTranscriptionEngine::transcribe(const AudioBuffer &audio)
{
  TranscriptionResult result;
  AppLogger::getInstance().info("Uploading " + std::to_string(audio.samples.size()) + " samples for transcription");

  httplib::Client cli(config_.host, config_.port);
  if (!config_.authToken.empty())
  {
    cli.set_default_headers({{"X-Auth", config_.authToken}});
  }
  cli.set_connection_timeout(std::chrono::seconds(5));
  cli.set_read_timeout(std::chrono::seconds(config_.timeoutSeconds));
  cli.set_write_timeout(std::chrono::seconds(config_.timeoutSeconds));

  std::vector<uint8_t> wavData = encodeWav(audio);
  std::string wav_content(wavData.begin(), wavData.end());

  std::vector<httplib::MultipartFormData> items = {
      {"file",
       wav_content,
       "recording.wav",
       "audio/wav"}};

  auto res = cli.Post(config_.path.c_str(), items);

  if (!res)
  {
    result.error = "request failed: " + httplib::to_string(res.error());
    return result;
  }
  if (res->status != 200)
  {
    result.error = "server returned status " + std::to_string(res->status);
    AppLogger::getInstance().error(result.error + ". Body: " + res->body.substr(0, 200));
    return result;
  }

  parseResponse(res->body, result);
  return result;
}

CommandTranscriptionEngine::CommandTranscriptionEngine(const CommandTranscriptionConfig &config)
    : config_(config)
{
}

bool CommandTranscriptionEngine::available()
{
  return ChildProcess::executableExists(config_.command);
}

TranscriptionResult CommandTranscriptionEngine::transcribe(const AudioBuffer &audio)
{
  TranscriptionResult result;

  const std::string wavPath = (std::filesystem::path(config_.workDirectory) /
                               ("voicelink-capture-" + std::to_string(::getpid()) + "-" +
                                std::to_string(counter_++) + ".wav"))
                                  .string();
  if (!writeWavFile(wavPath, audio))
  {
    result.error = "could not write " + wavPath;
    return result;
  }

  std::vector<std::string> argv;
  argv.push_back(config_.command);
  argv.insert(argv.end(), config_.args.begin(), config_.args.end());
  argv.push_back(wavPath);

  ChildProcess process;
  int exitCode = 0;
  ChildProcess::Outcome outcome = ChildProcess::Outcome::Failed;
  if (process.start(argv, true, result.error))
  {
    outcome = process.wait(nullptr, std::chrono::milliseconds(50), config_.timeout, exitCode);
  }
  std::remove(wavPath.c_str());

  if (outcome == ChildProcess::Outcome::TimedOut)
  {
    result.error = config_.command + " timed out";
    return result;
  }
  if (outcome != ChildProcess::Outcome::Exited || exitCode != 0)
  {
    if (result.error.empty())
    {
      result.error = config_.command + " exited with code " + std::to_string(exitCode);
    }
    return result;
  }

  result.ok = true;
  result.text = trim(process.output());
  result.languageTag = config_.languageTag;
  result.confidence = result.text.empty() ? 0.0f : 1.0f;
  return result;
}
