#include "pipelineFactory.hpp"
#include "AppLogger.hpp"

std::shared_ptr<CoordinationChannel> buildCoordinationChannel(const ConfigLoader &config)
{
  const std::string directory = config.getString("coordination.directory", "/tmp");
  auto store = std::make_shared<FileSignalStore>(directory);
  const int ttlMs = config.getInt("coordination.speakingTtlMs", 250);
  AppLogger::getInstance().info("Coordination signals under " + directory);
  return std::make_shared<CoordinationChannel>(store, std::chrono::milliseconds(ttlMs));
}

std::vector<std::shared_ptr<SynthesisBackend>> buildSynthesisBackends(const ConfigLoader &config,
                                                                      std::shared_ptr<AudioDevice> device)
{
  const std::chrono::milliseconds healthTtl(config.getInt("tts.healthTtlMs", 5000));
  std::vector<std::shared_ptr<SynthesisBackend>> backends;

  for (const std::string &name : config.getList("tts.backends", {"neural", "native"}))
  {
    const std::string prefix = "tts." + name + ".";
    const std::string type = config.getString(prefix + "type", name == "native" ? "command" : "http");

    if (type == "command")
    {
      CommandSynthesisConfig commandConfig;
      commandConfig.command = config.getString(prefix + "command", commandConfig.command);
      commandConfig.wordsPerMinute = config.getInt(prefix + "wordsPerMinute", commandConfig.wordsPerMinute);
      commandConfig.pollInterval = std::chrono::milliseconds(config.getInt("tts.pollIntervalMs", 50));
      backends.push_back(std::make_shared<CommandSynthesisBackend>(name, commandConfig, healthTtl));
    }
    else if (type == "http")
    {
      HttpSynthesisConfig httpConfig;
      httpConfig.host = config.getString(prefix + "host", httpConfig.host);
      httpConfig.port = config.getInt(prefix + "port", httpConfig.port);
      httpConfig.synthesizePath = config.getString(prefix + "path", httpConfig.synthesizePath);
      httpConfig.healthPath = config.getString(prefix + "healthPath", httpConfig.healthPath);
      httpConfig.voicesPath = config.getString(prefix + "voicesPath", httpConfig.voicesPath);
      httpConfig.authToken = config.getString(prefix + "authToken", "");
      httpConfig.timeoutSeconds = config.getInt(prefix + "timeoutSeconds", httpConfig.timeoutSeconds);
      httpConfig.pollInterval = std::chrono::milliseconds(config.getInt("tts.pollIntervalMs", 50));
      backends.push_back(std::make_shared<HttpSynthesisBackend>(name, httpConfig, device, healthTtl));
    }
    else
    {
      AppLogger::getInstance().error("Unknown type '" + type + "' for synthesis backend '" + name + "', skipped");
      continue;
    }
    AppLogger::getInstance().info("Synthesis backend #" + std::to_string(backends.size()) + ": " + name + " (" + type + ")");
  }
  return backends;
}

SpeechQueueConfig speechQueueConfig(const ConfigLoader &config)
{
  SpeechQueueConfig queueConfig;
  queueConfig.defaultSpeed = config.getFloat("tts.defaultSpeed", queueConfig.defaultSpeed);
  queueConfig.minSpeed = config.getFloat("tts.minSpeed", queueConfig.minSpeed);
  queueConfig.maxSpeed = config.getFloat("tts.maxSpeed", queueConfig.maxSpeed);
  return queueConfig;
}

std::shared_ptr<TranscriptionEngine> buildTranscriptionEngine(const ConfigLoader &config)
{
  const std::string engine = config.getString("stt.engine", "http");
  if (engine == "command")
  {
    CommandTranscriptionConfig commandConfig;
    commandConfig.command = config.getString("stt.command", commandConfig.command);
    commandConfig.args = config.getList("stt.args", {});
    commandConfig.languageTag = config.getString("stt.language", commandConfig.languageTag);
    commandConfig.workDirectory = config.getString("stt.workDirectory", commandConfig.workDirectory);
    commandConfig.timeout = std::chrono::milliseconds(config.getInt("stt.timeoutMs", 120000));
    AppLogger::getInstance().info("Transcription engine: command '" + commandConfig.command + "'");
    return std::make_shared<CommandTranscriptionEngine>(commandConfig);
  }

  if (engine != "http")
  {
    AppLogger::getInstance().warning("Unknown stt.engine '" + engine + "', using http");
  }
  HttpTranscriptionConfig httpConfig;
  httpConfig.host = config.getString("stt.http.host", httpConfig.host);
  httpConfig.port = config.getInt("stt.http.port", httpConfig.port);
  httpConfig.path = config.getString("stt.http.path", httpConfig.path);
  httpConfig.healthPath = config.getString("stt.http.healthPath", httpConfig.healthPath);
  httpConfig.authToken = config.getString("stt.http.authToken", "");
  httpConfig.timeoutSeconds = config.getInt("stt.http.timeoutSeconds", httpConfig.timeoutSeconds);
  AppLogger::getInstance().info("Transcription engine: http " + httpConfig.host + ":" + std::to_string(httpConfig.port));
  return std::make_shared<HttpTranscriptionEngine>(httpConfig);
}

CaptureControllerConfig captureControllerConfig(const ConfigLoader &config)
{
  CaptureControllerConfig captureConfig;
  captureConfig.defaultKey = config.getString("stt.key", captureConfig.defaultKey);
  captureConfig.autoStop = config.getBool("stt.autoStop", captureConfig.autoStop);
  captureConfig.silenceMs = config.getInt("stt.silenceMs", captureConfig.silenceMs);
  captureConfig.autoResume = config.getBool("stt.autoResume", captureConfig.autoResume);
  captureConfig.echoDelayMs = config.getInt("stt.echoDelayMs", captureConfig.echoDelayMs);
  captureConfig.maxRecordingMs = config.getInt("stt.maxRecordingMs", captureConfig.maxRecordingMs);
  captureConfig.tickMs = config.getInt("stt.tickMs", captureConfig.tickMs);
  captureConfig.saveDebugAudio = config.getBool("stt.saveDebugAudio", captureConfig.saveDebugAudio);
  captureConfig.debugAudioFile = config.getString("stt.debugAudioFile", captureConfig.debugAudioFile);
  captureConfig.vad.energyThreshold = config.getFloat("vad.energyThreshold", captureConfig.vad.energyThreshold);
  captureConfig.vad.minSpeechFrames = config.getInt("vad.minSpeechFrames", captureConfig.vad.minSpeechFrames);
  captureConfig.vad.silenceTimeoutMs = captureConfig.silenceMs;
  return captureConfig;
}
