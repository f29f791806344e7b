#include "AppLogger.hpp"
#include "commandShell.hpp"
#include "configLoader.hpp"
#include "pipelineFactory.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

namespace
{
void usage(const char *program)
{
  std::cerr << "usage: " << program << " say|listen|duplex [--config FILE]" << std::endl;
}

void reportBackendHealth(const std::vector<std::shared_ptr<SynthesisBackend>> &backends)
{
  AppLogger::getInstance().info("Checking synthesis backends...");
  bool anyAvailable = false;
  for (const auto &backend : backends)
  {
    bool up = backend->available();
    anyAvailable = anyAvailable || up;
    AppLogger::getInstance().info("  " + backend->name() + ": " + (up ? "available" : "unavailable"));
  }
  if (!anyAvailable)
  {
    AppLogger::getInstance().error("No synthesis backend is reachable; utterances will be undeliverable until one comes up.");
  }
}
}

int main(int argc, char **argv, char **envp)
{
  if (argc < 2)
  {
    usage(argv[0]);
    return 2;
  }

  ShellMode mode;
  if (!parseShellMode(argv[1], mode))
  {
    usage(argv[0]);
    return 2;
  }

  std::string configPath = "voicelink.conf";
  if (const char *fromEnv = std::getenv("VOICELINK_CONFIG"))
  {
    configPath = fromEnv;
  }
  for (int i = 2; i < argc; ++i)
  {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
    {
      configPath = argv[++i];
    }
    else
    {
      usage(argv[0]);
      return 2;
    }
  }

  ConfigLoader config;
  if (!config.loadFromFile(configPath))
  {
    AppLogger::getInstance().warning("Configuration file " + configPath + " not found; using defaults.");
  }
  config.applyEnvironment("VOICELINK_", envp);

  AppLogger::getInstance().setLevel(config.getString("log.level", "info"));
  const std::string logFile = config.getString("log.file", "");
  if (!logFile.empty() && !AppLogger::getInstance().open(logFile))
  {
    std::cerr << "Could not open log file " << logFile << std::endl;
  }
  AppLogger::getInstance().info(std::string("voicelink starting in ") + argv[1] + " mode");

  auto device = std::make_shared<PortAudioDevice>(config.getInt("audio.sampleRate", 16000),
                                                  config.getInt("audio.frameMs", 20),
                                                  config.getInt("audio.playbackChunkMs", 50));
  if (!device->isInitialized())
  {
    AppLogger::getInstance().error("PortAudio initialization failed. Audio capture and playback are unavailable.");
  }

  std::shared_ptr<CoordinationChannel> channel = buildCoordinationChannel(config);

  std::unique_ptr<SpeechQueue> queue;
  std::unique_ptr<SayEndpoint> say;
  if (mode != ShellMode::Listen)
  {
    std::vector<std::shared_ptr<SynthesisBackend>> backends = buildSynthesisBackends(config, device);
    reportBackendHealth(backends);
    queue = std::make_unique<SpeechQueue>(backends, channel, speechQueueConfig(config));
    say = std::make_unique<SayEndpoint>(*queue);
  }

  std::unique_ptr<CaptureController> controller;
  std::unique_ptr<ListenEndpoint> listen;
  if (mode != ShellMode::Say)
  {
    std::shared_ptr<TranscriptionEngine> engine = buildTranscriptionEngine(config);
    if (!engine->available())
    {
      AppLogger::getInstance().warning("Transcription engine '" + engine->name() + "' is not available yet.");
    }
    controller = std::make_unique<CaptureController>(device, engine, channel,
                                                     std::make_unique<EvdevHotkeySource>(config.getString("stt.inputDirectory", "/dev/input")),
                                                     captureControllerConfig(config));
    if (queue)
    {
      SpeechQueue *localQueue = queue.get();
      controller->setCancelHook([localQueue]()
                                { return localQueue->cancelAll(); });
    }
    listen = std::make_unique<ListenEndpoint>(*controller);
  }

  CommandShell shell(mode, say.get(), listen.get(),
                     std::chrono::milliseconds(config.getInt("shell.waitTimeoutMs", 30000)));

  std::ios_base::sync_with_stdio(false);
  std::cin.tie(NULL);

  std::cout << "voicelink ready. Type help for commands." << std::endl;
  std::string line;
  while (std::getline(std::cin, line))
  {
    bool quit = false;
    std::string response = shell.execute(line, quit);
    if (!response.empty())
    {
      std::cout << response << std::endl;
    }
    if (quit)
    {
      break;
    }
  }

  AppLogger::getInstance().info("voicelink shutting down");
  controller.reset();
  if (queue)
  {
    queue->shutdown();
  }
  return 0;
}
