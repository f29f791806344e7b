#include "commandShell.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(ParseShellCommand, SplitsOptionsFromText)
{
  ShellCommand command = parseShellCommand("  speak voice=en-us speed=1.3 Hello there, x=1 stays  ");
  EXPECT_EQ(command.name, "speak");
  EXPECT_EQ(command.options.at("voice"), "en-us");
  EXPECT_EQ(command.options.at("speed"), "1.3");
  EXPECT_EQ(command.text, "Hello there, x=1 stays");
}

TEST(ParseShellCommand, UnknownKeysStayInText)
{
  ShellCommand command = parseShellCommand("speak E=mc2 is famous");
  EXPECT_TRUE(command.options.empty());
  EXPECT_EQ(command.text, "E=mc2 is famous");

  command = parseShellCommand("speak_and_wait timeout=500 voice=alba a=b");
  EXPECT_EQ(command.options.at("timeout"), "500");
  EXPECT_EQ(command.options.at("voice"), "alba");
  EXPECT_EQ(command.text, "a=b");

  // Keys belong to their verb.
  command = parseShellCommand("interrupt voice=loud");
  EXPECT_TRUE(command.options.empty());
  EXPECT_EQ(command.text, "voice=loud");
}

TEST(ParseShellCommand, DoubleDashEndsOptions)
{
  ShellCommand command = parseShellCommand("speak speed=1.2 -- voice=alba is a setting");
  EXPECT_EQ(command.options.size(), 1u);
  EXPECT_EQ(command.options.at("speed"), "1.2");
  EXPECT_EQ(command.text, "voice=alba is a setting");
}

TEST(ParseShellCommand, BareCommand)
{
  ShellCommand command = parseShellCommand("status");
  EXPECT_EQ(command.name, "status");
  EXPECT_TRUE(command.options.empty());
  EXPECT_TRUE(command.text.empty());
}

class CommandShellTest : public ::testing::Test
{
protected:
  std::shared_ptr<CoordinationChannel> channel =
      std::make_shared<CoordinationChannel>(std::make_shared<MemorySignalStore>(), 0ms);
  std::shared_ptr<FakeSynthesisBackend> backend = std::make_shared<FakeSynthesisBackend>("native", 5ms);
  SpeechQueue queue{{backend}, channel};
  SayEndpoint say{queue};

  std::shared_ptr<FakeAudioDevice> device = std::make_shared<FakeAudioDevice>();
  std::shared_ptr<FakeTranscriptionEngine> engine = std::make_shared<FakeTranscriptionEngine>();
  CaptureController controller{device, engine, channel, nullptr, CaptureControllerConfig()};
  ListenEndpoint listen{controller};

  std::string run(CommandShell &shell, const std::string &line)
  {
    bool quit = false;
    return shell.execute(line, quit);
  }
};

TEST_F(CommandShellTest, SpeakValidatesInput)
{
  CommandShell shell(ShellMode::Say, &say, nullptr);
  EXPECT_EQ(run(shell, "speak"), "Error (InvalidInput): text is empty");
  EXPECT_EQ(run(shell, "speak speed=9 hi"), "Error (InvalidParameter): speed must be between 0.500000 and 2.000000");
  EXPECT_EQ(run(shell, "speak speed=fast hi"), "Error (InvalidParameter): speed must be a number");
  EXPECT_EQ(run(shell, "speak Hello"), "Added to queue: Hello");
}

TEST_F(CommandShellTest, SpeakAndWaitCompletes)
{
  CommandShell shell(ShellMode::Say, &say, nullptr);
  EXPECT_EQ(run(shell, "speak_and_wait timeout=5000 Good morning"), "Speech completed");
  EXPECT_EQ(backend->completed(), (std::vector<std::string>{"Good morning"}));
}

TEST_F(CommandShellTest, StopReportsClearedCount)
{
  CommandShell shell(ShellMode::Say, &say, nullptr);
  EXPECT_EQ(run(shell, "stop"), "Nothing playing. 0 message(s) cleared from queue.");
  EXPECT_EQ(run(shell, "queue_status"), "Status: Idle\nMessages in queue: 0");
  EXPECT_EQ(run(shell, "skip"), "Nothing playing.");
}

TEST_F(CommandShellTest, ListenCommands)
{
  CommandShell shell(ShellMode::Listen, nullptr, &listen);
  EXPECT_EQ(run(shell, "get_result"), "[Ready]");
  EXPECT_EQ(run(shell, "start key=nope"), "Error (InvalidInput): Unknown key 'nope'");
  EXPECT_EQ(run(shell, "start silence_ms=abc"), "Error (InvalidParameter): silence_ms must be an integer");
  EXPECT_NE(run(shell, "start").find("Listening"), std::string::npos);
  EXPECT_EQ(run(shell, "toggle"), "Recording started");
  device->emit(makeFrame(8000, std::chrono::steady_clock::now()));
  EXPECT_EQ(run(shell, "transcribe_now timeout_ms=3000"), "hello world");
  EXPECT_NE(run(shell, "status").find("Last result: hello world"), std::string::npos);
  EXPECT_EQ(run(shell, "stop"), "Capture stopped");
  EXPECT_EQ(run(shell, "stop"), "Capture was not active.");
}

TEST_F(CommandShellTest, DuplexDisambiguatesStop)
{
  CommandShell shell(ShellMode::Duplex, &say, &listen);
  EXPECT_NE(run(shell, "stop").find("stop_speaking"), std::string::npos);
  EXPECT_EQ(run(shell, "stop_speaking"), "Nothing playing. 0 message(s) cleared from queue.");
  EXPECT_EQ(run(shell, "stop_listening"), "Capture was not active.");
  EXPECT_NE(run(shell, "help").find("stop_listening"), std::string::npos);
}

TEST_F(CommandShellTest, UnknownAndQuit)
{
  CommandShell shell(ShellMode::Say, &say, nullptr);
  EXPECT_EQ(run(shell, "start"), "Unknown command: start (try help)");

  bool quit = false;
  shell.execute("quit", quit);
  EXPECT_TRUE(quit);
  EXPECT_EQ(shell.execute("", quit), "");
  EXPECT_FALSE(quit);
}
