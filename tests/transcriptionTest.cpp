#include "childProcess.hpp"
#include "synthesis.hpp"
#include "transcription.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <thread>
#include <sys/stat.h>
#include <unistd.h>

using namespace std::chrono_literals;

TEST(HttpTranscriptionResponse, ParsesFields)
{
  TranscriptionResult result;
  ASSERT_TRUE(HttpTranscriptionEngine::parseResponse(R"({"text": "  turn on the lights ", "language": "en", "confidence": 0.82})", result));
  EXPECT_TRUE(result.ok);
  EXPECT_EQ(result.text, "turn on the lights");
  EXPECT_EQ(result.languageTag, "en");
  EXPECT_NEAR(result.confidence, 0.82f, 1e-5);
}

TEST(HttpTranscriptionResponse, MissingFieldsDefault)
{
  TranscriptionResult result;
  ASSERT_TRUE(HttpTranscriptionEngine::parseResponse(R"({"text": ""})", result));
  EXPECT_TRUE(result.ok);
  EXPECT_TRUE(result.text.empty());
  EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST(HttpTranscriptionResponse, MalformedBodyFails)
{
  TranscriptionResult result;
  EXPECT_FALSE(HttpTranscriptionEngine::parseResponse("<html>502</html>", result));
  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("malformed"), std::string::npos);
}

TEST(CommandTranscription, ReadsTranscriptFromStdout)
{
  CommandTranscriptionConfig config;
  config.command = "sh";
  config.args = {"-c", "test -s \"$1\" && echo '  hello there  '", "sh"};
  CommandTranscriptionEngine engine(config);
  ASSERT_TRUE(engine.available());

  AudioBuffer audio;
  audio.samples.assign(1600, 100);
  TranscriptionResult result = engine.transcribe(audio);

  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.text, "hello there");
  EXPECT_EQ(result.languageTag, "en");
}

TEST(CommandTranscription, NonZeroExitIsFailure)
{
  CommandTranscriptionConfig config;
  config.command = "false";
  CommandTranscriptionEngine engine(config);

  AudioBuffer audio;
  audio.samples.assign(160, 0);
  TranscriptionResult result = engine.transcribe(audio);
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.error.empty());
}

TEST(CommandTranscription, MissingCommandUnavailable)
{
  CommandTranscriptionConfig config;
  config.command = "voicelink-no-such-recognizer";
  CommandTranscriptionEngine engine(config);
  EXPECT_FALSE(engine.available());
}

TEST(CommandSynthesis, CommandLineScalesSpeed)
{
  CommandSynthesisBackend backend("native", CommandSynthesisConfig(), 1000ms);

  Utterance utterance;
  utterance.text = "-starts with a dash";
  utterance.speedFactor = 1.1f;
  EXPECT_EQ(backend.commandLine(utterance),
            (std::vector<std::string>{"espeak-ng", "-s", "193", "--", "-starts with a dash"}));

  utterance.voiceOverride = "en-us";
  utterance.speedFactor = 0.5f;
  EXPECT_EQ(backend.commandLine(utterance),
            (std::vector<std::string>{"espeak-ng", "-s", "88", "-v", "en-us", "--", "-starts with a dash"}));
}

TEST(CommandSynthesis, ExitStatusDecidesOutcome)
{
  CommandSynthesisConfig ok;
  ok.command = "true";
  CommandSynthesisBackend working("native", ok, 1000ms);
  EXPECT_TRUE(working.available());

  Utterance utterance;
  utterance.text = "hello";
  std::string error;
  EXPECT_EQ(working.speak(utterance, nullptr, error), SynthesisResult::Completed);

  CommandSynthesisConfig bad;
  bad.command = "false";
  CommandSynthesisBackend broken("native", bad, 1000ms);
  EXPECT_EQ(broken.speak(utterance, nullptr, error), SynthesisResult::Failed);
  EXPECT_FALSE(error.empty());
}

TEST(ChildProcess, StopPredicateTerminatesChild)
{
  ChildProcess process;
  std::string error;
  ASSERT_TRUE(process.start({"sleep", "5"}, false, error)) << error;

  const auto started = std::chrono::steady_clock::now();
  int exitCode = 0;
  ChildProcess::Outcome outcome = process.wait([started]()
                                               { return std::chrono::steady_clock::now() - started > 50ms; },
                                               10ms, 0ms, exitCode);

  EXPECT_EQ(outcome, ChildProcess::Outcome::Stopped);
  EXPECT_FALSE(process.running());
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2000ms);
}

TEST(ChildProcess, TimeoutTerminatesChild)
{
  ChildProcess process;
  std::string error;
  ASSERT_TRUE(process.start({"sleep", "5"}, false, error)) << error;

  int exitCode = 0;
  EXPECT_EQ(process.wait(nullptr, 10ms, 50ms, exitCode), ChildProcess::Outcome::TimedOut);
}

TEST(ChildProcess, MissingProgramFailsToStart)
{
  ChildProcess process;
  std::string error;
  EXPECT_FALSE(process.start({"voicelink-no-such-program"}, false, error));
  EXPECT_FALSE(error.empty());
}

TEST(ChildProcess, TimeoutKillsChildIgnoringSigterm)
{
  ChildProcess process;
  std::string error;
  ASSERT_TRUE(process.start({"sh", "-c", "trap '' TERM; sleep 5"}, false, error)) << error;
  // Give the shell time to install the trap.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const auto started = std::chrono::steady_clock::now();
  int exitCode = 0;
  EXPECT_EQ(process.wait(nullptr, 20ms, 100ms, exitCode), ChildProcess::Outcome::TimedOut);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 100ms + ChildProcess::KILL_GRACE + 1000ms);
  EXPECT_FALSE(process.running());
}

TEST(ChildProcess, StopKillsChildIgnoringSigterm)
{
  ChildProcess process;
  std::string error;
  ASSERT_TRUE(process.start({"sh", "-c", "trap '' TERM; sleep 5"}, false, error)) << error;
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const auto started = std::chrono::steady_clock::now();
  int exitCode = 0;
  EXPECT_EQ(process.wait([]()
                         { return true; },
                         10ms, 0ms, exitCode),
            ChildProcess::Outcome::Stopped);
  EXPECT_LT(std::chrono::steady_clock::now() - started, ChildProcess::KILL_GRACE + 1000ms);
}

TEST(CommandTranscription, TimeoutBoundsStuckRecognizer)
{
  CommandTranscriptionConfig config;
  config.command = "sh";
  config.args = {"-c", "trap '' TERM; sleep 5", "sh"};
  config.timeout = 200ms;
  CommandTranscriptionEngine engine(config);

  AudioBuffer audio;
  audio.samples.assign(160, 0);
  const auto started = std::chrono::steady_clock::now();
  TranscriptionResult result = engine.transcribe(audio);

  EXPECT_FALSE(result.ok);
  EXPECT_NE(result.error.find("timed out"), std::string::npos);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST(CommandSynthesis, AbortEndsSynthesizerIgnoringSigterm)
{
  const std::string script = "/tmp/voicelink-stubborn-tts-" + std::to_string(::getpid()) + ".sh";
  {
    std::ofstream out(script);
    out << "#!/bin/sh\ntrap '' TERM\nsleep 5\n";
  }
  ASSERT_EQ(::chmod(script.c_str(), 0755), 0);

  CommandSynthesisConfig config;
  config.command = script;
  config.pollInterval = 10ms;
  CommandSynthesisBackend backend("native", config, 1000ms);

  Utterance utterance;
  utterance.id = 4;
  utterance.text = "hello";

  std::thread aborter([&backend]()
                      {
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    backend.abort(4); });

  const auto started = std::chrono::steady_clock::now();
  std::string error;
  SynthesisResult result = backend.speak(utterance, nullptr, error);
  aborter.join();
  std::remove(script.c_str());

  EXPECT_EQ(result, SynthesisResult::Stopped);
  EXPECT_LT(std::chrono::steady_clock::now() - started, ChildProcess::KILL_GRACE + 1500ms);
}
