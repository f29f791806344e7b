#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

// A spawned helper program (speech synthesizer, transcription CLI) that can be polled,
// stopped from another thread, and whose stdout can be collected.
class ChildProcess
{
public:
  enum class Outcome
  {
    Exited,
    Stopped,
    TimedOut,
    Failed
  };

  ChildProcess() = default;
  ~ChildProcess();

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  bool start(const std::vector<std::string> &argv, bool captureStdout, std::string &error);

  // Reaps the child. shouldStop is checked every pollInterval; a zero timeout waits forever.
  Outcome wait(const std::function<bool()> &shouldStop,
               std::chrono::milliseconds pollInterval,
               std::chrono::milliseconds timeout,
               int &exitCode);

  // Sends SIGTERM to the child's process group. Safe from any thread while the child runs.
  void terminate();

  // How long a stopped child gets to exit before SIGKILL.
  static constexpr std::chrono::milliseconds KILL_GRACE{500};

  bool running() const { return pid_.load() > 0; }
  pid_t pid() const { return pid_.load(); }

  const std::string &output() const { return output_; }

  static bool executableExists(const std::string &name);

private:
  std::atomic<pid_t> pid_{0};
  int stdoutFd_ = -1;
  std::string output_;

  void drainOutput(int timeoutMs);
  void closeOutput();
  bool reap(bool block, int &exitCode);
  void signalGroup(int signal);
  void terminateAndReap(int &exitCode);
};
