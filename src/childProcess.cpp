#include "childProcess.hpp"
#include "AppLogger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

ChildProcess::~ChildProcess()
{
  if (running())
  {
    int exitCode = 0;
    terminateAndReap(exitCode);
  }
  closeOutput();
}

bool ChildProcess::executableExists(const std::string &name)
{
  if (name.find('/') != std::string::npos)
  {
    return ::access(name.c_str(), X_OK) == 0;
  }

  const char *pathEnv = std::getenv("PATH");
  if (pathEnv == nullptr)
  {
    return false;
  }

  std::stringstream paths(pathEnv);
  std::string dir;
  while (std::getline(paths, dir, ':'))
  {
    if (dir.empty())
    {
      continue;
    }
    std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0)
    {
      return true;
    }
  }
  return false;
}

bool ChildProcess::start(const std::vector<std::string> &argv, bool captureStdout, std::string &error)
{
  if (argv.empty())
  {
    error = "empty command line";
    return false;
  }
  if (running())
  {
    error = "process already running";
    return false;
  }
  output_.clear();

  int pipeFds[2] = {-1, -1};
  if (captureStdout && ::pipe2(pipeFds, O_CLOEXEC) != 0)
  {
    error = "pipe() failed: " + std::string(std::strerror(errno));
    return false;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  if (captureStdout)
  {
    posix_spawn_file_actions_adddup2(&actions, pipeFds[1], STDOUT_FILENO);
  }
  else
  {
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
  }
  posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const std::string &arg : argv)
  {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  // Own process group, so players started by a wrapper script are signalled with it.
  posix_spawnattr_t attributes;
  posix_spawnattr_init(&attributes);
  posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attributes, 0);

  pid_t child = 0;
  int rc = posix_spawnp(&child, args[0], &actions, &attributes, args.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attributes);

  if (captureStdout)
  {
    ::close(pipeFds[1]);
  }

  if (rc != 0)
  {
    error = "could not start '" + argv[0] + "': " + std::string(std::strerror(rc));
    if (captureStdout)
    {
      ::close(pipeFds[0]);
    }
    return false;
  }

  stdoutFd_ = captureStdout ? pipeFds[0] : -1;
  pid_ = child;
  AppLogger::getInstance().debug("Started '" + argv[0] + "' (pid " + std::to_string(child) + ")");
  return true;
}

void ChildProcess::drainOutput(int timeoutMs)
{
  if (stdoutFd_ < 0)
  {
    if (timeoutMs > 0)
    {
      std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
    }
    return;
  }

  pollfd pfd{stdoutFd_, POLLIN, 0};
  int ready = ::poll(&pfd, 1, timeoutMs);
  if (ready <= 0)
  {
    return;
  }

  char buffer[4096];
  ssize_t n = ::read(stdoutFd_, buffer, sizeof(buffer));
  if (n > 0)
  {
    output_.append(buffer, static_cast<size_t>(n));
  }
  else if (n == 0)
  {
    closeOutput();
  }
}

void ChildProcess::closeOutput()
{
  if (stdoutFd_ >= 0)
  {
    ::close(stdoutFd_);
    stdoutFd_ = -1;
  }
}

bool ChildProcess::reap(bool block, int &exitCode)
{
  pid_t child = pid_.load();
  if (child <= 0)
  {
    return true;
  }

  int status = 0;
  pid_t rc = ::waitpid(child, &status, block ? 0 : WNOHANG);
  if (rc == 0)
  {
    return false;
  }

  pid_ = 0;
  if (rc < 0)
  {
    exitCode = -1;
    return true;
  }
  exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
  return true;
}

ChildProcess::Outcome ChildProcess::wait(const std::function<bool()> &shouldStop,
                                         std::chrono::milliseconds pollInterval,
                                         std::chrono::milliseconds timeout,
                                         int &exitCode)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  exitCode = -1;

  while (true)
  {
    if (reap(false, exitCode))
    {
      // Collect whatever the child wrote before exiting; bounded in case a grandchild holds the pipe.
      for (int attempt = 0; stdoutFd_ >= 0 && attempt < 100; ++attempt)
      {
        drainOutput(10);
      }
      closeOutput();
      return exitCode < 0 ? Outcome::Failed : Outcome::Exited;
    }

    if (shouldStop && shouldStop())
    {
      terminateAndReap(exitCode);
      closeOutput();
      return Outcome::Stopped;
    }

    if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline)
    {
      AppLogger::getInstance().warning("Child pid " + std::to_string(pid_.load()) + " timed out after " +
                                       std::to_string(timeout.count()) + " ms");
      terminateAndReap(exitCode);
      closeOutput();
      return Outcome::TimedOut;
    }

    drainOutput(static_cast<int>(pollInterval.count()));
  }
}

void ChildProcess::terminate()
{
  signalGroup(SIGTERM);
}

void ChildProcess::signalGroup(int signal)
{
  pid_t child = pid_.load();
  if (child <= 0)
  {
    return;
  }
  if (::kill(-child, signal) != 0)
  {
    ::kill(child, signal);
  }
}

void ChildProcess::terminateAndReap(int &exitCode)
{
  signalGroup(SIGTERM);

  const auto graceEnd = std::chrono::steady_clock::now() + KILL_GRACE;
  while (std::chrono::steady_clock::now() < graceEnd)
  {
    if (reap(false, exitCode))
    {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  AppLogger::getInstance().warning("Child pid " + std::to_string(pid_.load()) + " ignored SIGTERM, killing it");
  signalGroup(SIGKILL);
  reap(true, exitCode);
}
