#include "commandShell.hpp"
#include "configLoader.hpp"

#include <cstdio>
#include <set>
#include <sstream>
#include <stdexcept>

namespace
{
bool optionFloat(const ShellCommand &command, const std::string &key, std::optional<float> &out, std::string &error)
{
  auto it = command.options.find(key);
  if (it == command.options.end())
  {
    return true;
  }
  try
  {
    size_t used = 0;
    float value = std::stof(it->second, &used);
    if (used != it->second.size())
    {
      throw std::invalid_argument(it->second);
    }
    out = value;
    return true;
  }
  catch (const std::logic_error &)
  {
    error = "Error (InvalidParameter): " + key + " must be a number";
    return false;
  }
}

bool optionInt(const ShellCommand &command, const std::string &key, std::optional<int> &out, std::string &error)
{
  auto it = command.options.find(key);
  if (it == command.options.end())
  {
    return true;
  }
  try
  {
    size_t used = 0;
    int value = std::stoi(it->second, &used);
    if (used != it->second.size())
    {
      throw std::invalid_argument(it->second);
    }
    out = value;
    return true;
  }
  catch (const std::logic_error &)
  {
    error = "Error (InvalidParameter): " + key + " must be an integer";
    return false;
  }
}

bool optionBool(const ShellCommand &command, const std::string &key, std::optional<bool> &out, std::string &error)
{
  auto it = command.options.find(key);
  if (it == command.options.end())
  {
    return true;
  }
  bool value = false;
  if (!parseBool(it->second, value))
  {
    error = "Error (InvalidParameter): " + key + " must be true or false";
    return false;
  }
  out = value;
  return true;
}

// Keys each verb accepts before its text; anything else starts the text.
const std::set<std::string> &knownOptions(const std::string &verb)
{
  static const std::set<std::string> none;
  static const std::map<std::string, std::set<std::string>> byVerb = {
      {"speak", {"voice", "speed"}},
      {"speak_and_wait", {"voice", "speed", "timeout"}},
      {"start", {"key", "auto_stop", "silence_ms", "auto_resume", "echo_delay_ms"}},
      {"get_result", {"wait", "timeout_ms"}},
      {"transcribe_now", {"timeout_ms"}},
  };
  auto it = byVerb.find(verb);
  return it == byVerb.end() ? none : it->second;
}

std::optional<std::string> optionString(const ShellCommand &command, const std::string &key)
{
  auto it = command.options.find(key);
  if (it == command.options.end())
  {
    return std::nullopt;
  }
  return it->second;
}
}

bool parseShellMode(const std::string &name, ShellMode &mode)
{
  if (name == "say")
  {
    mode = ShellMode::Say;
  }
  else if (name == "listen")
  {
    mode = ShellMode::Listen;
  }
  else if (name == "duplex")
  {
    mode = ShellMode::Duplex;
  }
  else
  {
    return false;
  }
  return true;
}

ShellCommand parseShellCommand(const std::string &line)
{
  ShellCommand command;
  std::istringstream in(trim(line));
  in >> command.name;
  const std::set<std::string> &known = knownOptions(command.name);

  std::string token;
  while (in >> std::ws && in.peek() != EOF)
  {
    std::streampos before = in.tellg();
    in >> token;
    if (token == "--")
    {
      break;
    }
    size_t eq = token.find('=');
    if (eq == std::string::npos || known.count(token.substr(0, eq)) == 0)
    {
      in.clear();
      in.seekg(before);
      break;
    }
    command.options[token.substr(0, eq)] = token.substr(eq + 1);
  }

  std::string rest;
  std::getline(in, rest, '\0');
  command.text = trim(rest);
  return command;
}

CommandShell::CommandShell(ShellMode mode, SayEndpoint *say, ListenEndpoint *listen,
                           std::chrono::milliseconds defaultWaitTimeout)
    : mode_(mode), say_(say), listen_(listen), defaultWaitTimeout_(defaultWaitTimeout)
{
}

std::string CommandShell::help() const
{
  std::ostringstream out;
  out << "Commands:";
  if (say_)
  {
    const char *stopName = mode_ == ShellMode::Duplex ? "stop_speaking" : "stop";
    out << "\n  speak [voice=NAME] [speed=F] [--] TEXT"
        << "\n  speak_and_wait [voice=NAME] [speed=F] [timeout=MS] TEXT"
        << "\n  " << stopName
        << "\n  skip"
        << "\n  queue_status"
        << "\n  list_voices";
  }
  if (listen_)
  {
    const char *stopName = mode_ == ShellMode::Duplex ? "stop_listening" : "stop";
    out << "\n  start [key=K] [auto_stop=BOOL] [silence_ms=N] [auto_resume=BOOL] [echo_delay_ms=N]"
        << "\n  " << stopName
        << "\n  status"
        << "\n  get_result [wait=BOOL] [timeout_ms=N]"
        << "\n  interrupt [REASON]"
        << "\n  toggle"
        << "\n  transcribe_now [timeout_ms=N]";
  }
  out << "\n  help\n  quit";
  return out.str();
}

std::string CommandShell::execute(const std::string &line, bool &quit)
{
  quit = false;
  ShellCommand command = parseShellCommand(line);
  if (command.name.empty())
  {
    return "";
  }
  if (command.name == "quit" || command.name == "exit")
  {
    quit = true;
    return "Bye.";
  }
  if (command.name == "help")
  {
    return help();
  }

  std::string verb = command.name;
  if (mode_ == ShellMode::Duplex)
  {
    if (verb == "stop")
    {
      return "Ambiguous in duplex mode: use stop_speaking or stop_listening.";
    }
    if (verb == "stop_speaking")
    {
      return say_ ? runSay("stop", command) : "Unknown command: " + verb;
    }
    if (verb == "stop_listening")
    {
      return listen_ ? runListen("stop", command) : "Unknown command: " + verb;
    }
  }

  if (say_)
  {
    std::string response = runSay(verb, command);
    if (!response.empty())
    {
      return response;
    }
  }
  if (listen_)
  {
    std::string response = runListen(verb, command);
    if (!response.empty())
    {
      return response;
    }
  }
  return "Unknown command: " + verb + " (try help)";
}

std::string CommandShell::runSay(const std::string &verb, const ShellCommand &command)
{
  std::string error;
  if (verb == "speak" || verb == "speak_and_wait")
  {
    std::optional<float> speed;
    std::optional<int> timeoutMs;
    if (!optionFloat(command, "speed", speed, error) || !optionInt(command, "timeout", timeoutMs, error))
    {
      return error;
    }
    std::optional<std::string> voice = optionString(command, "voice");
    if (verb == "speak")
    {
      return say_->speak(command.text, voice, speed);
    }
    std::chrono::milliseconds timeout = timeoutMs ? std::chrono::milliseconds(*timeoutMs) : defaultWaitTimeout_;
    return say_->speakAndWait(command.text, voice, speed, timeout);
  }
  if (verb == "stop")
  {
    return say_->stop();
  }
  if (verb == "skip")
  {
    return say_->skip();
  }
  if (verb == "queue_status")
  {
    return say_->queueStatus();
  }
  if (verb == "list_voices")
  {
    return say_->listVoices();
  }
  return "";
}

std::string CommandShell::runListen(const std::string &verb, const ShellCommand &command)
{
  std::string error;
  if (verb == "start")
  {
    StartOptions options;
    options.key = optionString(command, "key").value_or("");
    if (!optionBool(command, "auto_stop", options.autoStop, error) ||
        !optionInt(command, "silence_ms", options.silenceMs, error) ||
        !optionBool(command, "auto_resume", options.autoResume, error) ||
        !optionInt(command, "echo_delay_ms", options.echoDelayMs, error))
    {
      return error;
    }
    return listen_->start(options);
  }
  if (verb == "stop")
  {
    return listen_->stop();
  }
  if (verb == "status")
  {
    return listen_->status();
  }
  if (verb == "get_result" || verb == "transcribe_now")
  {
    std::optional<bool> wait;
    std::optional<int> timeoutMs;
    if (!optionBool(command, "wait", wait, error) || !optionInt(command, "timeout_ms", timeoutMs, error))
    {
      return error;
    }
    std::chrono::milliseconds timeout = timeoutMs ? std::chrono::milliseconds(*timeoutMs) : defaultWaitTimeout_;
    if (verb == "transcribe_now")
    {
      return listen_->transcribeNow(timeout);
    }
    return listen_->getResult(wait.value_or(false), timeout);
  }
  if (verb == "interrupt")
  {
    return listen_->interrupt(command.text);
  }
  if (verb == "toggle")
  {
    return listen_->toggle();
  }
  return "";
}
