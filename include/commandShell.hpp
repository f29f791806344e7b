#pragma once

#include "endpoints.hpp"

#include <chrono>
#include <map>
#include <string>

enum class ShellMode
{
  Say,
  Listen,
  Duplex
};

bool parseShellMode(const std::string &name, ShellMode &mode);

// One shell line: a command word, leading name=value options, and the remaining text.
struct ShellCommand
{
  std::string name;
  std::map<std::string, std::string> options;
  std::string text;
};

ShellCommand parseShellCommand(const std::string &line);

// Line-oriented front end over the endpoints. Either endpoint may be absent.
class CommandShell
{
public:
  CommandShell(ShellMode mode, SayEndpoint *say, ListenEndpoint *listen,
               std::chrono::milliseconds defaultWaitTimeout = std::chrono::milliseconds(30000));

  // Returns the response text; sets quit when the session should end.
  std::string execute(const std::string &line, bool &quit);

  std::string help() const;

private:
  ShellMode mode_;
  SayEndpoint *say_;
  ListenEndpoint *listen_;
  std::chrono::milliseconds defaultWaitTimeout_;

  std::string runSay(const std::string &verb, const ShellCommand &command);
  std::string runListen(const std::string &verb, const ShellCommand &command);
};
