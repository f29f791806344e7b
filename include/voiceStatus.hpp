#pragma once

#include <string>

enum class VoiceError
{
  None,
  InvalidInput,
  InvalidParameter,
  BackendUnavailable,
  DeviceError,
  Timeout,
  AlreadyActive,
  NotActive
};

const char *toString(VoiceError error);

// Outcome of a pipeline operation as reported to the driving agent.
struct Status
{
  VoiceError code = VoiceError::None;
  std::string message;

  bool ok() const { return code == VoiceError::None; }

  static Status success(const std::string &message) { return {VoiceError::None, message}; }
  static Status failure(VoiceError code, const std::string &message) { return {code, message}; }
};
