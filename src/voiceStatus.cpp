#include "voiceStatus.hpp"

const char *toString(VoiceError error)
{
  switch (error)
  {
  case VoiceError::None:
    return "None";
  case VoiceError::InvalidInput:
    return "InvalidInput";
  case VoiceError::InvalidParameter:
    return "InvalidParameter";
  case VoiceError::BackendUnavailable:
    return "BackendUnavailable";
  case VoiceError::DeviceError:
    return "DeviceError";
  case VoiceError::Timeout:
    return "Timeout";
  case VoiceError::AlreadyActive:
    return "AlreadyActive";
  case VoiceError::NotActive:
    return "NotActive";
  }
  return "Unknown";
}
