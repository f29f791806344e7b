#include "captureStateMachine.hpp"

namespace
{
CaptureTransition accept(CaptureState next)
{
  return {next, true};
}

CaptureTransition reject(CaptureState current)
{
  return {current, false};
}
}

CaptureTransition transition(CaptureState state, CaptureEvent event, const CaptureOptions &options)
{
  if (event == CaptureEvent::Stop || event == CaptureEvent::DeviceFailure)
  {
    return state == CaptureState::Idle ? reject(state) : accept(CaptureState::Idle);
  }

  switch (state)
  {
  case CaptureState::Idle:
    if (event == CaptureEvent::Start)
    {
      return accept(CaptureState::Armed);
    }
    break;

  case CaptureState::Armed:
    if (event == CaptureEvent::Toggle)
    {
      return accept(CaptureState::Recording);
    }
    if (event == CaptureEvent::SpeechStart && options.autoStop)
    {
      return accept(CaptureState::Recording);
    }
    if (event == CaptureEvent::ResumeReady && options.autoResume)
    {
      return accept(CaptureState::Recording);
    }
    break;

  case CaptureState::Recording:
    if (event == CaptureEvent::Toggle || event == CaptureEvent::LimitReached)
    {
      return accept(CaptureState::Transcribing);
    }
    if (event == CaptureEvent::SpeechEnd && options.autoStop)
    {
      return accept(CaptureState::Transcribing);
    }
    break;

  case CaptureState::Transcribing:
    if (event == CaptureEvent::TranscriptionDone)
    {
      return accept(CaptureState::Armed);
    }
    break;
  }
  return reject(state);
}

const char *toString(CaptureState state)
{
  switch (state)
  {
  case CaptureState::Idle:
    return "Idle";
  case CaptureState::Armed:
    return "Armed";
  case CaptureState::Recording:
    return "Recording";
  case CaptureState::Transcribing:
    return "Transcribing";
  }
  return "Unknown";
}

const char *toString(CaptureEvent event)
{
  switch (event)
  {
  case CaptureEvent::Start:
    return "Start";
  case CaptureEvent::Toggle:
    return "Toggle";
  case CaptureEvent::SpeechStart:
    return "SpeechStart";
  case CaptureEvent::SpeechEnd:
    return "SpeechEnd";
  case CaptureEvent::LimitReached:
    return "LimitReached";
  case CaptureEvent::TranscriptionDone:
    return "TranscriptionDone";
  case CaptureEvent::ResumeReady:
    return "ResumeReady";
  case CaptureEvent::Stop:
    return "Stop";
  case CaptureEvent::DeviceFailure:
    return "DeviceFailure";
  }
  return "Unknown";
}
