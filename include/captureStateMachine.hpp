#pragma once

enum class CaptureState
{
  Idle,
  Armed,
  Recording,
  Transcribing
};

enum class CaptureEvent
{
  Start,
  Toggle,
  SpeechStart,
  SpeechEnd,
  LimitReached,
  TranscriptionDone,
  ResumeReady,
  Stop,
  DeviceFailure
};

struct CaptureOptions
{
  bool autoStop = false;
  bool autoResume = false;
};

struct CaptureTransition
{
  CaptureState next;
  bool accepted;
};

// Pure transition table. Rejected events leave the state unchanged.
CaptureTransition transition(CaptureState state, CaptureEvent event, const CaptureOptions &options);

const char *toString(CaptureState state);
const char *toString(CaptureEvent event);
