#pragma once

#include "audioDevice.hpp"
#include "captureController.hpp"
#include "configLoader.hpp"
#include "coordination.hpp"
#include "speechQueue.hpp"
#include "synthesis.hpp"
#include "transcription.hpp"

#include <memory>
#include <vector>

// Builds the components from configuration. Selection happens once at startup.

std::shared_ptr<CoordinationChannel> buildCoordinationChannel(const ConfigLoader &config);

// Ranked by tts.backends; a name whose tts.<name>.type is "command" (default for
// "native") runs a local synthesizer, anything else is an HTTP service.
std::vector<std::shared_ptr<SynthesisBackend>> buildSynthesisBackends(const ConfigLoader &config,
                                                                      std::shared_ptr<AudioDevice> device);

SpeechQueueConfig speechQueueConfig(const ConfigLoader &config);

std::shared_ptr<TranscriptionEngine> buildTranscriptionEngine(const ConfigLoader &config);

CaptureControllerConfig captureControllerConfig(const ConfigLoader &config);
