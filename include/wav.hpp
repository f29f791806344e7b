#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct WavHeader
{
  char riff[4] = {'R', 'I', 'F', 'F'};
  uint32_t fileSize;
  char wave[4] = {'W', 'A', 'V', 'E'};
  char fmt[4] = {'f', 'm', 't', ' '};
  uint32_t fmtSize = 16;
  uint16_t audioFormat = 1;
  uint16_t numChannels;
  uint32_t sampleRate;
  uint32_t byteRate;
  uint16_t blockAlign;
  uint16_t bitsPerSample = 16;
  char data[4] = {'d', 'a', 't', 'a'};
  uint32_t dataSize;
} __attribute__((packed));

// Interleaved 16-bit PCM with its format.
struct AudioBuffer
{
  std::vector<int16_t> samples;
  int sampleRate = 16000;
  int channels = 1;

  bool empty() const { return samples.empty(); }
  double durationSeconds() const;
};

std::vector<uint8_t> encodeWav(const AudioBuffer &audio);

// Accepts 16-bit PCM only. Walks the chunk list for "fmt " and "data".
bool decodeWav(const std::vector<uint8_t> &wavData, AudioBuffer &out, std::string &error);

bool writeWavFile(const std::string &path, const AudioBuffer &audio);
