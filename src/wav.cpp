#include "wav.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>

double AudioBuffer::durationSeconds() const
{
  if (sampleRate <= 0 || channels <= 0)
  {
    return 0.0;
  }
  return static_cast<double>(samples.size()) / channels / sampleRate;
}

std::vector<uint8_t> encodeWav(const AudioBuffer &audio)
{
  WavHeader header;
  header.numChannels = static_cast<uint16_t>(audio.channels);
  header.sampleRate = static_cast<uint32_t>(audio.sampleRate);
  header.byteRate = audio.sampleRate * audio.channels * 2;
  header.blockAlign = static_cast<uint16_t>(audio.channels * 2);

  uint32_t dataSize = static_cast<uint32_t>(audio.samples.size() * sizeof(int16_t));
  header.dataSize = dataSize;
  header.fileSize = sizeof(WavHeader) - 8 + dataSize;

  std::vector<uint8_t> wavData;
  wavData.reserve(sizeof(WavHeader) + dataSize);

  wavData.resize(sizeof(WavHeader));
  std::memcpy(wavData.data(), &header, sizeof(WavHeader));

  const uint8_t *pcmBytes = reinterpret_cast<const uint8_t *>(audio.samples.data());
  wavData.insert(wavData.end(), pcmBytes, pcmBytes + dataSize);

  return wavData;
}

namespace
{
  uint16_t readU16(const uint8_t *p)
  {
    uint16_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
  }

  uint32_t readU32(const uint8_t *p)
  {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
  }
}

bool decodeWav(const std::vector<uint8_t> &wavData, AudioBuffer &out, std::string &error)
{
  if (wavData.size() < 44)
  {
    error = "audio data too small to contain a WAV header";
    return false;
  }

  const uint8_t *header = wavData.data();
  if (std::memcmp(header, "RIFF", 4) != 0 || std::memcmp(header + 8, "WAVE", 4) != 0)
  {
    error = "invalid WAV signature";
    return false;
  }

  uint16_t numChannels = 0;
  uint32_t wavSampleRate = 0;
  uint16_t bitsPerSample = 0;
  size_t dataOffset = 0;
  size_t dataSize = 0;

  size_t pos = 12;
  while (pos + 8 <= wavData.size())
  {
    const uint8_t *chunk = header + pos;
    uint32_t chunkSize = readU32(chunk + 4);
    if (std::memcmp(chunk, "fmt ", 4) == 0 && pos + 8 + 16 <= wavData.size())
    {
      numChannels = readU16(chunk + 10);
      wavSampleRate = readU32(chunk + 12);
      bitsPerSample = readU16(chunk + 22);
    }
    else if (std::memcmp(chunk, "data", 4) == 0)
    {
      dataOffset = pos + 8;
      // Streamed WAVs carry a placeholder size; trust the buffer instead.
      dataSize = std::min<size_t>(chunkSize, wavData.size() - dataOffset);
      break;
    }
    pos += 8 + chunkSize + (chunkSize & 1);
  }

  if (dataOffset == 0)
  {
    error = "could not find data chunk in WAV";
    return false;
  }
  if (bitsPerSample != 16 || numChannels == 0 || wavSampleRate == 0)
  {
    error = "unsupported WAV format (bits=" + std::to_string(bitsPerSample) +
            ", channels=" + std::to_string(numChannels) + ")";
    return false;
  }

  out.sampleRate = static_cast<int>(wavSampleRate);
  out.channels = numChannels;
  out.samples.resize(dataSize / sizeof(int16_t));
  std::memcpy(out.samples.data(), header + dataOffset, out.samples.size() * sizeof(int16_t));
  return true;
}

bool writeWavFile(const std::string &path, const AudioBuffer &audio)
{
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    return false;
  }
  std::vector<uint8_t> wavData = encodeWav(audio);
  file.write(reinterpret_cast<const char *>(wavData.data()), static_cast<std::streamsize>(wavData.size()));
  return static_cast<bool>(file);
}
