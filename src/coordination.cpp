#include "coordination.hpp"
#include "AppLogger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <signal.h>
#include <unistd.h>

bool MemorySignalStore::set(const std::string &key, const std::string &value)
{
  std::lock_guard<std::mutex> lock(mutex_);
  values_[key] = value;
  return true;
}

bool MemorySignalStore::testAndClear(const std::string &key)
{
  std::lock_guard<std::mutex> lock(mutex_);
  return values_.erase(key) > 0;
}

std::optional<std::string> MemorySignalStore::get(const std::string &key) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = values_.find(key);
  if (it == values_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

void MemorySignalStore::clear(const std::string &key)
{
  std::lock_guard<std::mutex> lock(mutex_);
  values_.erase(key);
}

FileSignalStore::FileSignalStore(const std::string &directory, const std::string &prefix)
    : directory_(directory), prefix_(prefix)
{
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec)
  {
    AppLogger::getInstance().error("Could not create signal directory " + directory_ + ": " + ec.message());
  }
}

std::string FileSignalStore::pathFor(const std::string &key) const
{
  return (std::filesystem::path(directory_) / (prefix_ + key)).string();
}

bool FileSignalStore::set(const std::string &key, const std::string &value)
{
  const std::string target = pathFor(key);
  const std::string temp = target + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(tempCounter_++);

  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out.is_open())
    {
      AppLogger::getInstance().error("Could not write signal file: " + temp);
      return false;
    }
    out << value;
    if (!out)
    {
      AppLogger::getInstance().error("Could not write signal file: " + temp);
      out.close();
      std::remove(temp.c_str());
      return false;
    }
  }

  if (std::rename(temp.c_str(), target.c_str()) != 0)
  {
    AppLogger::getInstance().error("Could not publish signal file " + target + ": " + std::strerror(errno));
    std::remove(temp.c_str());
    return false;
  }
  return true;
}

bool FileSignalStore::testAndClear(const std::string &key)
{
  // unlink() succeeds for exactly one caller.
  return ::unlink(pathFor(key).c_str()) == 0;
}

std::optional<std::string> FileSignalStore::get(const std::string &key) const
{
  std::ifstream in(pathFor(key));
  if (!in.is_open())
  {
    return std::nullopt;
  }
  std::stringstream content;
  content << in.rdbuf();
  return content.str();
}

void FileSignalStore::clear(const std::string &key)
{
  ::unlink(pathFor(key).c_str());
}

std::string formatSpeechMarker(bool speaking, long pid, std::chrono::system_clock::time_point at)
{
  auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()).count();
  return std::string(speaking ? "speaking" : "finished") + " " + std::to_string(pid) + " " + std::to_string(epochMs);
}

CoordinationChannel::CoordinationChannel(std::shared_ptr<SignalStore> store, std::chrono::milliseconds speakingTtl)
    : store_(std::move(store)), speakingTtl_(speakingTtl)
{
}

void CoordinationChannel::signalStop()
{
  if (store_->set(STOP_KEY, std::to_string(::getpid())))
  {
    AppLogger::getInstance().info("Coordination: stop signal raised.");
  }
}

bool CoordinationChannel::consumeStopSignal()
{
  return store_->testAndClear(STOP_KEY);
}

void CoordinationChannel::clearStopSignal()
{
  store_->clear(STOP_KEY);
}

void CoordinationChannel::markSpeaking(bool speaking)
{
  localSpeaking_ = speaking;
  store_->set(SPEECH_KEY, formatSpeechMarker(speaking, static_cast<long>(::getpid()), WallClock::now()));
  invalidateCache();
}

void CoordinationChannel::invalidateCache()
{
  std::lock_guard<std::mutex> lock(cacheMutex_);
  cacheExpiry_ = std::chrono::steady_clock::time_point();
}

std::optional<CoordinationChannel::SpeechMarker> CoordinationChannel::readMarker() const
{
  std::optional<std::string> raw = store_->get(SPEECH_KEY);
  if (!raw)
  {
    return std::nullopt;
  }

  std::istringstream in(*raw);
  std::string state;
  long pid = 0;
  long long epochMs = 0;
  if (!(in >> state >> pid >> epochMs) || (state != "speaking" && state != "finished"))
  {
    AppLogger::getInstance().warning("Coordination: ignoring malformed speech marker '" + *raw + "'");
    return std::nullopt;
  }

  SpeechMarker marker;
  marker.speaking = (state == "speaking");
  marker.pid = pid;
  marker.at = WallClock::time_point(std::chrono::milliseconds(epochMs));
  return marker;
}

bool CoordinationChannel::isSpeaking()
{
  if (localSpeaking_.load())
  {
    return true;
  }

  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(cacheMutex_);
  if (now < cacheExpiry_)
  {
    return cachedRemoteSpeaking_;
  }

  bool remote = false;
  std::optional<SpeechMarker> marker = readMarker();
  if (marker && marker->speaking && marker->pid != static_cast<long>(::getpid()))
  {
    // A crashed speaker leaves its marker behind; only a live owner counts.
    remote = ::kill(static_cast<pid_t>(marker->pid), 0) == 0 || errno == EPERM;
  }

  cachedRemoteSpeaking_ = remote;
  cacheExpiry_ = now + speakingTtl_;
  return remote;
}

std::optional<CoordinationChannel::WallClock::time_point> CoordinationChannel::lastFinishedAt() const
{
  std::optional<SpeechMarker> marker = readMarker();
  if (!marker || marker->speaking)
  {
    return std::nullopt;
  }
  return marker->at;
}
