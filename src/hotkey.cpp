#include "hotkey.hpp"
#include "AppLogger.hpp"
#include "configLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <map>
#include <set>
#include <sstream>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace
{
const std::map<std::string, int> &namedKeys()
{
  static const std::map<std::string, int> keys = {
      {"ctrl_r", KEY_RIGHTCTRL},
      {"ctrl_l", KEY_LEFTCTRL},
      {"ctrl", KEY_LEFTCTRL},
      {"alt_r", KEY_RIGHTALT},
      {"alt_l", KEY_LEFTALT},
      {"alt", KEY_LEFTALT},
      {"shift_r", KEY_RIGHTSHIFT},
      {"shift_l", KEY_LEFTSHIFT},
      {"shift", KEY_LEFTSHIFT},
      {"meta_r", KEY_RIGHTMETA},
      {"meta_l", KEY_LEFTMETA},
      {"cmd_r", KEY_RIGHTMETA},
      {"cmd_l", KEY_LEFTMETA},
      {"cmd", KEY_LEFTMETA},
      {"space", KEY_SPACE},
      {"pause", KEY_PAUSE},
      {"scroll_lock", KEY_SCROLLLOCK},
      {"f13", KEY_F13},
      {"f14", KEY_F14},
      {"f15", KEY_F15},
      {"f16", KEY_F16},
  };
  return keys;
}

int letterKey(char c)
{
  static const int letters[26] = {
      KEY_A, KEY_B, KEY_C, KEY_D, KEY_E, KEY_F, KEY_G, KEY_H, KEY_I,
      KEY_J, KEY_K, KEY_L, KEY_M, KEY_N, KEY_O, KEY_P, KEY_Q, KEY_R,
      KEY_S, KEY_T, KEY_U, KEY_V, KEY_W, KEY_X, KEY_Y, KEY_Z};
  return letters[c - 'a'];
}

bool hasKey(int fd, int code)
{
  unsigned char bits[KEY_MAX / 8 + 1] = {};
  if (::ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(bits)), bits) < 0)
  {
    return false;
  }
  return (bits[code / 8] >> (code % 8)) & 1;
}
}

bool parseHotkey(const std::string &combo, HotkeyBinding &binding)
{
  binding.keyCodes.clear();

  std::stringstream parts(combo);
  std::string part;
  while (std::getline(parts, part, '+'))
  {
    part = trim(part);
    std::transform(part.begin(), part.end(), part.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    auto it = namedKeys().find(part);
    if (it != namedKeys().end())
    {
      binding.keyCodes.push_back(it->second);
    }
    else if (part.size() == 1 && part[0] >= 'a' && part[0] <= 'z')
    {
      binding.keyCodes.push_back(letterKey(part[0]));
    }
    else
    {
      binding.keyCodes.clear();
      return false;
    }
  }
  return !binding.keyCodes.empty();
}

EvdevHotkeySource::EvdevHotkeySource(std::string inputDirectory)
    : inputDirectory_(std::move(inputDirectory))
{
}

EvdevHotkeySource::~EvdevHotkeySource()
{
  stop();
}

bool EvdevHotkeySource::start(const HotkeyBinding &binding, Callback onToggle, std::string &error)
{
  if (running_.load())
  {
    error = "hotkey listener already running";
    return false;
  }
  if (binding.keyCodes.empty())
  {
    error = "empty hotkey binding";
    return false;
  }

  std::vector<int> found;
  std::error_code ec;
  for (const auto &entry : std::filesystem::directory_iterator(inputDirectory_, ec))
  {
    const std::string file = entry.path().filename().string();
    if (file.rfind("event", 0) != 0)
    {
      continue;
    }
    int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
    {
      continue;
    }
    if (hasKey(fd, binding.keyCodes.front()))
    {
      found.push_back(fd);
    }
    else
    {
      ::close(fd);
    }
  }

  if (found.empty())
  {
    error = "no readable keyboard under " + inputDirectory_ + " (is the user in the 'input' group?)";
    return false;
  }
  return startWithDevices(std::move(found), binding, std::move(onToggle), error);
}

bool EvdevHotkeySource::startWithDevices(std::vector<int> deviceFds, const HotkeyBinding &binding, Callback onToggle, std::string &error)
{
  if (running_.load())
  {
    for (int fd : deviceFds)
    {
      ::close(fd);
    }
    error = "hotkey listener already running";
    return false;
  }
  deviceFds_ = std::move(deviceFds);
  for (int fd : deviceFds_)
  {
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
  }

  if (::pipe2(wakeFds_, O_CLOEXEC) != 0)
  {
    error = "pipe() failed: " + std::string(std::strerror(errno));
    closeAll();
    return false;
  }

  AppLogger::getInstance().info("Hotkey listener watching " + std::to_string(deviceFds_.size()) + " input device(s)");
  running_ = true;
  listening_ = true;
  thread_ = std::thread(&EvdevHotkeySource::eventLoop, this, binding, std::move(onToggle));
  return true;
}

void EvdevHotkeySource::stop()
{
  if (!running_.exchange(false))
  {
    return;
  }
  listening_ = false;
  if (wakeFds_[1] >= 0)
  {
    char byte = 1;
    if (::write(wakeFds_[1], &byte, 1) < 0)
    {
      AppLogger::getInstance().warning("Hotkey listener wake-up write failed");
    }
  }
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
  {
    thread_.join();
  }
  closeAll();
}

void EvdevHotkeySource::closeAll()
{
  for (int fd : deviceFds_)
  {
    ::close(fd);
  }
  deviceFds_.clear();
  for (int &fd : wakeFds_)
  {
    if (fd >= 0)
    {
      ::close(fd);
      fd = -1;
    }
  }
}

void EvdevHotkeySource::eventLoop(HotkeyBinding binding, Callback onToggle)
{
  std::vector<pollfd> fds;
  fds.push_back({wakeFds_[0], POLLIN, 0});
  for (int fd : deviceFds_)
  {
    fds.push_back({fd, POLLIN, 0});
  }

  std::set<int> held;
  bool comboDown = false;

  while (running_.load())
  {
    int ready = ::poll(fds.data(), fds.size(), -1);
    if (ready < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      AppLogger::getInstance().error("Hotkey poll failed: " + std::string(std::strerror(errno)));
      break;
    }
    if (fds[0].revents & POLLIN)
    {
      break;
    }

    for (size_t i = 1; i < fds.size();)
    {
      const short revents = fds[i].revents;
      if (revents & POLLIN)
      {
        readEvents(fds[i].fd, binding, held, comboDown, onToggle);
      }
      if (revents & (POLLERR | POLLHUP | POLLNVAL))
      {
        AppLogger::getInstance().warning("Hotkey input device fd " + std::to_string(fds[i].fd) + " went away");
        dropDevice(fds[i].fd);
        fds.erase(fds.begin() + static_cast<std::ptrdiff_t>(i));
        continue;
      }
      ++i;
    }

    if (fds.size() == 1)
    {
      AppLogger::getInstance().error("Hotkey listener lost all input devices; use toggle instead");
      break;
    }
  }
  listening_ = false;
}

void EvdevHotkeySource::dropDevice(int fd)
{
  auto it = std::find(deviceFds_.begin(), deviceFds_.end(), fd);
  if (it != deviceFds_.end())
  {
    deviceFds_.erase(it);
  }
  ::close(fd);
}

void EvdevHotkeySource::readEvents(int fd, const HotkeyBinding &binding, std::set<int> &held, bool &comboDown, const Callback &onToggle)
{
  input_event event;
  while (::read(fd, &event, sizeof(event)) == static_cast<ssize_t>(sizeof(event)))
  {
    if (event.type != EV_KEY)
    {
      continue;
    }
    // value: 0 release, 1 press, 2 autorepeat
    if (event.value == 1)
    {
      held.insert(event.code);
    }
    else if (event.value == 0)
    {
      held.erase(event.code);
    }

    bool allHeld = std::all_of(binding.keyCodes.begin(), binding.keyCodes.end(), [&held](int code)
                               { return held.count(code) > 0; });
    if (allHeld && !comboDown)
    {
      comboDown = true;
      AppLogger::getInstance().debug("Hotkey pressed");
      onToggle();
    }
    else if (!allHeld)
    {
      comboDown = false;
    }
  }
}
