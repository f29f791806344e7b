#pragma once

#include <atomic>
#include <functional>
#include <set>
#include <string>
#include <thread>
#include <vector>

// A push-to-talk binding: one or more key codes that must all be held.
struct HotkeyBinding
{
  std::vector<int> keyCodes;
};

// Accepts names like "ctrl_r", "f13" or combinations such as "ctrl_r+m".
bool parseHotkey(const std::string &combo, HotkeyBinding &binding);

class HotkeySource
{
public:
  using Callback = std::function<void()>;

  virtual ~HotkeySource() = default;

  // onToggle fires once per press of the full combination.
  virtual bool start(const HotkeyBinding &binding, Callback onToggle, std::string &error) = 0;
  virtual void stop() = 0;
  virtual bool active() const = 0;
};

// Watches /dev/input/event* keyboards. Needs read access to the input devices.
class EvdevHotkeySource : public HotkeySource
{
public:
  explicit EvdevHotkeySource(std::string inputDirectory = "/dev/input");
  ~EvdevHotkeySource() override;

  bool start(const HotkeyBinding &binding, Callback onToggle, std::string &error) override;
  void stop() override;
  // False once every watched device has gone away, even before stop().
  bool active() const override { return listening_.load(); }

  // Listens on already opened evdev descriptors and takes ownership of them.
  bool startWithDevices(std::vector<int> deviceFds, const HotkeyBinding &binding, Callback onToggle, std::string &error);

private:
  std::string inputDirectory_;
  std::vector<int> deviceFds_;
  int wakeFds_[2] = {-1, -1};
  std::atomic<bool> running_{false};
  std::atomic<bool> listening_{false};
  std::thread thread_;

  void eventLoop(HotkeyBinding binding, Callback onToggle);
  void readEvents(int fd, const HotkeyBinding &binding, std::set<int> &held, bool &comboDown, const Callback &onToggle);
  void dropDevice(int fd);
  void closeAll();
};
