#include "hotkey.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <fcntl.h>
#include <linux/input.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace
{
void writeKey(int fd, int code, int value)
{
  input_event event{};
  event.type = EV_KEY;
  event.code = static_cast<unsigned short>(code);
  event.value = value;
  ASSERT_EQ(::write(fd, &event, sizeof(event)), static_cast<ssize_t>(sizeof(event)));
}

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 2000ms)
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline)
  {
    if (predicate())
    {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}
}

TEST(ParseHotkey, NamedKeysAndCombinations)
{
  HotkeyBinding binding;
  ASSERT_TRUE(parseHotkey("ctrl_r", binding));
  EXPECT_EQ(binding.keyCodes, (std::vector<int>{KEY_RIGHTCTRL}));

  ASSERT_TRUE(parseHotkey("Ctrl_R + m", binding));
  EXPECT_EQ(binding.keyCodes, (std::vector<int>{KEY_RIGHTCTRL, KEY_M}));

  EXPECT_FALSE(parseHotkey("hyper", binding));
  EXPECT_TRUE(binding.keyCodes.empty());
  EXPECT_FALSE(parseHotkey("", binding));
}

TEST(EvdevHotkeySource, FiresOncePerComboPress)
{
  int fds[2];
  ASSERT_EQ(::pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0);

  HotkeyBinding binding;
  ASSERT_TRUE(parseHotkey("ctrl_r+m", binding));

  std::atomic<int> presses{0};
  EvdevHotkeySource source;
  std::string error;
  ASSERT_TRUE(source.startWithDevices({fds[0]}, binding, [&presses]()
                                      { ++presses; },
                                      error))
      << error;

  writeKey(fds[1], KEY_RIGHTCTRL, 1);
  writeKey(fds[1], KEY_M, 1);
  writeKey(fds[1], KEY_M, 2);
  EXPECT_TRUE(eventually([&presses]()
                         { return presses.load() == 1; }));

  writeKey(fds[1], KEY_M, 0);
  writeKey(fds[1], KEY_M, 1);
  EXPECT_TRUE(eventually([&presses]()
                         { return presses.load() == 2; }));

  source.stop();
  EXPECT_FALSE(source.active());
  ::close(fds[1]);
}

TEST(EvdevHotkeySource, StopsListeningWhenDeviceGoesAway)
{
  int fds[2];
  ASSERT_EQ(::pipe2(fds, O_NONBLOCK | O_CLOEXEC), 0);

  HotkeyBinding binding;
  ASSERT_TRUE(parseHotkey("ctrl_r", binding));

  EvdevHotkeySource source;
  std::string error;
  ASSERT_TRUE(source.startWithDevices({fds[0]}, binding, []() {}, error)) << error;
  EXPECT_TRUE(source.active());

  // Unplugged keyboard: the descriptor reports a hangup on every poll.
  ::close(fds[1]);
  EXPECT_TRUE(eventually([&source]()
                         { return !source.active(); }));

  source.stop();
}
