#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <filesystem>

enum class LogLevel
{
  Debug = 0,
  Info,
  Warning,
  Error
};

// AppLogger class for centralized, thread-safe logging shared by both pipelines
class AppLogger
{
public:
  static AppLogger &getInstance();

  bool open(const std::string &filename);

  void setLevel(LogLevel level);
  void setLevel(const std::string &levelName);

  void debug(const std::string &message);

  void info(const std::string &message);

  void warning(const std::string &message);

  void error(const std::string &message);

  ~AppLogger();

private:
  AppLogger();

  AppLogger(const AppLogger &) = delete;
  AppLogger &operator=(const AppLogger &) = delete;

  std::mutex mutex_;
  std::ofstream logFile;
  LogLevel minLevel_ = LogLevel::Info;

  std::string getTimestamp();

  void write(LogLevel level, const char *tag, const std::string &message);
};
