#include "AppLogger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>

AppLogger &AppLogger::getInstance()
{
  static AppLogger instance;
  return instance;
}

AppLogger::AppLogger() = default;

AppLogger::~AppLogger()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (logFile.is_open())
  {
    logFile << "--- Log Ended: " << getTimestamp() << " ---\n";
    logFile.close();
  }
}

bool AppLogger::open(const std::string &filename)
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path logPath(filename);
  if (logPath.has_parent_path())
  {
    std::error_code ec;
    std::filesystem::create_directories(logPath.parent_path(), ec);
    if (ec)
    {
      std::cerr << "Error: Could not create log directory " << logPath.parent_path() << ": " << ec.message() << std::endl;
      return false;
    }
  }
  logFile.open(filename, std::ios_base::app);
  if (!logFile.is_open())
  {
    std::cerr << "Error: Could not open log file: " << filename << std::endl;
    return false;
  }
  logFile << "--- Log Started: " << getTimestamp() << " ---\n";
  return true;
}

void AppLogger::setLevel(LogLevel level)
{
  std::lock_guard<std::mutex> lock(mutex_);
  minLevel_ = level;
}

void AppLogger::setLevel(const std::string &levelName)
{
  if (levelName == "debug")
    setLevel(LogLevel::Debug);
  else if (levelName == "warning" || levelName == "warn")
    setLevel(LogLevel::Warning);
  else if (levelName == "error")
    setLevel(LogLevel::Error);
  else
    setLevel(LogLevel::Info);
}

void AppLogger::debug(const std::string &message)
{
  write(LogLevel::Debug, "[DEBUG] ", message);
}

void AppLogger::info(const std::string &message)
{
  write(LogLevel::Info, "[INFO] ", message);
}

void AppLogger::warning(const std::string &message)
{
  write(LogLevel::Warning, "[WARN] ", message);
}

void AppLogger::error(const std::string &message)
{
  write(LogLevel::Error, "[ERROR] ", message);
}

std::string AppLogger::getTimestamp()
{
  auto now = std::chrono::system_clock::now();
  std::time_t now_c = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm local_tm{};
  localtime_r(&now_c, &local_tm);

  char buffer[80];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

  std::ostringstream out;
  out << buffer << '.' << std::setw(3) << std::setfill('0') << millis;
  return out.str();
}

void AppLogger::write(LogLevel level, const char *tag, const std::string &message)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < minLevel_)
  {
    return;
  }

  const std::string line = getTimestamp() + " " + tag + message + "\n";
  if (logFile.is_open())
  {
    logFile << line;
    if (level == LogLevel::Error)
    {
      std::cerr << tag << message << "\n";
      logFile.flush();
    }
  }
  else
  {
    // stdout carries command responses, so the fallback is stderr
    std::cerr << line;
  }
}
