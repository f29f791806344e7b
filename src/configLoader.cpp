#include "configLoader.hpp"
#include "AppLogger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string trim(const std::string &s)
{
  const std::string WHITESPACE = " \t\n\r\f\v";
  size_t first = s.find_first_not_of(WHITESPACE);
  if (std::string::npos == first)
  {
    return "";
  }
  size_t last = s.find_last_not_of(WHITESPACE);
  return s.substr(first, (last - first + 1));
}

bool parseBool(const std::string &value, bool &out)
{
  std::string val;
  for (char c : value)
  {
    val.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (val == "true" || val == "1" || val == "yes" || val == "on")
  {
    out = true;
    return true;
  }
  if (val == "false" || val == "0" || val == "no" || val == "off")
  {
    out = false;
    return true;
  }
  return false;
}

bool ConfigLoader::KeyLess::operator()(const std::string &a, const std::string &b) const
{
  return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                      [](char x, char y)
                                      {
                                        return std::tolower(static_cast<unsigned char>(x)) <
                                               std::tolower(static_cast<unsigned char>(y));
                                      });
}

bool ConfigLoader::loadFromFile(const std::string &filename)
{
  data.clear();
  std::ifstream file(filename);
  if (!file.is_open())
  {
    AppLogger::getInstance().warning("Could not open configuration file: " + filename);
    return false;
  }

  std::string line;
  while (std::getline(file, line))
  {
    line = trim(line);
    if (line.empty() || line[0] == '#')
    {
      continue;
    }

    size_t delimiter_pos = line.find('=');
    if (delimiter_pos != std::string::npos)
    {
      std::string key = line.substr(0, delimiter_pos);
      std::string value = line.substr(delimiter_pos + 1);

      data[trim(key)] = trim(value);
    }
  }
  return true;
}

void ConfigLoader::applyEnvironment(const std::string &prefix, char **envp)
{
  if (envp == nullptr)
  {
    return;
  }

  for (char **env = envp; *env != nullptr; ++env)
  {
    std::string assignment(*env);
    size_t eq = assignment.find('=');
    if (eq == std::string::npos || assignment.compare(0, prefix.size(), prefix) != 0)
    {
      continue;
    }

    std::string name = assignment.substr(0, eq);
    std::string value = assignment.substr(eq + 1);

    // VOICELINK_STT_ENGINE -> stt.engine
    std::string key;
    for (size_t i = prefix.size(); i < name.size(); ++i)
    {
      char c = name[i];
      key.push_back(c == '_' ? '.' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (!key.empty())
    {
      data[key] = value;
    }
  }
}

void ConfigLoader::set(const std::string &key, const std::string &value)
{
  data[key] = value;
}

bool ConfigLoader::has(const std::string &key) const
{
  return data.find(key) != data.end();
}

std::string ConfigLoader::getString(const std::string &key, const std::string &defaultValue) const
{
  auto it = data.find(key);
  return (it != data.end()) ? it->second : defaultValue;
}

int ConfigLoader::getInt(const std::string &key, int defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    try
    {
      size_t used = 0;
      int value = std::stoi(it->second, &used);
      if (used == it->second.size())
      {
        return value;
      }
    }
    catch (const std::logic_error &)
    {
    }
    AppLogger::getInstance().warning("Config: '" + key + "' is not an integer (" + it->second + "), using default " + std::to_string(defaultValue));
  }
  return defaultValue;
}

float ConfigLoader::getFloat(const std::string &key, float defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    try
    {
      size_t used = 0;
      float value = std::stof(it->second, &used);
      if (used == it->second.size())
      {
        return value;
      }
    }
    catch (const std::logic_error &)
    {
    }
    AppLogger::getInstance().warning("Config: '" + key + "' is not a number (" + it->second + "), using default " + std::to_string(defaultValue));
  }
  return defaultValue;
}

bool ConfigLoader::getBool(const std::string &key, bool defaultValue) const
{
  auto it = data.find(key);
  if (it != data.end())
  {
    bool value = defaultValue;
    if (parseBool(it->second, value))
    {
      return value;
    }
    AppLogger::getInstance().warning("Config: '" + key + "' is not a boolean (" + it->second + ")");
  }
  return defaultValue;
}

std::vector<std::string> ConfigLoader::getList(const std::string &key, const std::vector<std::string> &defaultValue) const
{
  auto it = data.find(key);
  if (it == data.end())
  {
    return defaultValue;
  }

  std::vector<std::string> items;
  std::stringstream stream(it->second);
  std::string item;
  while (std::getline(stream, item, ','))
  {
    item = trim(item);
    if (!item.empty())
    {
      items.push_back(item);
    }
  }
  return items;
}
