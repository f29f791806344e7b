#pragma once

#include <string>
#include <map>
#include <vector>

// Key-value configuration: a "key = value" file with environment overrides on top.
class ConfigLoader
{
public:
  // Reads the file and loads key-value pairs.
  bool loadFromFile(const std::string &filename);

  // Applies PREFIX_SOME_KEY environment variables over "some.key" entries.
  // Keys compare case-insensitively, so '.' spelled as '_' is all an override needs.
  void applyEnvironment(const std::string &prefix, char **envp);

  void set(const std::string &key, const std::string &value);
  bool has(const std::string &key) const;

  std::string getString(const std::string &key, const std::string &defaultValue) const;

  int getInt(const std::string &key, int defaultValue) const;
  float getFloat(const std::string &key, float defaultValue) const;
  bool getBool(const std::string &key, bool defaultValue) const;

  // Comma separated values, trimmed, empty entries dropped.
  std::vector<std::string> getList(const std::string &key, const std::vector<std::string> &defaultValue) const;

private:
  struct KeyLess
  {
    bool operator()(const std::string &a, const std::string &b) const;
  };

  std::map<std::string, std::string, KeyLess> data;
};

std::string trim(const std::string &s);
bool parseBool(const std::string &value, bool &out);
