#include "plx_env.h"
#include <fstream>
#include <cstdlib>

bool load_env_file(const plx_string& filepath)
{
  std::ifstream file(filepath.c_str());
  if (!file.is_open())
  {
    return false;
  }

  std::string line;
  while (std::getline(file, line))
  {
    plx_string plx_line = plx_string(line).trim();

    if (plx_line.empty() || plx_line.starts_with("#"))
    {
      continue;
    }

    size_t pos = plx_line.find("=");
    if (pos == plx_string::npos)
    {
      continue;
    }

    plx_string key = plx_line.substr(0, pos).trim();
    plx_string value = plx_line.substr(pos + 1).trim();

    // Optional surrounding quotes
    if (value.size() >= 2 && (value[0] == '"' || value[0] == '\'') && value[value.size() - 1] == value[0])
    {
      value = value.substr(1, value.size() - 2);
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
  return true;
}

plx_string env_or(const char* key, const plx_string& def)
{
  const char* value = std::getenv(key);
  if (!value || !*value)
  {
    return def;
  }
  return plx_string(value);
}
