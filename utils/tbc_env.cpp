#include "tbc_env.h"
#include <fstream>
#include <cstdlib>

void load_env_file(const tbc_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    tbc_string tbc_line(line.c_str());
    tbc_line = tbc_line.trim();

    if (tbc_line.empty() || tbc_line.starts_with("#")) {
      continue;
    }

    size_t pos = tbc_line.find("=");
    if (pos == tbc_string::npos) {
      continue;
    }

    tbc_string key = tbc_line.substr(0, pos).trim();
    tbc_string value = tbc_line.substr(pos + 1).trim();
    if (key.empty()) {
      continue;
    }

    setenv(key.c_str(), value.c_str(), 1);
  }
}

tbc_string env_value(const char* key, const tbc_string& def) {
  const char* value = std::getenv(key);
  if (value == nullptr) {
    return def;
  }
  return tbc_string(value);
}

bool env_is_set(const char* key) {
  return std::getenv(key) != nullptr;
}
