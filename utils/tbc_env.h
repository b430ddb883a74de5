#ifndef TBC_ENV_H
#define TBC_ENV_H

#include "tbc_string.h"

// Loads KEY=VALUE lines into the process environment. Missing files are
// ignored; existing variables are overwritten.
void load_env_file(const tbc_string& filepath);

// Reads an environment variable; returns def when unset.
tbc_string env_value(const char* key, const tbc_string& def = tbc_string());
bool env_is_set(const char* key);

#endif // TBC_ENV_H
