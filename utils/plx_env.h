#ifndef PLX_ENV_H
#define PLX_ENV_H

#include "plx_string.h"

// Reads KEY=VALUE lines into the process environment. Existing variables are
// overwritten; blank lines and '#' comments are skipped. Returns false when
// the file cannot be opened.
bool load_env_file(const plx_string& filepath);

// Value of an environment variable, or def when unset or empty.
plx_string env_or(const char* key, const plx_string& def = plx_string());

#endif // PLX_ENV_H
