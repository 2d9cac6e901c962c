#ifndef PLX_CONFIG_H
#define PLX_CONFIG_H

#include "plx_string.h"

// Runtime settings for an extraction run. Defaults apply when a variable is
// missing; call load_env_file() first to pick up a .env file.
struct plx_config
{
  double default_dpi = 150.0;
  double merge_iou_threshold = 0.5;
  int max_parallel_pages = 4;

  bool use_vision = true;
  plx_string vision_endpoint = "https://api.openai.com/v1/chat/completions";
  plx_string vision_model = "gpt-4o";
  plx_string vision_api_key;

  static plx_config from_env();
};

#endif // PLX_CONFIG_H
