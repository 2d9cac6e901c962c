#include "plx_config.h"
#include "plx_env.h"
#include <iostream>

plx_config plx_config::from_env()
{
  plx_config config;

  double dpi = env_or("PLX_DEFAULT_DPI", "150").to_double(150.0);
  if (dpi > 0)
  {
    config.default_dpi = dpi;
  }
  else
  {
    std::cerr << "Warning: PLX_DEFAULT_DPI must be positive, using " << config.default_dpi << std::endl;
  }

  double iou = env_or("PLX_MERGE_IOU", "0.5").to_double(0.5);
  if (iou > 0.0 && iou < 1.0)
  {
    config.merge_iou_threshold = iou;
  }
  else
  {
    std::cerr << "Warning: PLX_MERGE_IOU must be in (0, 1), using " << config.merge_iou_threshold << std::endl;
  }

  long parallel = env_or("PLX_MAX_PARALLEL_PAGES", "4").to_int(4);
  config.max_parallel_pages = parallel > 0 ? static_cast<int>(parallel) : 1;

  plx_string use_vision = env_or("PLX_USE_VISION", "true").lower();
  config.use_vision = !(use_vision == "false" || use_vision == "0" || use_vision == "no" || use_vision == "off");

  config.vision_endpoint = env_or("PLX_VISION_ENDPOINT", config.vision_endpoint);
  config.vision_model = env_or("PLX_VISION_MODEL", config.vision_model);
  config.vision_api_key = env_or("PLX_VISION_API_KEY", env_or("OPENAI_API_KEY"));

  return config;
}
