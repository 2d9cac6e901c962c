#ifndef PLX_TEXT_DETECTOR_H
#define PLX_TEXT_DETECTOR_H

#include "../../utils/plx_string.h"
#include <vector>

// One text region reported by a detector, before validation.
struct plx_text_detection
{
  std::vector<double> bbox;  // expected [x, y, w, h] in page pixels
  plx_string text;
  double confidence = 0.0;
};

// Model-based text region detector used when a page has no vector text.
class i_text_detector
{
public:
  virtual ~i_text_detector() = default;

  /**
   * @brief Detects labeled text regions in a rendered page.
   * @param page_id Page identifier, used for logging.
   * @param image_bytes Encoded PNG or JPEG image.
   * @throws detector_error on transport or response format failures.
   */
  virtual std::vector<plx_text_detection> detect(const plx_string& page_id,
                                                 const std::vector<unsigned char>& image_bytes) = 0;
};

#endif // PLX_TEXT_DETECTOR_H
