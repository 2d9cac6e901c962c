#ifndef PLX_VISION_TEXT_DETECTOR_H
#define PLX_VISION_TEXT_DETECTOR_H

#include "plx_text_detector.h"
#include "../../utils/plx_variant.h"

// Text detector backed by a vision model behind an OpenAI-compatible
// chat completions endpoint. The model answers with a JSON array of
// {"bbox": [x, y, w, h], "text": "...", "confidence": 0.0-1.0}.
class plx_vision_text_detector : public i_text_detector
{
  plx_string endpoint_;
  plx_string api_key_;
  plx_string model_;
  long timeout_seconds_;

public:
  plx_vision_text_detector(const plx_string& endpoint, const plx_string& api_key, const plx_string& model);

  void set_timeout_seconds(long seconds) { timeout_seconds_ = seconds; }

  std::vector<plx_text_detection> detect(const plx_string& page_id,
                                         const std::vector<unsigned char>& image_bytes) override;

  // Request body for one page; exposed for inspection in tests.
  plxv_map build_request(const std::vector<unsigned char>& image_bytes) const;

  /**
   * @brief Extracts detections from a chat completion response body.
   * @throws detector_error when the body is not a completion or the content is not a JSON array.
   */
  static std::vector<plx_text_detection> parse_response(const plx_string& response_body);
};

#endif // PLX_VISION_TEXT_DETECTOR_H
