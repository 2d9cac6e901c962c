#ifndef PLX_TOKEN_MERGER_H
#define PLX_TOKEN_MERGER_H

#include "plx_text_token.h"
#include <map>
#include <vector>

struct plx_merge_report
{
  size_t input_tokens = 0;
  size_t kept_tokens = 0;
  size_t duplicates_removed = 0;
  std::map<plx_string, size_t> kept_by_source;

  plxv_map to_map() const;
};

// Unifies tokens from several sources. Tokens are visited in source priority
// order (vector, model, ocr; stable within a source) and a token is dropped
// when it overlaps an already kept token with IoU above the threshold and the
// two texts are equal or one contains the other (trimmed, case-insensitive).
class plx_token_merger
{
  double iou_threshold_;

public:
  explicit plx_token_merger(double iou_threshold = 0.5);

  std::vector<plx_text_token> merge(const std::vector<plx_text_token>& tokens,
                                    plx_merge_report* report = nullptr) const;

  static bool texts_similar(const plx_string& a, const plx_string& b);
};

#endif // PLX_TOKEN_MERGER_H
