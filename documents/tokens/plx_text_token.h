#ifndef PLX_TEXT_TOKEN_H
#define PLX_TEXT_TOKEN_H

#include "../layout/plx_layout_bounds.h"

enum class plx_token_source
{
  vector,
  model,
  ocr
};

plx_string token_source_to_string(plx_token_source source);
// Lower value wins when tokens overlap.
int token_source_priority(plx_token_source source);

// A recognized text fragment on one page. Immutable once constructed.
class plx_text_token
{
  plx_string text_;
  plx_layout_bounds bbox_;
  double confidence_;
  plx_token_source source_;
  plx_string page_id_;

public:
  /**
   * @throws std::invalid_argument if bbox has a non-positive side or
   *         confidence lies outside [0, 1].
   */
  plx_text_token(const plx_string& text, const plx_layout_bounds& bbox, double confidence,
                 plx_token_source source, const plx_string& page_id);

  const plx_string& get_text() const { return text_; }
  const plx_layout_bounds& get_bbox() const { return bbox_; }
  double get_confidence() const { return confidence_; }
  plx_token_source get_source() const { return source_; }
  const plx_string& get_page_id() const { return page_id_; }

  plxv_map to_map() const;
};

#endif // PLX_TEXT_TOKEN_H
