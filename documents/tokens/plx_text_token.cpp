#include "plx_text_token.h"
#include <stdexcept>

plx_string token_source_to_string(plx_token_source source)
{
  switch (source)
  {
    case plx_token_source::vector: return "vector";
    case plx_token_source::model: return "model";
    case plx_token_source::ocr: return "ocr";
  }
  return "unknown";
}

int token_source_priority(plx_token_source source)
{
  switch (source)
  {
    case plx_token_source::vector: return 0;
    case plx_token_source::model: return 1;
    case plx_token_source::ocr: return 2;
  }
  return 3;
}

plx_text_token::plx_text_token(const plx_string& text, const plx_layout_bounds& bbox, double confidence,
                               plx_token_source source, const plx_string& page_id)
  : text_(text), bbox_(bbox), confidence_(confidence), source_(source), page_id_(page_id)
{
  if (!bbox_.has_positive_size())
  {
    throw std::invalid_argument("Token bbox must have positive width and height: '" + text.to_std_const() + "'");
  }
  if (!(confidence_ >= 0.0 && confidence_ <= 1.0))
  {
    throw std::invalid_argument("Token confidence must be within [0, 1]: '" + text.to_std_const() + "'");
  }
}

plxv_map plx_text_token::to_map() const
{
  plxv_map m;
  m["text"] = text_;
  m["bbox"] = bbox_.to_variant();
  m["confidence"] = confidence_;
  m["source"] = token_source_to_string(source_);
  m["page_id"] = page_id_;
  return m;
}
