#ifndef PLX_PAGE_TOKENS_H
#define PLX_PAGE_TOKENS_H

#include "plx_token_provider.h"
#include <memory>

struct plx_page_tokens_result
{
  std::vector<plx_text_token> tokens;
  plx_string source_used = "none";  // "vector", "model" or "none"
  bool has_transform = false;
  plx_page_transform transform;
};

// Strict-priority token selection for one page: vector text when the PDF
// yields any, otherwise the fallback provider. Sources are never blended.
class plx_page_tokens
{
  std::shared_ptr<i_token_provider> primary_;
  std::shared_ptr<i_token_provider> fallback_;

public:
  // fallback may be null to disable the model path.
  plx_page_tokens(std::shared_ptr<i_token_provider> primary, std::shared_ptr<i_token_provider> fallback);

  plx_page_tokens_result get_tokens_for_page(const plx_page_ref& page, const plx_raster_spec* raster = nullptr) const;
};

#endif // PLX_PAGE_TOKENS_H
