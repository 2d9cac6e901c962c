#include "plx_page_tokens.h"
#include <iostream>
#include <stdexcept>

plx_page_tokens::plx_page_tokens(std::shared_ptr<i_token_provider> primary, std::shared_ptr<i_token_provider> fallback)
  : primary_(std::move(primary)), fallback_(std::move(fallback))
{
  if (!primary_)
  {
    throw std::invalid_argument("plx_page_tokens needs a primary token provider");
  }
}

plx_page_tokens_result plx_page_tokens::get_tokens_for_page(const plx_page_ref& page, const plx_raster_spec* raster) const
{
  plx_page_tokens_result result;

  plx_page_transform transform;
  result.tokens = primary_->get_tokens(page, raster, &transform);
  if (!result.tokens.empty())
  {
    result.source_used = token_source_to_string(primary_->source());
    result.has_transform = transform.valid();
    result.transform = transform;
    return result;
  }

  if (!fallback_)
  {
    std::cerr << "Warning: No tokens for page " << page.page_id << " and no fallback configured" << std::endl;
    return result;
  }

  result.tokens = fallback_->get_tokens(page, raster, nullptr);
  if (result.tokens.empty())
  {
    std::cerr << "Warning: No tokens from any source for page " << page.page_id << std::endl;
    return result;
  }
  result.source_used = token_source_to_string(fallback_->source());
  return result;
}
