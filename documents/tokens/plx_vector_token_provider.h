#ifndef PLX_VECTOR_TOKEN_PROVIDER_H
#define PLX_VECTOR_TOKEN_PROVIDER_H

#include "plx_token_provider.h"

// Exact text from the PDF content stream, mapped onto the page raster.
// Confidence is always 1.0.
class plx_vector_token_provider : public i_token_provider
{
  double default_dpi_;

public:
  explicit plx_vector_token_provider(double default_dpi = 150.0);

  plx_token_source source() const override { return plx_token_source::vector; }

  std::vector<plx_text_token> get_tokens(const plx_page_ref& page,
                                         const plx_raster_spec* raster = nullptr,
                                         plx_page_transform* transform_out = nullptr) override;
};

#endif // PLX_VECTOR_TOKEN_PROVIDER_H
