#ifndef PLX_TOKEN_PROVIDER_H
#define PLX_TOKEN_PROVIDER_H

#include "plx_text_token.h"
#include "../pdf/plx_pdf_coords.h"
#include <vector>

// Identifies one drawing page and where its sources live.
struct plx_page_ref
{
  plx_string project_id;
  plx_string page_id;
  plx_string pdf_path;    // empty when no vector source exists
  int page_number = 0;    // 0-based page inside pdf_path
  plx_string image_path;  // rendered page image, used by the fallback

  bool has_pdf() const { return !pdf_path.empty(); }
};

// Produces text tokens for a page in page-pixel space.
class i_token_provider
{
public:
  virtual ~i_token_provider() = default;

  virtual plx_token_source source() const = 0;

  /**
   * @brief Reads the tokens of one page.
   * @param page Page to read.
   * @param raster Target raster; nullptr selects the provider default.
   * @param transform_out Receives the PDF-to-pixel transform when the source works
   *        in PDF space; left untouched otherwise. May be nullptr.
   * @return Tokens in reading order. An unavailable source yields an empty list.
   */
  virtual std::vector<plx_text_token> get_tokens(const plx_page_ref& page,
                                                 const plx_raster_spec* raster = nullptr,
                                                 plx_page_transform* transform_out = nullptr) = 0;
};

#endif // PLX_TOKEN_PROVIDER_H
