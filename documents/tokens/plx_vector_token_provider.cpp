#include "plx_vector_token_provider.h"
#include "../pdf/plx_pdf_document.h"
#include "../../extraction/plx_extraction_exceptions.h"
#include <iostream>
#include <stdexcept>

plx_vector_token_provider::plx_vector_token_provider(double default_dpi) : default_dpi_(default_dpi)
{
  if (default_dpi_ <= 0)
  {
    throw std::invalid_argument("DPI must be positive.");
  }
}

std::vector<plx_text_token> plx_vector_token_provider::get_tokens(const plx_page_ref& page,
                                                                  const plx_raster_spec* raster,
                                                                  plx_page_transform* transform_out)
{
  std::vector<plx_text_token> tokens;
  if (!page.has_pdf())
  {
    return tokens;
  }

  plx_raster_spec spec;
  if (raster)
  {
    spec = *raster;
  }
  else
  {
    spec.dpi = default_dpi_;
  }

  try
  {
    plx_pdf_document doc;
    doc.load(page.pdf_path);

    double width_pt = 0;
    double height_pt = 0;
    doc.page_size(page.page_number, width_pt, height_pt);
    plx_page_transform transform = plx_page_transform::for_page(width_pt, height_pt, spec);

    size_t out_of_range = 0;
    for (const auto& word : doc.words(page.page_number))
    {
      plx_string text = word.text.trim();
      if (text.empty())
      {
        continue;
      }
      try
      {
        plx_layout_bounds bbox = transform.pdf_rect_to_pixels(word.x, word.y, word.width, word.height);
        tokens.emplace_back(text, bbox, 1.0, plx_token_source::vector, page.page_id);
      }
      catch (const std::invalid_argument&)
      {
        ++out_of_range;
      }
    }
    if (out_of_range > 0)
    {
      std::cerr << "Warning: Skipped " << out_of_range << " words outside the page raster on page "
                << page.page_id << std::endl;
    }

    if (transform_out)
    {
      *transform_out = transform;
    }
  }
  catch (const source_unavailable_error& e)
  {
    std::cerr << "Warning: Vector text unavailable for page " << page.page_id << ": " << e.what() << std::endl;
    tokens.clear();
  }
  catch (const std::invalid_argument& e)
  {
    std::cerr << "Warning: Invalid page geometry for page " << page.page_id << ": " << e.what() << std::endl;
    tokens.clear();
  }
  catch (const std::exception& e)
  {
    std::cerr << "Warning: Vector text failed for page " << page.page_id << ": " << e.what() << std::endl;
    tokens.clear();
  }

  std::cout << "Vector tokens for page " << page.page_id << ": " << tokens.size() << std::endl;
  return tokens;
}
