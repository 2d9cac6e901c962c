#include "plx_model_token_provider.h"
#include "../../extraction/plx_extraction_exceptions.h"
#include <iostream>
#include <stdexcept>

plx_model_token_provider::plx_model_token_provider(std::shared_ptr<i_page_store> store,
                                                   std::shared_ptr<i_text_detector> detector)
  : store_(std::move(store)), detector_(std::move(detector))
{
  if (!store_ || !detector_)
  {
    throw std::invalid_argument("plx_model_token_provider needs a page store and a detector");
  }
}

std::vector<plx_text_token> plx_model_token_provider::get_tokens(const plx_page_ref& page,
                                                                 const plx_raster_spec* /*raster*/,
                                                                 plx_page_transform* /*transform_out*/)
{
  std::vector<plx_text_token> tokens;

  std::vector<plx_text_detection> detections;
  try
  {
    plx_bytes image = store_->read_page_bytes(page);
    ++detector_calls_;
    detections = detector_->detect(page.page_id, image);
  }
  catch (const source_unavailable_error& e)
  {
    std::cerr << "Warning: No page image for model tokens on page " << page.page_id << ": " << e.what() << std::endl;
    return tokens;
  }
  catch (const detector_error& e)
  {
    std::cerr << "Warning: Text detector failed on page " << page.page_id << ": " << e.what() << std::endl;
    return tokens;
  }

  size_t skipped = 0;
  for (const auto& detection : detections)
  {
    plx_string text = detection.text.trim();
    if (detection.bbox.size() != 4 || text.empty())
    {
      ++skipped;
      continue;
    }
    bool negative = false;
    for (double v : detection.bbox)
    {
      if (v < 0) negative = true;
    }
    plx_layout_bounds bbox;
    bool in_range = !negative && plx_layout_bounds::from_doubles(detection.bbox[0], detection.bbox[1],
                                                                 detection.bbox[2], detection.bbox[3], bbox);
    if (!in_range || !bbox.has_positive_size() || detection.confidence < 0.0 || detection.confidence > 1.0)
    {
      ++skipped;
      continue;
    }
    tokens.emplace_back(text, bbox, detection.confidence, plx_token_source::model, page.page_id);
  }

  if (skipped > 0)
  {
    std::cerr << "Warning: Skipped " << skipped << " invalid detector blocks on page " << page.page_id << std::endl;
  }
  std::cout << "Model tokens for page " << page.page_id << ": " << tokens.size() << std::endl;
  return tokens;
}
