#ifndef PLX_MODEL_TOKEN_PROVIDER_H
#define PLX_MODEL_TOKEN_PROVIDER_H

#include "plx_token_provider.h"
#include "../../api/detectors/plx_text_detector.h"
#include "../../storage/plx_page_store.h"
#include <atomic>
#include <memory>

// Fallback provider: runs a text detector over the rendered page image.
class plx_model_token_provider : public i_token_provider
{
  std::shared_ptr<i_page_store> store_;
  std::shared_ptr<i_text_detector> detector_;
  std::atomic<size_t> detector_calls_{0};

public:
  plx_model_token_provider(std::shared_ptr<i_page_store> store, std::shared_ptr<i_text_detector> detector);

  plx_token_source source() const override { return plx_token_source::model; }

  // Detector failures and missing images yield an empty list.
  std::vector<plx_text_token> get_tokens(const plx_page_ref& page,
                                         const plx_raster_spec* raster = nullptr,
                                         plx_page_transform* transform_out = nullptr) override;

  size_t get_detector_calls() const { return detector_calls_.load(); }
};

#endif // PLX_MODEL_TOKEN_PROVIDER_H
