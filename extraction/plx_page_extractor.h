#ifndef PLX_PAGE_EXTRACTOR_H
#define PLX_PAGE_EXTRACTOR_H

#include "plx_object_assembler.h"
#include "../documents/tokens/plx_page_tokens.h"
#include "../documents/tokens/plx_token_merger.h"
#include <memory>
#include <optional>

namespace plx::extraction {

  // Outcome of one page. A failed page has ok == false, no objects and the
  // error text; the counters hold whatever was reached before the failure.
  struct page_result
  {
    plx_string page_id;
    bool ok = true;
    plx_string error;
    plx_string token_source = "none";
    plx_merge_report merge;
    adapter_metrics adapter;
    assembly_metrics assembly;
    std::vector<extracted_object> objects;

    plxv_map to_map() const;
  };

  /**
   * @brief Runs tokens, merge, pairing and assembly for a single page.
   *
   * Every call builds its own adapter and assembler, so one extractor can
   * serve several pages concurrently as long as its token providers can.
   */
  class page_extractor
  {
    std::shared_ptr<plx_page_tokens> tokens_;
    plx_token_merger merger_;
    std::optional<plx_raster_spec> raster_;

  public:
    explicit page_extractor(std::shared_ptr<plx_page_tokens> tokens, double merge_iou_threshold = 0.5);

    // Fixed page raster for all pages; providers use their own default otherwise.
    void set_raster(const plx_raster_spec& raster) { raster_ = raster; }

    // Never throws for page-level problems; they are reported in the result.
    page_result extract_page(const plx_page_ref& page, const std::vector<rule_payload>& payloads,
                             extraction_policy policy) const;
  };

} // namespace plx::extraction

#endif // PLX_PAGE_EXTRACTOR_H
