#include "plx_page_extractor.h"
#include <iostream>
#include <stdexcept>

namespace plx::extraction {

  plxv_map page_result::to_map() const
  {
    plxv_map m;
    m["page_id"] = page_id;
    m["ok"] = ok;
    m["error"] = ok ? plx_variant() : plx_variant(error);
    m["token_source"] = token_source;
    m["merge"] = merge.to_map();
    m["adapter"] = adapter.to_map();
    m["assembly"] = assembly.to_map();
    m["object_count"] = static_cast<long long>(objects.size());
    return m;
  }

  page_extractor::page_extractor(std::shared_ptr<plx_page_tokens> tokens, double merge_iou_threshold)
    : tokens_(std::move(tokens)), merger_(merge_iou_threshold)
  {
    if (!tokens_)
    {
      throw std::invalid_argument("page_extractor needs a token source");
    }
  }

  page_result page_extractor::extract_page(const plx_page_ref& page, const std::vector<rule_payload>& payloads,
                                           extraction_policy policy) const
  {
    page_result result;
    result.page_id = page.page_id;

    try
    {
      plx_page_tokens_result page_tokens = tokens_->get_tokens_for_page(page, raster_ ? &*raster_ : nullptr);
      result.token_source = page_tokens.source_used;
      if (page_tokens.tokens.empty())
      {
        std::cerr << "Warning: Page " << page.page_id << " has no tokens, no objects extracted" << std::endl;
        return result;
      }

      std::vector<plx_text_token> tokens = merger_.merge(page_tokens.tokens, &result.merge);

      token_block_adapter adapter(payloads);
      page_assembly_input input;
      input.project_id = page.project_id;
      input.page_id = page.page_id;
      input.blocks = adapter.create_blocks(tokens, &result.adapter);
      input.door_tokens = adapter.tokens_for_role(tokens, "door_number");
      input.has_pairing_rule = adapter.has_pairing_rule();
      input.transform = page_tokens.has_transform ? &page_tokens.transform : nullptr;

      object_assembler assembler(policy);
      result.objects = assembler.assemble(input, &result.assembly);
    }
    catch (const std::exception& e)
    {
      std::cerr << "Error: Extraction failed for page " << page.page_id << ": " << e.what() << std::endl;
      result.ok = false;
      result.error = e.what();
      result.objects.clear();
    }
    return result;
  }

} // namespace plx::extraction
