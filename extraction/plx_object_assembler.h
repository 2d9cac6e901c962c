#ifndef PLX_OBJECT_ASSEMBLER_H
#define PLX_OBJECT_ASSEMBLER_H

#include "plx_extracted_object.h"
#include "plx_token_block_adapter.h"
#include "../documents/pdf/plx_pdf_coords.h"
#include <map>

namespace plx::extraction {

  enum class extraction_policy
  {
    conservative,
    relaxed
  };

  plx_string policy_to_string(extraction_policy policy);
  bool policy_from_string(const plx_string& text, extraction_policy& out);

  struct assembly_metrics
  {
    size_t blocks_input = 0;
    size_t rooms_emitted = 0;
    size_t doors_emitted = 0;
    size_t dropped_name_only = 0;
    size_t ambiguous_rooms = 0;
    std::map<plx_string, size_t> drop_reasons;

    plxv_map to_map() const;
  };

  // Everything the assembler needs about one page.
  struct page_assembly_input
  {
    plx_string project_id;
    plx_string page_id;
    std::vector<synthetic_block> blocks;
    std::vector<plx_text_token> door_tokens;
    bool has_pairing_rule = false;
    const plx_page_transform* transform = nullptr;
  };

  /**
   * @brief Converts synthetic blocks and door tokens into typed objects.
   *
   * With a pairing rule in force a block without a number is dropped and
   * counted; otherwise it becomes a room. Paired rooms gain 0.1 confidence,
   * capped at 1.0. Both policies emit the same objects and differ only in
   * their provenance tags.
   */
  class object_assembler
  {
    extraction_policy policy_;

  public:
    static constexpr double pairing_bonus = 0.1;
    static constexpr double door_proximity_px = 100.0;

    explicit object_assembler(extraction_policy policy = extraction_policy::conservative);

    extraction_policy get_policy() const { return policy_; }

    std::vector<extracted_object> assemble(const page_assembly_input& input, assembly_metrics* metrics = nullptr) const;

    std::vector<extracted_object> rooms_from_blocks(const page_assembly_input& input, assembly_metrics& metrics) const;
    std::vector<extracted_object> doors_from_tokens(const page_assembly_input& input, assembly_metrics& metrics) const;

    // Flags low-confidence rooms whose center lies near a door center.
    static size_t flag_door_ambiguity(std::vector<extracted_object>& rooms, const std::vector<extracted_object>& doors);

  private:
    void add_policy_tags(std::vector<plx_string>& provenance) const;
  };

} // namespace plx::extraction

#endif // PLX_OBJECT_ASSEMBLER_H
