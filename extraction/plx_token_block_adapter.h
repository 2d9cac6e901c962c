#ifndef PLX_TOKEN_BLOCK_ADAPTER_H
#define PLX_TOKEN_BLOCK_ADAPTER_H

#include "plx_rule_payload.h"
#include "../documents/tokens/plx_text_token.h"
#include <map>
#include <optional>

namespace plx::extraction {

  // A labeled region built from a name token and, when paired, a number token.
  struct synthetic_block
  {
    plx_layout_bounds bbox;
    plx_string text;                        // constituent texts joined by '\n'
    plx_string name_value;
    std::optional<plx_string> number_value;
    double confidence = 0.0;
    std::vector<plx_string> source_tokens;
    double pair_distance = 0.0;             // 0 for name-only blocks

    bool is_paired() const { return number_value.has_value(); }
    plxv_map to_map() const;
  };

  struct adapter_metrics
  {
    size_t tokens_input = 0;
    size_t name_tokens = 0;
    size_t number_tokens = 0;
    size_t blocks_created = 0;
    size_t paired_with_number = 0;
    size_t name_only_no_number = 0;
    size_t excluded_by_rule = 0;
    std::map<plx_string, size_t> excluded_reasons;

    double rooms_with_number_ratio() const;
    plxv_map to_map() const;
  };

  // Tokens sorted into the roles of the active pairing.
  struct token_roles
  {
    std::vector<plx_text_token> names;
    std::vector<plx_text_token> numbers;
  };

  /**
   * @brief Turns separate name and number tokens into synthetic blocks.
   *
   * Name candidates are visited left to right (ties top to bottom). Each takes
   * the nearest unconsumed number candidate that lies within the pairing
   * distance and satisfies the pairing relation; a consumed number is never
   * offered again. Names without a partner still produce a block.
   *
   * The adapter holds no mutable state; it may be shared between threads.
   */
  class token_block_adapter
  {
    std::vector<token_detector> detectors_;
    std::vector<exclude_rule> excludes_;
    pairing_rule pairing_;
    bool has_pairing_;

    static constexpr double relation_tolerance_px = 50.0;

  public:
    explicit token_block_adapter(const std::vector<rule_payload>& payloads);

    bool has_pairing_rule() const { return has_pairing_; }
    const pairing_rule& get_pairing() const { return pairing_; }

    /**
     * @brief Runs the detectors of one role over the tokens.
     * @return Tokens whose first matching detector for role matched, in input order.
     */
    std::vector<plx_text_token> tokens_for_role(const std::vector<plx_text_token>& tokens,
                                                const plx_string& role) const;

    // Name/number partition of the pairing roles, exclude rules applied to names.
    token_roles classify(const std::vector<plx_text_token>& tokens, adapter_metrics* metrics = nullptr) const;

    std::vector<synthetic_block> create_blocks(const std::vector<plx_text_token>& tokens,
                                               adapter_metrics* metrics = nullptr) const;

    // True when candidate lies in the pairing relation to name (50px tolerance).
    static bool satisfies_relation(pair_relation relation, const plx_layout_bounds& name,
                                   const plx_layout_bounds& candidate);

  private:
    bool is_name_role(const plx_string& role) const;
    bool role_has_detectors(const plx_string& role) const;
  };

  // One-shot form of token_block_adapter::create_blocks.
  std::vector<synthetic_block> create_blocks(const std::vector<plx_text_token>& tokens,
                                             const std::vector<rule_payload>& payloads,
                                             adapter_metrics* metrics = nullptr);

} // namespace plx::extraction

#endif // PLX_TOKEN_BLOCK_ADAPTER_H
