#ifndef PLX_TOKEN_SUMMARY_H
#define PLX_TOKEN_SUMMARY_H

#include "../documents/tokens/plx_text_token.h"
#include <optional>
#include <utility>

namespace plx::extraction {

  struct name_candidate
  {
    plx_string text;
    size_t count = 0;
    plx_layout_bounds example_bbox;
  };

  struct number_candidate
  {
    plx_string text;
    size_t count = 0;
    std::optional<plx_string> near_name;
    int distance_px = 0;
  };

  struct high_frequency_code
  {
    plx_string text;
    size_t count = 0;
    plx_string note;
  };

  struct pairing_pattern
  {
    plx_string observed_relation;  // number_below_name, number_right_of_name, ...
    int typical_min_px = 0;
    int typical_max_px = 0;
    plx_string confidence;         // high, medium, low
    std::vector<std::pair<plx_string, plx_string>> sample_pairs;
  };

  /**
   * @brief Vocabulary-free statistics about a page's tokens.
   *
   * Feeds the rule negotiation with what the page looks like: which uppercase
   * words and short numbers occur, which numbers sit near a word, which codes
   * repeat often enough to be noise, and how names and numbers are usually
   * arranged.
   */
  struct token_summary
  {
    size_t total_text_blocks = 0;
    std::vector<name_candidate> name_candidates;
    std::vector<number_candidate> number_candidates;
    std::vector<high_frequency_code> high_frequency_numbers;
    std::optional<pairing_pattern> pattern;

    plx_string to_prompt_text() const;
    plxv_map to_map() const;
  };

  constexpr size_t high_frequency_threshold = 10;

  // 2+ letters A-Z, including accented French capitals.
  bool looks_like_room_name(const plx_string& text);
  // 2-4 ASCII digits.
  bool looks_like_room_number(const plx_string& text);

  token_summary summarize_tokens(const std::vector<plx_text_token>& tokens, int max_pairing_distance = 100);

} // namespace plx::extraction

#endif // PLX_TOKEN_SUMMARY_H
