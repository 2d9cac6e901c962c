#ifndef PLX_RULE_PAYLOAD_H
#define PLX_RULE_PAYLOAD_H

#include "../utils/plx_variant.h"
#include <memory>
#include <regex>
#include <variant>
#include <vector>

namespace plx::extraction {

  enum class detector_method
  {
    regex,
    length
  };

  enum class pair_relation
  {
    below,
    above,
    left,
    right
  };

  plx_string relation_to_string(pair_relation relation);
  bool relation_from_string(const plx_string& text, pair_relation& out);

  // Classifies a token into a role ("room_name", "room_number", "door_number", ...).
  struct token_detector
  {
    plx_string role;
    detector_method method = detector_method::regex;
    plx_string pattern;
    int min_length = 0;
    std::shared_ptr<const std::regex> compiled;

    /**
     * @brief Tests a token text against this detector.
     * @param text Raw token text; surrounding whitespace is ignored.
     * @param name_role Length detectors additionally require an all-uppercase,
     *        all-letter text for name roles.
     */
    bool matches(const plx_string& text, bool name_role) const;
  };

  // Which two roles combine, in what relation, within what center distance.
  struct pairing_rule
  {
    plx_string name_role = "room_name";
    plx_string number_role = "room_number";
    pair_relation relation = pair_relation::below;
    double max_distance_px = 200.0;
  };

  // Name candidates matching the pattern are discarded and counted under reason.
  struct exclude_rule
  {
    plx_string pattern;
    plx_string reason = "excluded_by_pattern";
    std::shared_ptr<const std::regex> compiled;

    bool matches(const plx_string& text) const;
  };

  typedef std::variant<token_detector, pairing_rule, exclude_rule> rule_payload;

  struct rule_parse_report
  {
    size_t accepted = 0;
    size_t malformed = 0;
    std::vector<plx_string> errors;
  };

  /**
   * @brief Parses one payload object.
   *
   * Keys: kind (token_detector | pairing | exclude), token_type, detector
   * (regex | length), pattern, min_len, name_token, number_token, relation,
   * max_distance_px, reason.
   *
   * @throws malformed_rule_error for unknown kinds, invalid regexes, missing
   *         fields, unknown relations or non-positive distances.
   */
  rule_payload parse_rule_payload(const plxv_map& raw, int index = -1);

  /**
   * @brief Parses a payload list, skipping malformed entries with a warning.
   *
   * Accepts a list of payload objects, a map with a "payloads" list, or guide
   * rules that carry their payload under "payload".
   */
  std::vector<rule_payload> parse_rule_payloads(const plx_variant& document, rule_parse_report* report = nullptr);

  // Reads and parses a JSON rules file. Returns false when the file is unreadable or not JSON.
  bool load_rule_payloads(const plx_string& path, std::vector<rule_payload>& out, rule_parse_report* report = nullptr);

  plxv_map payload_to_map(const rule_payload& payload);

  // Last pairing payload, or nullptr when the set has none.
  const pairing_rule* find_pairing_rule(const std::vector<rule_payload>& payloads);

  bool has_detectors(const std::vector<rule_payload>& payloads);

} // namespace plx::extraction

#endif // PLX_RULE_PAYLOAD_H
