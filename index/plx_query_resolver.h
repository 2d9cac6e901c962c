#ifndef PLX_QUERY_RESOLVER_H
#define PLX_QUERY_RESOLVER_H

#include "../storage/plx_object_repository.h"

namespace plx::index {

  // Absent and empty values are both "not given".
  struct query_criteria
  {
    std::optional<plx_string> room_number;
    std::optional<plx_string> room_name;
    std::optional<plx_string> type;

    bool empty() const;
    plxv_map to_map() const;
  };

  struct query_match
  {
    plx_string object_id;
    plx::extraction::object_type type = plx::extraction::object_type::room;
    plx_string page_id;
    plx_string label;
    double score = 0.0;
    plx::extraction::confidence_level level = plx::extraction::confidence_level::low;
    plx_layout_bounds bbox;
    std::optional<std::vector<double>> pdf_rect;
    std::vector<plx_string> reasons;

    bool has_reason(const plx_string& reason) const;
    plxv_map to_map() const;
  };

  struct query_result
  {
    plx_string project_id;
    query_criteria criteria;
    std::vector<query_match> matches;
    bool ambiguous = false;
    plx_string message;  // empty unless ambiguous

    plxv_map to_map() const;
  };

  /**
   * @brief Resolves lookups against a project's index without picking winners.
   *
   * Criteria are combined with OR. Every match carries the criteria it
   * satisfied, plus unique_match when exactly one object matched. More than
   * one match marks the result ambiguous; matches come back in repository
   * order with no ranking.
   */
  class query_resolver
  {
    const i_object_repository& repository_;

  public:
    explicit query_resolver(const i_object_repository& repository);

    /**
     * @throws query_error with code QUERY_EMPTY when no criterion is given.
     */
    query_result query(const plx_string& project_id, const query_criteria& criteria) const;
  };

} // namespace plx::index

#endif // PLX_QUERY_RESOLVER_H
