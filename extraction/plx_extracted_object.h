#ifndef PLX_EXTRACTED_OBJECT_H
#define PLX_EXTRACTED_OBJECT_H

#include "../documents/layout/plx_layout_bounds.h"
#include <optional>
#include <variant>
#include <vector>

namespace plx::extraction {

  enum class object_type
  {
    room,
    door,
    schedule_table
  };

  enum class confidence_level
  {
    high,
    medium,
    low
  };

  enum class door_kind
  {
    single,
    double_leaf,
    sliding,
    revolving,
    unknown
  };

  enum class schedule_kind
  {
    door_schedule,
    room_schedule,
    window_schedule,
    finish_schedule,
    equipment_schedule,
    other
  };

  plx_string object_type_to_string(object_type type);
  bool object_type_from_string(const plx_string& text, object_type& out);

  // >= 0.8 high, >= 0.5 medium, below that low.
  confidence_level level_for(double confidence);
  plx_string confidence_level_to_string(confidence_level level);

  plx_string door_kind_to_string(door_kind kind);
  door_kind door_kind_from_string(const plx_string& text);

  plx_string schedule_kind_to_string(schedule_kind kind);
  schedule_kind schedule_kind_from_string(const plx_string& text);

  struct room_details
  {
    std::optional<plx_string> room_number;
    std::optional<plx_string> room_name;
    plx_layout_bounds label_bbox;
    bool ambiguity = false;
    plx_string ambiguity_reason;
  };

  struct door_details
  {
    std::optional<plx_string> door_number;
    door_kind kind = door_kind::unknown;
  };

  struct schedule_details
  {
    schedule_kind kind = schedule_kind::other;
    std::vector<plx_string> headers;
    std::vector<std::vector<plx_string>> rows;
  };

  typedef std::variant<room_details, door_details, schedule_details> object_details;

  // A typed record produced by one extraction run. Not modified after assembly.
  struct extracted_object
  {
    plx_string id;
    plx_string project_id;
    plx_string page_id;
    object_type type = object_type::room;
    plx_string label;
    plx_layout_bounds bbox;
    double confidence = 0.0;
    std::vector<plx_string> provenance;
    std::optional<std::vector<double>> pdf_rect;  // [x1, y1, x2, y2] in PDF points
    object_details details;

    confidence_level get_confidence_level() const { return level_for(confidence); }

    const room_details* room() const { return std::get_if<room_details>(&details); }
    const door_details* door() const { return std::get_if<door_details>(&details); }
    const schedule_details* schedule() const { return std::get_if<schedule_details>(&details); }

    bool has_provenance(const plx_string& tag) const;

    plxv_map to_map() const;
    /**
     * @brief Restores an object written by to_map().
     * @return false when required fields are missing or mistyped.
     */
    static bool from_map(const plxv_map& m, extracted_object& out);
  };

} // namespace plx::extraction

#endif // PLX_EXTRACTED_OBJECT_H
