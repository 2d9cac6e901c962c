#include "plx_extracted_object.h"
#include <algorithm>

namespace plx::extraction {

  namespace {

    plx_variant optional_string(const std::optional<plx_string>& value)
    {
      return value ? plx_variant(*value) : plx_variant();
    }

    std::optional<plx_string> read_optional_string(const plxv_map& m, const char* key)
    {
      auto it = m.find(key);
      if (it == m.end() || !it->second.is_string())
      {
        return std::nullopt;
      }
      return it->second.string_value();
    }

    plx_string read_string(const plxv_map& m, const char* key)
    {
      auto it = m.find(key);
      if (it == m.end() || !it->second.is_string())
      {
        return plx_string();
      }
      return it->second.string_value();
    }

    plxv_vector string_list(const std::vector<plx_string>& values)
    {
      plxv_vector out;
      for (const auto& v : values)
      {
        out.push_back(v);
      }
      return out;
    }

    std::vector<plx_string> read_string_list(const plx_variant& value)
    {
      std::vector<plx_string> out;
      if (!value.is_vector())
      {
        return out;
      }
      for (const auto& el : value.vector_value())
      {
        if (el.is_string())
        {
          out.push_back(el.string_value());
        }
      }
      return out;
    }

  } // namespace

  plx_string object_type_to_string(object_type type)
  {
    switch (type)
    {
      case object_type::room: return "room";
      case object_type::door: return "door";
      case object_type::schedule_table: return "schedule_table";
    }
    return "room";
  }

  bool object_type_from_string(const plx_string& text, object_type& out)
  {
    plx_string t = text.trim().lower();
    if (t == "room") out = object_type::room;
    else if (t == "door") out = object_type::door;
    else if (t == "schedule_table") out = object_type::schedule_table;
    else return false;
    return true;
  }

  confidence_level level_for(double confidence)
  {
    if (confidence >= 0.8) return confidence_level::high;
    if (confidence >= 0.5) return confidence_level::medium;
    return confidence_level::low;
  }

  plx_string confidence_level_to_string(confidence_level level)
  {
    switch (level)
    {
      case confidence_level::high: return "high";
      case confidence_level::medium: return "medium";
      case confidence_level::low: return "low";
    }
    return "low";
  }

  plx_string door_kind_to_string(door_kind kind)
  {
    switch (kind)
    {
      case door_kind::single: return "single";
      case door_kind::double_leaf: return "double";
      case door_kind::sliding: return "sliding";
      case door_kind::revolving: return "revolving";
      case door_kind::unknown: return "unknown";
    }
    return "unknown";
  }

  door_kind door_kind_from_string(const plx_string& text)
  {
    plx_string t = text.trim().lower();
    if (t == "single") return door_kind::single;
    if (t == "double") return door_kind::double_leaf;
    if (t == "sliding") return door_kind::sliding;
    if (t == "revolving") return door_kind::revolving;
    return door_kind::unknown;
  }

  plx_string schedule_kind_to_string(schedule_kind kind)
  {
    switch (kind)
    {
      case schedule_kind::door_schedule: return "door_schedule";
      case schedule_kind::room_schedule: return "room_schedule";
      case schedule_kind::window_schedule: return "window_schedule";
      case schedule_kind::finish_schedule: return "finish_schedule";
      case schedule_kind::equipment_schedule: return "equipment_schedule";
      case schedule_kind::other: return "other";
    }
    return "other";
  }

  schedule_kind schedule_kind_from_string(const plx_string& text)
  {
    plx_string t = text.trim().lower();
    if (t == "door_schedule") return schedule_kind::door_schedule;
    if (t == "room_schedule") return schedule_kind::room_schedule;
    if (t == "window_schedule") return schedule_kind::window_schedule;
    if (t == "finish_schedule") return schedule_kind::finish_schedule;
    if (t == "equipment_schedule") return schedule_kind::equipment_schedule;
    return schedule_kind::other;
  }

  bool extracted_object::has_provenance(const plx_string& tag) const
  {
    return std::find(provenance.begin(), provenance.end(), tag) != provenance.end();
  }

  plxv_map extracted_object::to_map() const
  {
    plxv_map m;
    m["id"] = id;
    m["project_id"] = project_id;
    m["page_id"] = page_id;
    m["type"] = object_type_to_string(type);
    m["label"] = label;
    m["bbox"] = bbox.to_variant();
    m["confidence"] = confidence;
    m["confidence_level"] = confidence_level_to_string(get_confidence_level());
    m["provenance"] = string_list(provenance);
    if (pdf_rect)
    {
      plxv_vector rect;
      for (double v : *pdf_rect)
      {
        rect.push_back(v);
      }
      m["geometry_pdf"] = rect;
    }

    if (const room_details* r = room())
    {
      m["room_number"] = optional_string(r->room_number);
      m["room_name"] = optional_string(r->room_name);
      m["label_bbox"] = r->label_bbox.to_variant();
      m["ambiguity"] = r->ambiguity;
      m["ambiguity_reason"] = r->ambiguity ? plx_variant(r->ambiguity_reason) : plx_variant();
    }
    else if (const door_details* d = door())
    {
      m["door_number"] = optional_string(d->door_number);
      m["door_type"] = door_kind_to_string(d->kind);
    }
    else if (const schedule_details* s = schedule())
    {
      m["schedule_type"] = schedule_kind_to_string(s->kind);
      m["headers"] = string_list(s->headers);
      plxv_vector rows;
      for (const auto& row : s->rows)
      {
        rows.push_back(string_list(row));
      }
      m["rows"] = rows;
    }
    return m;
  }

  bool extracted_object::from_map(const plxv_map& m, extracted_object& out)
  {
    extracted_object obj;
    obj.id = read_string(m, "id");
    obj.project_id = read_string(m, "project_id");
    obj.page_id = read_string(m, "page_id");
    obj.label = read_string(m, "label");
    if (obj.id.empty() || obj.page_id.empty() || !object_type_from_string(read_string(m, "type"), obj.type))
    {
      return false;
    }

    auto bbox = m.find("bbox");
    if (bbox == m.end() || !plx_layout_bounds::from_variant(bbox->second, obj.bbox))
    {
      return false;
    }
    auto confidence = m.find("confidence");
    if (confidence == m.end() || !confidence->second.is_number())
    {
      return false;
    }
    obj.confidence = confidence->second.number_value();

    auto provenance = m.find("provenance");
    if (provenance != m.end())
    {
      obj.provenance = read_string_list(provenance->second);
    }

    auto rect = m.find("geometry_pdf");
    if (rect != m.end() && rect->second.is_vector() && rect->second.vector_value().size() == 4)
    {
      std::vector<double> values;
      for (const auto& v : rect->second.vector_value())
      {
        values.push_back(v.number_value());
      }
      obj.pdf_rect = values;
    }

    switch (obj.type)
    {
      case object_type::room:
      {
        room_details r;
        r.room_number = read_optional_string(m, "room_number");
        r.room_name = read_optional_string(m, "room_name");
        auto label_bbox = m.find("label_bbox");
        if (label_bbox == m.end() || !plx_layout_bounds::from_variant(label_bbox->second, r.label_bbox))
        {
          r.label_bbox = obj.bbox;
        }
        auto ambiguity = m.find("ambiguity");
        r.ambiguity = ambiguity != m.end() && ambiguity->second.is_bool() && ambiguity->second.bool_value();
        r.ambiguity_reason = read_string(m, "ambiguity_reason");
        obj.details = r;
        break;
      }
      case object_type::door:
      {
        door_details d;
        d.door_number = read_optional_string(m, "door_number");
        d.kind = door_kind_from_string(read_string(m, "door_type"));
        obj.details = d;
        break;
      }
      case object_type::schedule_table:
      {
        schedule_details s;
        s.kind = schedule_kind_from_string(read_string(m, "schedule_type"));
        auto headers = m.find("headers");
        if (headers != m.end())
        {
          s.headers = read_string_list(headers->second);
        }
        auto rows = m.find("rows");
        if (rows != m.end() && rows->second.is_vector())
        {
          for (const auto& row : rows->second.vector_value())
          {
            s.rows.push_back(read_string_list(row));
          }
        }
        obj.details = s;
        break;
      }
    }

    out = obj;
    return true;
  }

} // namespace plx::extraction
