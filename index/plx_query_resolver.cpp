#include "plx_query_resolver.h"
#include "../extraction/plx_extraction_exceptions.h"
#include <algorithm>
#include <iostream>
#include <set>

namespace plx::index {

  using namespace plx::extraction;

  namespace {

    bool given(const std::optional<plx_string>& value)
    {
      return value && !value->trim().empty();
    }

  } // namespace

  bool query_criteria::empty() const
  {
    return !given(room_number) && !given(room_name) && !given(type);
  }

  plxv_map query_criteria::to_map() const
  {
    plxv_map m;
    if (given(room_number)) m["room_number"] = room_number->trim();
    if (given(room_name)) m["room_name"] = room_name->trim();
    if (given(type)) m["type"] = type->trim().lower();
    return m;
  }

  bool query_match::has_reason(const plx_string& reason) const
  {
    return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
  }

  plxv_map query_match::to_map() const
  {
    plxv_map m;
    m["object_id"] = object_id;
    m["type"] = object_type_to_string(type);
    m["page_id"] = page_id;
    m["label"] = label;
    m["score"] = score;
    m["confidence_level"] = confidence_level_to_string(level);
    m["geometry"] = bbox.to_variant();
    if (pdf_rect)
    {
      plxv_vector rect;
      for (double v : *pdf_rect)
      {
        rect.push_back(v);
      }
      m["geometry_pdf"] = rect;
    }
    plxv_vector r;
    for (const auto& reason : reasons)
    {
      r.push_back(reason);
    }
    m["reasons"] = r;
    return m;
  }

  plxv_map query_result::to_map() const
  {
    plxv_map m;
    m["project_id"] = project_id;
    m["query"] = criteria.to_map();
    plxv_vector list;
    for (const auto& match : matches)
    {
      list.push_back(match.to_map());
    }
    m["matches"] = list;
    m["ambiguous"] = ambiguous;
    m["message"] = message.empty() ? plx_variant() : plx_variant(message);
    return m;
  }

  query_resolver::query_resolver(const i_object_repository& repository) : repository_(repository) {}

  query_result query_resolver::query(const plx_string& project_id, const query_criteria& criteria) const
  {
    if (criteria.empty())
    {
      throw query_error("QUERY_EMPTY", "At least one query parameter is required");
    }

    query_result result;
    result.project_id = project_id;
    result.criteria = criteria;

    project_index idx;
    if (!repository_.get_index(project_id, idx))
    {
      std::cerr << "Warning: No index for project " << project_id << std::endl;
      return result;
    }

    std::set<plx_string> matching;
    std::map<plx_string, std::vector<plx_string>> reasons;
    auto collect = [&](const id_lists& lists, const plx_string& key, const char* reason) {
      for (const auto& id : project_index::lookup(lists, key))
      {
        matching.insert(id);
        std::vector<plx_string>& r = reasons[id];
        if (std::find(r.begin(), r.end(), reason) == r.end())
        {
          r.push_back(reason);
        }
      }
    };

    if (given(criteria.room_number))
    {
      collect(idx.rooms_by_number, criteria.room_number->trim(), "room_number_match");
    }
    if (given(criteria.room_name))
    {
      collect(idx.rooms_by_name, criteria.room_name->trim(), "room_name_match");
    }
    if (given(criteria.type))
    {
      collect(idx.objects_by_type, criteria.type->trim().lower(), "type_match");
    }

    if (!matching.empty())
    {
      for (const auto& obj : repository_.objects_for_project(project_id))
      {
        if (matching.find(obj.id) == matching.end())
        {
          continue;
        }
        query_match match;
        match.object_id = obj.id;
        match.type = obj.type;
        match.page_id = obj.page_id;
        match.label = obj.label;
        match.score = obj.confidence;
        match.level = obj.get_confidence_level();
        match.bbox = obj.bbox;
        match.pdf_rect = obj.pdf_rect;
        match.reasons = reasons[obj.id];
        if (matching.size() == 1)
        {
          match.reasons.push_back("unique_match");
        }
        result.matches.push_back(match);
      }
    }

    result.ambiguous = result.matches.size() > 1;
    if (result.ambiguous)
    {
      result.message = "Multiple candidates found";
    }

    std::cout << "Query on project " << project_id << ": " << result.matches.size() << " matches"
              << (result.ambiguous ? " (ambiguous)" : "") << std::endl;
    return result;
  }

} // namespace plx::index
