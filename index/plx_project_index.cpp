#include "plx_project_index.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace plx::index {

  namespace {

    plxv_map lists_to_map(const id_lists& lists)
    {
      plxv_map m;
      for (const auto& entry : lists)
      {
        plxv_vector ids;
        for (const auto& id : entry.second)
        {
          ids.push_back(id);
        }
        m[entry.first] = ids;
      }
      return m;
    }

    bool lists_from_variant(const plxv_map& m, const char* key, id_lists& out)
    {
      auto it = m.find(key);
      if (it == m.end())
      {
        return true;
      }
      if (!it->second.is_map())
      {
        return false;
      }
      for (const auto& entry : it->second.map_value())
      {
        if (!entry.second.is_vector())
        {
          return false;
        }
        std::vector<plx_string>& ids = out[entry.first];
        for (const auto& id : entry.second.vector_value())
        {
          if (id.is_string())
          {
            ids.push_back(id.string_value());
          }
        }
      }
      return true;
    }

  } // namespace

  plx_string utc_timestamp()
  {
    auto now = std::chrono::system_clock::now();
    std::time_t time_val = std::chrono::system_clock::to_time_t(now);
    std::tm tm = {};
    gmtime_r(&time_val, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return plx_string(oss.str());
  }

  const std::vector<plx_string>& project_index::lookup(const id_lists& lists, const plx_string& key)
  {
    static const std::vector<plx_string> empty;
    auto it = lists.find(key);
    return it == lists.end() ? empty : it->second;
  }

  plxv_map project_index::to_map() const
  {
    plxv_map m;
    m["project_id"] = project_id;
    m["generated_at"] = generated_at;
    m["object_count"] = static_cast<long long>(object_count);
    m["rooms_by_number"] = lists_to_map(rooms_by_number);
    m["rooms_by_name"] = lists_to_map(rooms_by_name);
    m["objects_by_type"] = lists_to_map(objects_by_type);
    return m;
  }

  bool project_index::from_map(const plxv_map& m, project_index& out)
  {
    project_index idx;
    auto project = m.find("project_id");
    if (project == m.end() || !project->second.is_string())
    {
      return false;
    }
    idx.project_id = project->second.string_value();

    auto generated = m.find("generated_at");
    if (generated != m.end() && generated->second.is_string())
    {
      idx.generated_at = generated->second.string_value();
    }
    auto count = m.find("object_count");
    if (count != m.end() && count->second.is_int() && count->second.int_value() >= 0)
    {
      idx.object_count = static_cast<size_t>(count->second.int_value());
    }

    if (!lists_from_variant(m, "rooms_by_number", idx.rooms_by_number) ||
        !lists_from_variant(m, "rooms_by_name", idx.rooms_by_name) ||
        !lists_from_variant(m, "objects_by_type", idx.objects_by_type))
    {
      return false;
    }

    out = idx;
    return true;
  }

  project_index build_index(const plx_string& project_id,
                            const std::vector<plx::extraction::extracted_object>& objects)
  {
    using namespace plx::extraction;

    project_index idx;
    idx.project_id = project_id;
    idx.generated_at = utc_timestamp();
    idx.object_count = objects.size();

    for (const auto& obj : objects)
    {
      idx.objects_by_type[object_type_to_string(obj.type)].push_back(obj.id);

      const room_details* room = obj.room();
      if (!room)
      {
        continue;
      }
      if (room->room_number && !room->room_number->empty())
      {
        idx.rooms_by_number[*room->room_number].push_back(obj.id);
      }
      if (room->room_name && !room->room_name->empty())
      {
        idx.rooms_by_name[*room->room_name].push_back(obj.id);
      }
    }

    std::cout << "Index built for project " << project_id << ": " << idx.rooms_by_number.size()
              << " room numbers, " << idx.rooms_by_name.size() << " room names, "
              << idx.objects_by_type.size() << " object types" << std::endl;
    return idx;
  }

} // namespace plx::index
