#ifndef PLX_PROJECT_INDEX_H
#define PLX_PROJECT_INDEX_H

#include "../extraction/plx_extracted_object.h"
#include <map>

namespace plx::index {

  typedef std::map<plx_string, std::vector<plx_string>> id_lists;

  /**
   * @brief Reverse lookups from printed values to object ids for one project.
   *
   * Keys are the exact stored values (room number, room name, type name).
   * Id lists keep the order in which objects were visited. An index is built
   * wholesale from the full object list of a run and replaces the previous one.
   */
  struct project_index
  {
    plx_string project_id;
    plx_string generated_at;  // ISO-8601, UTC
    size_t object_count = 0;
    id_lists rooms_by_number;
    id_lists rooms_by_name;
    id_lists objects_by_type;

    // Ids under key, empty when the key is unknown.
    static const std::vector<plx_string>& lookup(const id_lists& lists, const plx_string& key);

    plxv_map to_map() const;
    static bool from_map(const plxv_map& m, project_index& out);
  };

  project_index build_index(const plx_string& project_id,
                            const std::vector<plx::extraction::extracted_object>& objects);

  plx_string utc_timestamp();

} // namespace plx::index

#endif // PLX_PROJECT_INDEX_H
