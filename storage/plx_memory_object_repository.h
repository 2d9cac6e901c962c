#ifndef PLX_MEMORY_OBJECT_REPOSITORY_H
#define PLX_MEMORY_OBJECT_REPOSITORY_H

#include "plx_object_repository.h"
#include <mutex>

/**
 * @brief Thread-safe in-process object store.
 *
 * Objects sharing an id within a page are treated as one object: the last
 * write wins and a warning is logged. save_json()/load_json() persist one
 * project as a JSON document (objects plus index).
 */
class plx_memory_object_repository : public i_object_repository
{
  struct page_slot
  {
    plx_string page_id;
    std::vector<plx::extraction::extracted_object> objects;
  };

  struct project_slot
  {
    std::vector<page_slot> pages;
    bool has_index = false;
    plx::index::project_index index;
  };

  mutable std::mutex mutex_;
  std::map<plx_string, project_slot> projects_;

public:
  void replace_page_objects(const plx_string& project_id, const plx_string& page_id,
                            const std::vector<plx::extraction::extracted_object>& objects) override;

  std::vector<plx::extraction::extracted_object> objects_for_project(const plx_string& project_id) const override;

  std::vector<plx::extraction::extracted_object> objects_for_page(const plx_string& project_id,
                                                                  const plx_string& page_id) const override;

  void put_index(const plx::index::project_index& index) override;
  bool get_index(const plx_string& project_id, plx::index::project_index& out) const override;

  std::vector<plx_string> project_ids() const;

  plxv_map project_to_map(const plx_string& project_id) const;

  /**
   * @brief Loads one project document written by project_to_map().
   * @return false when the document is not a project document. Objects that
   *         fail to parse are skipped with a warning.
   */
  bool project_from_map(const plxv_map& m);

  bool save_json(const plx_string& project_id, const plx_string& path) const;
  bool load_json(const plx_string& path);
};

#endif // PLX_MEMORY_OBJECT_REPOSITORY_H
