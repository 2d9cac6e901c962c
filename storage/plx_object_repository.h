#ifndef PLX_OBJECT_REPOSITORY_H
#define PLX_OBJECT_REPOSITORY_H

#include "../index/plx_project_index.h"

// Storage for extracted objects and project indices, keyed by project and page.
class i_object_repository
{
public:
  virtual ~i_object_repository() = default;

  // Replaces everything stored for one page. Re-running a page is idempotent.
  virtual void replace_page_objects(const plx_string& project_id, const plx_string& page_id,
                                    const std::vector<plx::extraction::extracted_object>& objects) = 0;

  // All objects of a project, pages in first-stored order, objects in page order.
  virtual std::vector<plx::extraction::extracted_object> objects_for_project(const plx_string& project_id) const = 0;

  virtual std::vector<plx::extraction::extracted_object> objects_for_page(const plx_string& project_id,
                                                                          const plx_string& page_id) const = 0;

  virtual void put_index(const plx::index::project_index& index) = 0;

  // false when no index was built for the project yet.
  virtual bool get_index(const plx_string& project_id, plx::index::project_index& out) const = 0;
};

#endif // PLX_OBJECT_REPOSITORY_H
