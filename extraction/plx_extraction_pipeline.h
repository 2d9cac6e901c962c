#ifndef PLX_EXTRACTION_PIPELINE_H
#define PLX_EXTRACTION_PIPELINE_H

#include "plx_page_extractor.h"
#include "../storage/plx_object_repository.h"

namespace plx::extraction {

  struct run_report
  {
    plx_string project_id;
    extraction_policy policy = extraction_policy::conservative;
    size_t pages_total = 0;
    size_t pages_failed = 0;
    size_t objects_total = 0;
    std::vector<page_result> pages;  // in page order
    plx_string index_generated_at;

    plxv_map to_map() const;
  };

  /**
   * @brief Extracts every page of a project and rebuilds its index.
   *
   * Pages run in batches of at most max_parallel_pages on std::async workers.
   * Each page's objects replace what the repository held for that page, a
   * failed page stores an empty list. Once all pages are done the project
   * index is rebuilt from scratch. Concurrent runs for one project must be
   * serialized by the caller.
   */
  class extraction_pipeline
  {
    std::shared_ptr<page_extractor> extractor_;
    std::shared_ptr<i_object_repository> repository_;
    int max_parallel_pages_;

  public:
    extraction_pipeline(std::shared_ptr<page_extractor> extractor, std::shared_ptr<i_object_repository> repository,
                        int max_parallel_pages = 4);

    run_report run_project(const plx_string& project_id, const std::vector<plx_page_ref>& pages,
                           const std::vector<rule_payload>& payloads, extraction_policy policy) const;

    // Rebuilds the index from everything stored for the project.
    plx::index::project_index rebuild_index(const plx_string& project_id) const;
  };

} // namespace plx::extraction

#endif // PLX_EXTRACTION_PIPELINE_H
