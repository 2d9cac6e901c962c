#include "plx_extraction_pipeline.h"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>

namespace plx::extraction {

  plxv_map run_report::to_map() const
  {
    plxv_map m;
    m["project_id"] = project_id;
    m["policy"] = policy_to_string(policy);
    m["pages_total"] = static_cast<long long>(pages_total);
    m["pages_failed"] = static_cast<long long>(pages_failed);
    m["objects_total"] = static_cast<long long>(objects_total);
    m["index_generated_at"] = index_generated_at;
    plxv_vector list;
    for (const auto& page : pages)
    {
      list.push_back(page.to_map());
    }
    m["pages"] = list;
    return m;
  }

  extraction_pipeline::extraction_pipeline(std::shared_ptr<page_extractor> extractor,
                                           std::shared_ptr<i_object_repository> repository,
                                           int max_parallel_pages)
    : extractor_(std::move(extractor)), repository_(std::move(repository)),
      max_parallel_pages_(std::max(1, max_parallel_pages))
  {
    if (!extractor_ || !repository_)
    {
      throw std::invalid_argument("extraction_pipeline needs an extractor and a repository");
    }
  }

  plx::index::project_index extraction_pipeline::rebuild_index(const plx_string& project_id) const
  {
    plx::index::project_index index = plx::index::build_index(project_id, repository_->objects_for_project(project_id));
    repository_->put_index(index);
    return index;
  }

  run_report extraction_pipeline::run_project(const plx_string& project_id, const std::vector<plx_page_ref>& pages,
                                              const std::vector<rule_payload>& payloads,
                                              extraction_policy policy) const
  {
    run_report report;
    report.project_id = project_id;
    report.policy = policy;
    report.pages_total = pages.size();

    std::cout << "Extracting project " << project_id << ": " << pages.size() << " pages, policy "
              << policy_to_string(policy) << ", " << max_parallel_pages_ << " workers" << std::endl;

    const size_t batch_size = static_cast<size_t>(max_parallel_pages_);
    for (size_t start = 0; start < pages.size(); start += batch_size)
    {
      size_t end = std::min(pages.size(), start + batch_size);

      std::vector<std::future<page_result>> futures;
      futures.reserve(end - start);
      for (size_t i = start; i < end; ++i)
      {
        plx_page_ref page = pages[i];
        if (page.project_id.empty())
        {
          page.project_id = project_id;
        }
        futures.push_back(std::async(std::launch::async, [this, page, &payloads, policy]() {
          return extractor_->extract_page(page, payloads, policy);
        }));
      }

      // Results are stored in page order regardless of completion order.
      for (auto& f : futures)
      {
        page_result result = f.get();
        if (!result.ok)
        {
          report.pages_failed++;
        }
        report.objects_total += result.objects.size();
        repository_->replace_page_objects(project_id, result.page_id, result.objects);
        report.pages.push_back(std::move(result));
      }
    }

    plx::index::project_index index = rebuild_index(project_id);
    report.index_generated_at = index.generated_at;

    std::cout << "Project " << project_id << " done: " << report.objects_total << " objects, "
              << report.pages_failed << " of " << report.pages_total << " pages failed" << std::endl;
    return report;
  }

} // namespace plx::extraction
