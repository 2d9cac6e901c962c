#include "plx_memory_object_repository.h"
#include "../api/json/plx_json.h"
#include <fstream>
#include <iostream>
#include <sstream>

using plx::extraction::extracted_object;

void plx_memory_object_repository::replace_page_objects(const plx_string& project_id, const plx_string& page_id,
                                                        const std::vector<extracted_object>& objects)
{
  std::vector<extracted_object> unique;
  std::map<plx_string, size_t> position;
  for (const auto& obj : objects)
  {
    auto it = position.find(obj.id);
    if (it != position.end())
    {
      std::cerr << "Warning: Object id collision " << obj.id << " on page " << page_id
                << ", keeping last write" << std::endl;
      unique[it->second] = obj;
      continue;
    }
    position[obj.id] = unique.size();
    unique.push_back(obj);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  project_slot& project = projects_[project_id];
  for (auto& page : project.pages)
  {
    if (page.page_id == page_id)
    {
      page.objects = std::move(unique);
      return;
    }
  }
  project.pages.push_back({page_id, std::move(unique)});
}

std::vector<extracted_object> plx_memory_object_repository::objects_for_project(const plx_string& project_id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<extracted_object> result;
  auto it = projects_.find(project_id);
  if (it == projects_.end())
  {
    return result;
  }
  for (const auto& page : it->second.pages)
  {
    result.insert(result.end(), page.objects.begin(), page.objects.end());
  }
  return result;
}

std::vector<extracted_object> plx_memory_object_repository::objects_for_page(const plx_string& project_id,
                                                                             const plx_string& page_id) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = projects_.find(project_id);
  if (it != projects_.end())
  {
    for (const auto& page : it->second.pages)
    {
      if (page.page_id == page_id)
      {
        return page.objects;
      }
    }
  }
  return {};
}

void plx_memory_object_repository::put_index(const plx::index::project_index& index)
{
  std::lock_guard<std::mutex> lock(mutex_);
  project_slot& project = projects_[index.project_id];
  project.index = index;
  project.has_index = true;
}

bool plx_memory_object_repository::get_index(const plx_string& project_id, plx::index::project_index& out) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = projects_.find(project_id);
  if (it == projects_.end() || !it->second.has_index)
  {
    return false;
  }
  out = it->second.index;
  return true;
}

std::vector<plx_string> plx_memory_object_repository::project_ids() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<plx_string> ids;
  for (const auto& entry : projects_)
  {
    ids.push_back(entry.first);
  }
  return ids;
}

plxv_map plx_memory_object_repository::project_to_map(const plx_string& project_id) const
{
  plxv_map m;
  m["project_id"] = project_id;

  plxv_vector objects;
  for (const auto& obj : objects_for_project(project_id))
  {
    objects.push_back(obj.to_map());
  }
  m["objects"] = objects;

  plx::index::project_index index;
  if (get_index(project_id, index))
  {
    m["index"] = index.to_map();
  }
  return m;
}

bool plx_memory_object_repository::project_from_map(const plxv_map& m)
{
  auto project = m.find("project_id");
  auto objects = m.find("objects");
  if (project == m.end() || !project->second.is_string() || objects == m.end() || !objects->second.is_vector())
  {
    return false;
  }
  const plx_string& project_id = project->second.string_value();

  // Group by page, keeping the document order of first appearance.
  std::vector<plx_string> page_order;
  std::map<plx_string, std::vector<extracted_object>> by_page;
  size_t skipped = 0;
  for (const auto& entry : objects->second.vector_value())
  {
    extracted_object obj;
    if (!entry.is_map() || !extracted_object::from_map(entry.map_value(), obj))
    {
      skipped++;
      continue;
    }
    if (by_page.find(obj.page_id) == by_page.end())
    {
      page_order.push_back(obj.page_id);
    }
    by_page[obj.page_id].push_back(obj);
  }
  if (skipped > 0)
  {
    std::cerr << "Warning: Skipped " << skipped << " unreadable objects in project " << project_id << std::endl;
  }

  for (const auto& page_id : page_order)
  {
    replace_page_objects(project_id, page_id, by_page[page_id]);
  }

  auto index = m.find("index");
  if (index != m.end() && index->second.is_map())
  {
    plx::index::project_index loaded;
    if (plx::index::project_index::from_map(index->second.map_value(), loaded))
    {
      put_index(loaded);
    }
    else
    {
      std::cerr << "Warning: Stored index for project " << project_id << " is unreadable" << std::endl;
    }
  }
  return true;
}

bool plx_memory_object_repository::save_json(const plx_string& project_id, const plx_string& path) const
{
  std::ofstream file(path.c_str());
  if (!file.is_open())
  {
    std::cerr << "Error: Cannot write " << path << std::endl;
    return false;
  }
  file << plx_json::dump(project_to_map(project_id), 2) << std::endl;
  return file.good();
}

bool plx_memory_object_repository::load_json(const plx_string& path)
{
  std::ifstream file(path.c_str());
  if (!file.is_open())
  {
    std::cerr << "Error: Cannot open " << path << std::endl;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  plxv_map document;
  plx_json json(&document);
  if (!json.parse(buffer.str()))
  {
    std::cerr << "Error: " << path << " is not a JSON object" << std::endl;
    return false;
  }
  if (!project_from_map(document))
  {
    std::cerr << "Error: " << path << " is not a project document" << std::endl;
    return false;
  }
  return true;
}
