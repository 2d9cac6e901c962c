#include "plx_project_manifest.h"
#include "../api/json/plx_json.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

  plx_string resolve(const plx_string& base_dir, const plx_string& path)
  {
    if (path.empty() || base_dir.empty())
    {
      return path;
    }
    std::filesystem::path p(path.to_std_const());
    if (p.is_absolute())
    {
      return path;
    }
    return (std::filesystem::path(base_dir.to_std_const()) / p).string();
  }

  plx_string string_field(const plxv_map& m, const char* key)
  {
    auto it = m.find(key);
    return it != m.end() && it->second.is_string() ? it->second.string_value() : plx_string();
  }

} // namespace

bool plx_project_manifest::from_map(const plxv_map& m, const plx_string& base_dir, plx_project_manifest& out)
{
  plx_project_manifest manifest;
  manifest.project_id = string_field(m, "project_id");
  if (manifest.project_id.empty())
  {
    std::cerr << "Error: Manifest has no project_id" << std::endl;
    return false;
  }

  auto pages = m.find("pages");
  if (pages == m.end() || !pages->second.is_vector())
  {
    std::cerr << "Error: Manifest has no pages list" << std::endl;
    return false;
  }

  for (const auto& entry : pages->second.vector_value())
  {
    if (!entry.is_map())
    {
      std::cerr << "Error: Manifest page entry is not an object" << std::endl;
      return false;
    }
    const plxv_map& page_map = entry.map_value();

    plx_page_ref page;
    page.project_id = manifest.project_id;
    page.page_id = string_field(page_map, "page_id");
    if (page.page_id.empty())
    {
      std::cerr << "Error: Manifest page entry without page_id" << std::endl;
      return false;
    }
    page.pdf_path = resolve(base_dir, string_field(page_map, "pdf_path"));
    page.image_path = resolve(base_dir, string_field(page_map, "image_path"));

    auto number = page_map.find("page_number");
    if (number != page_map.end() && number->second.is_int())
    {
      page.page_number = static_cast<int>(number->second.int_value());
    }
    manifest.pages.push_back(page);
  }

  out = manifest;
  return true;
}

bool plx_project_manifest::load(const plx_string& path, plx_project_manifest& out)
{
  std::ifstream file(path.c_str());
  if (!file.is_open())
  {
    std::cerr << "Error: Cannot open manifest " << path << std::endl;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  plxv_map document;
  plx_json json(&document);
  if (!json.parse(buffer.str()))
  {
    std::cerr << "Error: Manifest is not a JSON object: " << path << std::endl;
    return false;
  }

  plx_string base_dir = std::filesystem::path(path.to_std_const()).parent_path().string();
  return from_map(document, base_dir, out);
}
