#include "plx_page_store.h"
#include "../extraction/plx_extraction_exceptions.h"
#include <filesystem>
#include <fstream>
#include <iterator>

plx_file_page_store::plx_file_page_store(const plx_string& base_dir) : base_dir_(base_dir) {}

plx_bytes plx_file_page_store::read_page_bytes(const plx_page_ref& page) const
{
  if (page.image_path.empty())
  {
    throw source_unavailable_error("Page " + page.page_id.to_std_const() + " has no image", page.page_id);
  }

  std::filesystem::path path(page.image_path.to_std_const());
  if (path.is_relative() && !base_dir_.empty())
  {
    path = std::filesystem::path(base_dir_.to_std_const()) / path;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open())
  {
    throw source_unavailable_error("Cannot open page image " + path.string(), page.page_id);
  }

  plx_bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (bytes.empty())
  {
    throw source_unavailable_error("Page image is empty: " + path.string(), page.page_id);
  }
  return bytes;
}
