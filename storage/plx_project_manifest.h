#ifndef PLX_PROJECT_MANIFEST_H
#define PLX_PROJECT_MANIFEST_H

#include "../documents/tokens/plx_token_provider.h"

/**
 * @brief The pages of one project as listed in a manifest file.
 *
 * {"project_id": "...", "pages": [{"page_id": "...", "pdf_path": "...",
 *  "page_number": 0, "image_path": "..."}]}
 *
 * Relative paths are resolved against the manifest's directory.
 */
struct plx_project_manifest
{
  plx_string project_id;
  std::vector<plx_page_ref> pages;

  // false when project_id is missing or a page lacks page_id.
  static bool from_map(const plxv_map& m, const plx_string& base_dir, plx_project_manifest& out);
  static bool load(const plx_string& path, plx_project_manifest& out);
};

#endif // PLX_PROJECT_MANIFEST_H
