#ifndef PLX_PAGE_STORE_H
#define PLX_PAGE_STORE_H

#include "../documents/tokens/plx_token_provider.h"
#include <vector>

typedef std::vector<unsigned char> plx_bytes;

// Access to rendered page images.
class i_page_store
{
public:
  virtual ~i_page_store() = default;

  /**
   * @brief Reads the encoded image (PNG/JPEG) of a page.
   * @throws source_unavailable_error when the page has no readable image.
   */
  virtual plx_bytes read_page_bytes(const plx_page_ref& page) const = 0;
};

// Reads page images from the local file system (plx_page_ref::image_path).
class plx_file_page_store : public i_page_store
{
  plx_string base_dir_;

public:
  // Relative image paths are resolved against base_dir.
  explicit plx_file_page_store(const plx_string& base_dir = plx_string());

  plx_bytes read_page_bytes(const plx_page_ref& page) const override;
};

#endif // PLX_PAGE_STORE_H
