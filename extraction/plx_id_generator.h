#ifndef PLX_ID_GENERATOR_H
#define PLX_ID_GENERATOR_H

#include "../documents/layout/plx_layout_bounds.h"
#include <array>

namespace plx::extraction {

  // Grid size used to absorb rendering jitter before hashing.
  constexpr int id_bucket_size_px = 50;

  // Lowercase, trim, drop punctuation, collapse whitespace.
  plx_string normalize_label(const plx_string& label);

  // Floor to the bucket grid; negative values round toward negative infinity.
  int bucket_coordinate(int value, int bucket_size = id_bucket_size_px);

  // [x, y, w, h] to bucketed corners (x1, y1, x2, y2).
  std::array<int, 4> bucket_corners(const plx_layout_bounds& bbox, int bucket_size = id_bucket_size_px);

  /**
   * @brief Deterministic object identifier.
   *
   * SHA-256 over "page_id|type|normalized_label|(x1, y1, x2, y2)[|qualifier]",
   * truncated to 8 bytes and rendered as "<type>_<16 hex>". Identical inputs
   * always give identical IDs; boxes inside the same buckets collide on purpose.
   */
  plx_string generate_object_id(const plx_string& page_id, const plx_string& object_type, const plx_string& label,
                                const plx_layout_bounds& bbox, const plx_string& qualifier = plx_string());

  plx_string generate_room_id(const plx_string& page_id, const plx_string& label, const plx_layout_bounds& bbox,
                              const plx_string& room_number = plx_string());

  plx_string generate_door_id(const plx_string& page_id, const plx_string& label, const plx_layout_bounds& bbox,
                              const plx_string& door_number = plx_string());

  // Lowercase hex SHA-256 of data; exposed for tests.
  plx_string sha256_hex(const plx_string& data);

} // namespace plx::extraction

#endif // PLX_ID_GENERATOR_H
