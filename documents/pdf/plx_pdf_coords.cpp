#include "plx_pdf_coords.h"
#include <algorithm>

plx_page_transform plx_page_transform::for_page(double width_pt, double height_pt, const plx_raster_spec& raster)
{
  if (width_pt <= 0 || height_pt <= 0) {
    throw std::invalid_argument("Page size must be positive.");
  }

  int target_w = raster.width_px;
  int target_h = raster.height_px;
  if (!raster.has_size()) {
    target_w = static_cast<int>(plx_coords::pdf_to_png_coord(width_pt, raster.dpi));
    target_h = static_cast<int>(plx_coords::pdf_to_png_coord(height_pt, raster.dpi));
  }

  plx_page_transform t;
  t.page_width_pt = width_pt;
  t.page_height_pt = height_pt;
  t.scale_x = target_w / width_pt;
  t.scale_y = target_h / height_pt;
  return t;
}

plx_layout_bounds plx_page_transform::pdf_rect_to_pixels(double x_pt, double y_pt, double w_pt, double h_pt) const
{
  double top_pt = page_height_pt - (y_pt + h_pt);
  plx_layout_bounds px;
  if (!plx_layout_bounds::from_doubles(x_pt * scale_x, top_pt * scale_y,
                                       std::max(1.0, w_pt * scale_x), std::max(1.0, h_pt * scale_y), px)) {
    throw std::invalid_argument("PDF rectangle is outside the pixel range.");
  }
  return px;
}

std::vector<double> plx_page_transform::pixels_to_pdf_rect(const plx_layout_bounds& bounds) const
{
  double x1 = bounds.get_left() / scale_x;
  double x2 = bounds.get_right() / scale_x;
  double y1 = page_height_pt - bounds.get_bottom() / scale_y;
  double y2 = page_height_pt - bounds.get_top() / scale_y;
  return {x1, y1, x2, y2};
}
