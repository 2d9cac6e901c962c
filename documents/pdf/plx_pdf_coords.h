#ifndef PLX_PDF_COORDS_H
#define PLX_PDF_COORDS_H

#include "../layout/plx_layout_bounds.h"
#include <stdexcept>
#include <vector>

namespace plx_coords {
  /**
   * @brief Converts a PDF coordinate (points, 1/72 inch) to a pixel coordinate.
   * @param pdf_coord Coordinate in PDF points.
   * @param dpi Raster resolution.
   * @throws std::invalid_argument if dpi is not positive.
   */
  inline double pdf_to_png_coord(double pdf_coord, double dpi) {
    if (dpi <= 0) {
      throw std::invalid_argument("DPI must be positive.");
    }
    return (pdf_coord * dpi) / 72.0;
  }

  /**
   * @brief Converts a pixel coordinate back to PDF points.
   * @throws std::invalid_argument if dpi is not positive.
   */
  inline double png_to_pdf_coord(double png_coord, double dpi) {
    if (dpi <= 0) {
      throw std::invalid_argument("DPI must be positive.");
    }
    return (png_coord * 72.0) / dpi;
  }
} // namespace plx_coords

// Requested raster size of a page image. A zero size means "derive from dpi".
struct plx_raster_spec
{
  int width_px = 0;
  int height_px = 0;
  double dpi = 150.0;

  bool has_size() const { return width_px > 0 && height_px > 0; }
};

// Maps PDF points (origin bottom-left) onto the page raster (origin top-left).
// Scale is computed independently per axis.
class plx_page_transform
{
public:
  double page_width_pt = 0.0;
  double page_height_pt = 0.0;
  double scale_x = 1.0;
  double scale_y = 1.0;

  plx_page_transform() = default;

  /**
   * @brief Builds the transform for a page of the given size.
   * @throws std::invalid_argument for a non-positive page size or dpi.
   */
  static plx_page_transform for_page(double width_pt, double height_pt, const plx_raster_spec& raster);

  bool valid() const { return page_width_pt > 0 && page_height_pt > 0 && scale_x > 0 && scale_y > 0; }

  // PDF rectangle (lower-left corner + size, in points) to pixel bounds.
  // Coordinates are truncated, width and height are clamped to at least 1.
  // Throws std::invalid_argument when the result does not fit in int pixels.
  plx_layout_bounds pdf_rect_to_pixels(double x_pt, double y_pt, double w_pt, double h_pt) const;

  // Pixel bounds to [x1, y1, x2, y2] in PDF points, PDF orientation.
  std::vector<double> pixels_to_pdf_rect(const plx_layout_bounds& bounds) const;
};

#endif // PLX_PDF_COORDS_H
