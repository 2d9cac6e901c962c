#ifndef PLX_LAYOUT_BOUNDS_H
#define PLX_LAYOUT_BOUNDS_H

#include "../../utils/plx_variant.h"

// Axis-aligned box in page-pixel space, origin top-left, stored as [x, y, width, height].
class plx_layout_bounds
{
public:
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  plx_layout_bounds();
  plx_layout_bounds(int x_val, int y_val, int width_val, int height_val);

  int get_left() const;
  int get_right() const;
  int get_top() const;
  int get_bottom() const;
  double get_center_x() const;
  double get_center_y() const;
  long long area() const;

  bool has_positive_size() const;

  long long intersection_area(const plx_layout_bounds& other) const;
  // Intersection over union, 0 when either box is empty.
  double iou(const plx_layout_bounds& other) const;
  // Smallest box covering both.
  plx_layout_bounds union_with(const plx_layout_bounds& other) const;
  // Euclidean distance between the two centers.
  double center_distance(const plx_layout_bounds& other) const;

  bool operator==(const plx_layout_bounds& other) const;
  bool operator!=(const plx_layout_bounds& other) const { return !(*this == other); }

  plx_variant to_variant() const;
  // Accepts a 4-element numeric vector; fractional values are truncated.
  static bool from_variant(const plx_variant& value, plx_layout_bounds& out);
  // Truncates to int. False for non-finite values or when an edge would not fit in int.
  static bool from_doubles(double x_val, double y_val, double w_val, double h_val, plx_layout_bounds& out);
};

#endif // PLX_LAYOUT_BOUNDS_H
