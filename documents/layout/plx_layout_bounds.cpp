#include "plx_layout_bounds.h"
#include <algorithm>
#include <cmath>
#include <limits>

plx_layout_bounds::plx_layout_bounds() {}

plx_layout_bounds::plx_layout_bounds(int x_val, int y_val, int width_val, int height_val)
  : x(x_val), y(y_val), width(width_val), height(height_val)
{
}

int plx_layout_bounds::get_left() const {
  return x;
}

int plx_layout_bounds::get_right() const {
  return x + width;
}

int plx_layout_bounds::get_top() const {
  return y;
}

int plx_layout_bounds::get_bottom() const {
  return y + height;
}

double plx_layout_bounds::get_center_x() const {
  return x + width / 2.0;
}

double plx_layout_bounds::get_center_y() const {
  return y + height / 2.0;
}

long long plx_layout_bounds::area() const {
  if (!has_positive_size()) return 0;
  return static_cast<long long>(width) * height;
}

bool plx_layout_bounds::has_positive_size() const {
  return width > 0 && height > 0;
}

long long plx_layout_bounds::intersection_area(const plx_layout_bounds& other) const {
  int left = std::max(get_left(), other.get_left());
  int top = std::max(get_top(), other.get_top());
  int right = std::min(get_right(), other.get_right());
  int bottom = std::min(get_bottom(), other.get_bottom());
  if (right <= left || bottom <= top) return 0;
  return (static_cast<long long>(right) - left) * (static_cast<long long>(bottom) - top);
}

double plx_layout_bounds::iou(const plx_layout_bounds& other) const {
  long long inter = intersection_area(other);
  long long uni = area() + other.area() - inter;
  if (uni <= 0) return 0.0;
  return static_cast<double>(inter) / static_cast<double>(uni);
}

plx_layout_bounds plx_layout_bounds::union_with(const plx_layout_bounds& other) const {
  int left = std::min(get_left(), other.get_left());
  int top = std::min(get_top(), other.get_top());
  int right = std::max(get_right(), other.get_right());
  int bottom = std::max(get_bottom(), other.get_bottom());
  return plx_layout_bounds(left, top, right - left, bottom - top);
}

double plx_layout_bounds::center_distance(const plx_layout_bounds& other) const {
  double dx = get_center_x() - other.get_center_x();
  double dy = get_center_y() - other.get_center_y();
  return std::sqrt(dx * dx + dy * dy);
}

bool plx_layout_bounds::operator==(const plx_layout_bounds& other) const {
  return x == other.x && y == other.y && width == other.width && height == other.height;
}

plx_variant plx_layout_bounds::to_variant() const {
  plxv_vector v;
  v.push_back(plx_variant(x));
  v.push_back(plx_variant(y));
  v.push_back(plx_variant(width));
  v.push_back(plx_variant(height));
  return plx_variant(v);
}

bool plx_layout_bounds::from_variant(const plx_variant& value, plx_layout_bounds& out) {
  if (!value.is_vector() || value.vector_value().size() != 4) return false;
  const plxv_vector& v = value.vector_value();
  for (const auto& el : v) {
    if (!el.is_number()) return false;
  }
  return from_doubles(v[0].number_value(), v[1].number_value(),
                      v[2].number_value(), v[3].number_value(), out);
}

bool plx_layout_bounds::from_doubles(double x_val, double y_val, double w_val, double h_val,
                                     plx_layout_bounds& out) {
  const double lo = std::numeric_limits<int>::min();
  const double hi = std::numeric_limits<int>::max();
  for (double v : {x_val, y_val, w_val, h_val}) {
    if (!std::isfinite(v) || v <= lo - 1.0 || v >= hi + 1.0) return false;
  }
  long long left = static_cast<long long>(x_val);
  long long top = static_cast<long long>(y_val);
  long long right = left + static_cast<long long>(w_val);
  long long bottom = top + static_cast<long long>(h_val);
  const long long int_min = std::numeric_limits<int>::min();
  const long long int_max = std::numeric_limits<int>::max();
  if (right < int_min || right > int_max || bottom < int_min || bottom > int_max) return false;
  out = plx_layout_bounds(static_cast<int>(x_val), static_cast<int>(y_val),
                          static_cast<int>(w_val), static_cast<int>(h_val));
  return true;
}
