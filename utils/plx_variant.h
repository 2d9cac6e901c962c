#ifndef PLX_VARIANT_H
#define PLX_VARIANT_H

#include "plx_string.h"
#include <map>

class plx_variant;

typedef std::vector<plx_variant> plxv_vector;
typedef std::map<plx_string, plx_variant> plxv_map;

// Loosely typed value used for JSON documents, rule payloads and report views.
class plx_variant
{
public:
  enum state
  {
    none,
    string_state,
    int_state,
    bool_state,
    double_state,
    vector_state,
    map_state
  };

private:
  void* content;
  state is;

  void copy_from(const plx_variant& other);

  template<typename to>
  to* cast_content() const
  {
    return static_cast<to*>(content);
  }

public:
  void clear();
  void reset(state to);
  ~plx_variant();
  plx_variant();
  plx_variant(const char* from_string);
  plx_variant(const plx_string& from_string);
  plx_variant(int from_int);
  plx_variant(long long from_int);
  plx_variant(bool from_bool);
  plx_variant(double from_double);
  plx_variant(const plxv_vector& from_vector);
  plx_variant(const plxv_map& from_map);
  plx_variant(const plx_variant& other);
  plx_variant(plx_variant&& other) noexcept;

  state in_state() const { return is; }
  bool is_null() const { return is == none; }
  bool is_string() const { return is == string_state; }
  bool is_int() const { return is == int_state; }
  bool is_bool() const { return is == bool_state; }
  bool is_double() const { return is == double_state; }
  bool is_number() const { return is == int_state || is == double_state; }
  bool is_vector() const { return is == vector_state; }
  bool is_map() const { return is == map_state; }

  // Convert in place when needed, then return the content.
  plx_string& to_string();
  long long& to_int();
  bool& to_bool();
  double& to_double();
  plxv_vector& to_vector();
  plxv_map& to_map();

  // Only valid after a type check.
  const plx_string& string_value() const;
  const long long& int_value() const;
  const bool& bool_value() const;
  const double& double_value() const;
  const plxv_vector& vector_value() const;
  const plxv_map& map_value() const;

  // Numeric value of an int or double, def otherwise.
  double number_value(double def = 0.0) const;

  bool converts_to(state s) const;
  plx_variant convert(state to) const;

  plx_variant& operator=(const plx_variant& other);
  plx_variant& operator=(plx_variant&& other) noexcept;

  bool operator==(const plx_variant& other) const;
  bool operator!=(const plx_variant& other) const { return !(*this == other); }
};

#endif // PLX_VARIANT_H
