#include "plx_variant.h"

void plx_variant::copy_from(const plx_variant& other)
{
  reset(other.is);
  switch (other.is)
  {
    case string_state: *cast_content<plx_string>() = other.string_value(); break;
    case int_state: *cast_content<long long>() = other.int_value(); break;
    case bool_state: *cast_content<bool>() = other.bool_value(); break;
    case double_state: *cast_content<double>() = other.double_value(); break;
    case vector_state: *cast_content<plxv_vector>() = other.vector_value(); break;
    case map_state: *cast_content<plxv_map>() = other.map_value(); break;
    case none: break;
  }
}

void plx_variant::clear()
{
  switch (is)
  {
    case string_state: delete cast_content<plx_string>(); break;
    case int_state: delete cast_content<long long>(); break;
    case bool_state: delete cast_content<bool>(); break;
    case double_state: delete cast_content<double>(); break;
    case vector_state: delete cast_content<plxv_vector>(); break;
    case map_state: delete cast_content<plxv_map>(); break;
    case none: break;
  }
  content = nullptr;
  is = none;
}

void plx_variant::reset(plx_variant::state to)
{
  clear();
  is = to;
  switch (to)
  {
    case string_state: content = new plx_string; break;
    case int_state: content = new long long(0); break;
    case bool_state: content = new bool(false); break;
    case double_state: content = new double(0.0); break;
    case vector_state: content = new plxv_vector; break;
    case map_state: content = new plxv_map; break;
    case none: break;
  }
}

plx_variant::~plx_variant()
{
  clear();
}

plx_variant::plx_variant() : content(nullptr), is(none) {}

plx_variant::plx_variant(const char* from_string)
  : content(new plx_string(from_string)), is(string_state) {}

plx_variant::plx_variant(const plx_string& from_string)
  : content(new plx_string(from_string)), is(string_state) {}

plx_variant::plx_variant(int from_int)
  : content(new long long(from_int)), is(int_state) {}

plx_variant::plx_variant(long long from_int)
  : content(new long long(from_int)), is(int_state) {}

plx_variant::plx_variant(bool from_bool)
  : content(new bool(from_bool)), is(bool_state) {}

plx_variant::plx_variant(double from_double)
  : content(new double(from_double)), is(double_state) {}

plx_variant::plx_variant(const plxv_vector& from_vector)
  : content(new plxv_vector(from_vector)), is(vector_state) {}

plx_variant::plx_variant(const plxv_map& from_map)
  : content(new plxv_map(from_map)), is(map_state) {}

plx_variant::plx_variant(const plx_variant& other) : content(nullptr), is(none)
{
  copy_from(other);
}

plx_variant::plx_variant(plx_variant&& other) noexcept : content(other.content), is(other.is)
{
  other.content = nullptr;
  other.is = none;
}

plx_string& plx_variant::to_string()
{
  if (is != string_state)
  {
    *this = convert(string_state);
  }
  return *cast_content<plx_string>();
}

long long& plx_variant::to_int()
{
  if (is != int_state)
  {
    *this = convert(int_state);
  }
  return *cast_content<long long>();
}

bool& plx_variant::to_bool()
{
  if (is != bool_state)
  {
    *this = convert(bool_state);
  }
  return *cast_content<bool>();
}

double& plx_variant::to_double()
{
  if (is != double_state)
  {
    *this = convert(double_state);
  }
  return *cast_content<double>();
}

plxv_vector& plx_variant::to_vector()
{
  if (is != vector_state)
  {
    *this = convert(vector_state);
  }
  return *cast_content<plxv_vector>();
}

plxv_map& plx_variant::to_map()
{
  if (is != map_state)
  {
    *this = convert(map_state);
  }
  return *cast_content<plxv_map>();
}

const plx_string& plx_variant::string_value() const
{
  return *cast_content<plx_string>();
}

const long long& plx_variant::int_value() const
{
  return *cast_content<long long>();
}

const bool& plx_variant::bool_value() const
{
  return *cast_content<bool>();
}

const double& plx_variant::double_value() const
{
  return *cast_content<double>();
}

const plxv_vector& plx_variant::vector_value() const
{
  return *cast_content<plxv_vector>();
}

const plxv_map& plx_variant::map_value() const
{
  return *cast_content<plxv_map>();
}

double plx_variant::number_value(double def) const
{
  if (is == int_state)
  {
    return static_cast<double>(int_value());
  }
  if (is == double_state)
  {
    return double_value();
  }
  return def;
}

bool plx_variant::converts_to(plx_variant::state s) const
{
  if (is == s)
  {
    return true;
  }
  switch (is)
  {
    case string_state:
    {
      plx_string lower = string_value().lower();
      return (s == bool_state && (lower == "true" || lower == "false" || string_value().is_integer())) ||
             (s == int_state && string_value().is_integer()) ||
             (s == double_state && string_value().is_number());
    }
    case bool_state:
      return s == int_state || s == string_state;
    case int_state:
    case double_state:
      return s == int_state || s == double_state || s == string_state || s == bool_state;
    default:
      return false;
  }
}

plx_variant plx_variant::convert(plx_variant::state to) const
{
  if (is == to)
  {
    return *this;
  }

  plx_variant res;
  res.reset(to);

  if (is == string_state)
  {
    if (to == int_state)
    {
      res = plx_variant(static_cast<long long>(string_value().to_int(0)));
    }
    else if (to == bool_state)
    {
      plx_string lower = string_value().trim().lower();
      res = plx_variant(lower == "true" || lower == "yes" || lower == "on" || string_value().to_int(0) != 0);
    }
    else if (to == double_state)
    {
      res = plx_variant(string_value().to_double(0));
    }
  }
  else if (is == bool_state)
  {
    if (to == int_state)
    {
      res = plx_variant(bool_value() ? 1 : 0);
    }
    else if (to == string_state)
    {
      res = plx_variant(bool_value() ? "true" : "false");
    }
  }
  else if (is == int_state)
  {
    if (to == double_state)
    {
      res = plx_variant(static_cast<double>(int_value()));
    }
    else if (to == bool_state)
    {
      res = plx_variant(int_value() != 0);
    }
    else if (to == string_state)
    {
      res = plx_variant(plx_string(int_value()));
    }
  }
  else if (is == double_state)
  {
    if (to == int_state)
    {
      res = plx_variant(static_cast<long long>(double_value()));
    }
    else if (to == bool_state)
    {
      res = plx_variant(double_value() != 0.0);
    }
    else if (to == string_state)
    {
      res = plx_variant(plx_string(double_value()));
    }
  }
  return res;
}

plx_variant& plx_variant::operator=(const plx_variant& other)
{
  if (this != &other)
  {
    copy_from(other);
  }
  return *this;
}

plx_variant& plx_variant::operator=(plx_variant&& other) noexcept
{
  if (this != &other)
  {
    clear();
    content = other.content;
    is = other.is;
    other.content = nullptr;
    other.is = none;
  }
  return *this;
}

bool plx_variant::operator==(const plx_variant& other) const
{
  if (is == none || other.is == none)
  {
    return is == other.is;
  }
  if (is_number() && other.is_number())
  {
    return number_value() == other.number_value();
  }
  if (is != other.is)
  {
    return false;
  }
  switch (is)
  {
    case string_state: return string_value() == other.string_value();
    case bool_state: return bool_value() == other.bool_value();
    case vector_state: return vector_value() == other.vector_value();
    case map_state: return map_value() == other.map_value();
    default: return false;
  }
}
