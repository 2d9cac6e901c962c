#include "plx_json.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <limits>

namespace {

  plx_variant nlohmann_to_plx(const nlohmann::json& j_val)
  {
    if (j_val.is_null())
    {
      return plx_variant();
    }
    if (j_val.is_boolean())
    {
      return plx_variant(j_val.get<bool>());
    }
    if (j_val.is_number_unsigned())
    {
      std::uint64_t u_val = j_val.get<std::uint64_t>();
      if (u_val > static_cast<std::uint64_t>(std::numeric_limits<long long>::max()))
      {
        std::cerr << "Warning: Unsigned JSON number " << u_val << " too large, converting to double." << std::endl;
        return plx_variant(static_cast<double>(u_val));
      }
      return plx_variant(static_cast<long long>(u_val));
    }
    if (j_val.is_number_integer())
    {
      return plx_variant(static_cast<long long>(j_val.get<std::int64_t>()));
    }
    if (j_val.is_number_float())
    {
      return plx_variant(j_val.get<double>());
    }
    if (j_val.is_string())
    {
      return plx_variant(plx_string(j_val.get<std::string>()));
    }
    if (j_val.is_array())
    {
      plxv_vector vec;
      vec.reserve(j_val.size());
      for (const auto& el : j_val)
      {
        vec.push_back(nlohmann_to_plx(el));
      }
      return plx_variant(vec);
    }
    if (j_val.is_object())
    {
      plxv_map map_val;
      for (auto it = j_val.begin(); it != j_val.end(); ++it)
      {
        map_val[plx_string(it.key())] = nlohmann_to_plx(it.value());
      }
      return plx_variant(map_val);
    }
    std::cerr << "Warning: Unsupported JSON value type (binary) ignored." << std::endl;
    return plx_variant();
  }

  nlohmann::json plx_to_nlohmann(const plx_variant& var)
  {
    switch (var.in_state())
    {
      case plx_variant::string_state:
        return var.string_value().to_std_const();
      case plx_variant::int_state:
        return var.int_value();
      case plx_variant::bool_state:
        return var.bool_value();
      case plx_variant::double_state:
        return var.double_value();
      case plx_variant::vector_state:
      {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& el : var.vector_value())
        {
          arr.push_back(plx_to_nlohmann(el));
        }
        return arr;
      }
      case plx_variant::map_state:
      {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& pair : var.map_value())
        {
          obj[pair.first.to_std_const()] = plx_to_nlohmann(pair.second);
        }
        return obj;
      }
      case plx_variant::none:
      default:
        return nullptr;
    }
  }

} // namespace

plx_json::plx_json(plxv_map* map_ptr) : data_map(map_ptr)
{
  if (!data_map)
  {
    std::cerr << "Error: plx_json constructed with a null map." << std::endl;
  }
}

bool plx_json::parse(const plx_string& json_string)
{
  if (!data_map)
  {
    std::cerr << "Error: plx_json::parse called on a null map." << std::endl;
    return false;
  }

  data_map->clear();

  plx_variant value;
  if (!parse_value(json_string, value))
  {
    return false;
  }
  if (!value.is_map())
  {
    std::cerr << "Error: JSON string does not represent an object at the top level." << std::endl;
    return false;
  }
  *data_map = value.map_value();
  return true;
}

plx_string plx_json::create(int indent) const
{
  if (!data_map)
  {
    std::cerr << "Error: plx_json::create called on a null map." << std::endl;
    return plx_string();
  }
  return dump(plx_variant(*data_map), indent);
}

bool plx_json::parse_value(const plx_string& json_string, plx_variant& out)
{
  try
  {
    nlohmann::json parsed = nlohmann::json::parse(json_string.to_std_const());
    out = nlohmann_to_plx(parsed);
    return true;
  }
  catch (const nlohmann::json::parse_error& e)
  {
    std::cerr << "JSON parse error: " << e.what() << " at byte " << e.byte << std::endl;
    return false;
  }
  catch (const nlohmann::json::exception& e)
  {
    std::cerr << "JSON conversion error: " << e.what() << std::endl;
    return false;
  }
}

plx_string plx_json::dump(const plx_variant& value, int indent)
{
  try
  {
    return plx_string(plx_to_nlohmann(value).dump(indent));
  }
  catch (const nlohmann::json::type_error& e)
  {
    // Invalid UTF-8 in a string value
    std::cerr << "JSON dump type error: " << e.what() << std::endl;
    return plx_string();
  }
}
