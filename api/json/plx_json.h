#ifndef PLX_JSON_H
#define PLX_JSON_H

#include "../../utils/plx_variant.h"

// JSON reader/writer over plxv_map. nlohmann::json stays out of the headers.
class plx_json
{
public:
  /**
   * @brief Binds the handler to a map owned by the caller.
   * @param map_ptr Target map for parse() and source for create(). Must outlive this object.
   */
  explicit plx_json(plxv_map* map_ptr);

  /**
   * @brief Parses a JSON object into the bound map.
   * @param json_string JSON text whose top level is an object.
   * @return false on syntax errors or when the top level is not an object.
   * @note The bound map is cleared first.
   */
  bool parse(const plx_string& json_string);

  /**
   * @brief Serializes the bound map.
   * @param indent Pretty-print indentation, -1 for compact output.
   * @return JSON text, empty on failure.
   */
  plx_string create(int indent = -1) const;

  /**
   * @brief Parses any JSON value (object, array or scalar).
   * @return false on syntax errors; out is left untouched in that case.
   */
  static bool parse_value(const plx_string& json_string, plx_variant& out);

  /**
   * @brief Serializes any variant.
   */
  static plx_string dump(const plx_variant& value, int indent = -1);

private:
  plxv_map* data_map;
};

#endif // PLX_JSON_H
