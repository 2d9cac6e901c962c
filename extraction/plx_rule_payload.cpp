#include "plx_rule_payload.h"
#include "plx_extraction_exceptions.h"
#include "../api/json/plx_json.h"
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace plx::extraction {

  namespace {

    const plx_variant* find_key(const plxv_map& raw, const char* key)
    {
      auto it = raw.find(key);
      if (it == raw.end() || it->second.is_null())
      {
        return nullptr;
      }
      return &it->second;
    }

    plx_string string_field(const plxv_map& raw, const char* key, const plx_string& def = plx_string())
    {
      const plx_variant* value = find_key(raw, key);
      if (!value)
      {
        return def;
      }
      if (!value->is_string())
      {
        throw malformed_rule_error(plx_string("Field '") + key + "' must be a string");
      }
      return value->string_value().trim();
    }

    std::shared_ptr<const std::regex> compile_pattern(const plx_string& pattern)
    {
      try
      {
        return std::make_shared<const std::regex>(pattern.to_std_const(),
                                                  std::regex::ECMAScript | std::regex::icase);
      }
      catch (const std::regex_error& e)
      {
        throw malformed_rule_error("Invalid regex '" + pattern.to_std_const() + "': " + e.what());
      }
    }

    token_detector parse_detector(const plxv_map& raw)
    {
      token_detector detector;
      detector.role = string_field(raw, "token_type");
      if (detector.role.empty())
      {
        throw malformed_rule_error("token_detector without token_type");
      }

      plx_string method = string_field(raw, "detector", "regex").lower();
      if (method == "regex")
      {
        detector.method = detector_method::regex;
        detector.pattern = string_field(raw, "pattern");
        if (detector.pattern.empty())
        {
          throw malformed_rule_error("regex detector for '" + detector.role.to_std_const() + "' without pattern");
        }
        detector.compiled = compile_pattern(detector.pattern);
      }
      else if (method == "length")
      {
        detector.method = detector_method::length;
        const plx_variant* min_len = find_key(raw, "min_len");
        if (!min_len || !min_len->is_number() || min_len->number_value() < 1 ||
            min_len->number_value() > std::numeric_limits<int>::max())
        {
          throw malformed_rule_error("length detector for '" + detector.role.to_std_const() + "' needs min_len >= 1");
        }
        detector.min_length = static_cast<int>(min_len->number_value());
      }
      else
      {
        throw malformed_rule_error("Unknown detector method '" + method.to_std_const() + "'");
      }
      return detector;
    }

    pairing_rule parse_pairing(const plxv_map& raw)
    {
      pairing_rule rule;
      rule.name_role = string_field(raw, "name_token", rule.name_role);
      rule.number_role = string_field(raw, "number_token", rule.number_role);

      plx_string relation = string_field(raw, "relation", "below").lower();
      if (!relation_from_string(relation, rule.relation))
      {
        throw malformed_rule_error("Unknown pairing relation '" + relation.to_std_const() + "'");
      }

      const plx_variant* distance = find_key(raw, "max_distance_px");
      if (distance)
      {
        if (!distance->is_number() || distance->number_value() <= 0)
        {
          throw malformed_rule_error("max_distance_px must be a positive number");
        }
        rule.max_distance_px = distance->number_value();
      }
      return rule;
    }

    exclude_rule parse_exclude(const plxv_map& raw)
    {
      exclude_rule rule;
      rule.pattern = string_field(raw, "pattern");
      if (rule.pattern.empty())
      {
        throw malformed_rule_error("exclude rule without pattern");
      }
      rule.compiled = compile_pattern(rule.pattern);
      plx_string reason = string_field(raw, "reason");
      if (!reason.empty())
      {
        rule.reason = reason;
      }
      return rule;
    }

    // Guide rules wrap the payload: {"rule_id": ..., "payload": {...}}
    const plxv_map& unwrap(const plxv_map& raw)
    {
      auto it = raw.find("payload");
      if (it != raw.end() && it->second.is_map() && !raw.count("kind"))
      {
        return it->second.map_value();
      }
      return raw;
    }

    template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

  } // namespace

  plx_string relation_to_string(pair_relation relation)
  {
    switch (relation)
    {
      case pair_relation::below: return "below";
      case pair_relation::above: return "above";
      case pair_relation::left: return "left";
      case pair_relation::right: return "right";
    }
    return "below";
  }

  bool relation_from_string(const plx_string& text, pair_relation& out)
  {
    plx_string t = text.trim().lower();
    if (t == "below") out = pair_relation::below;
    else if (t == "above") out = pair_relation::above;
    else if (t == "left") out = pair_relation::left;
    else if (t == "right") out = pair_relation::right;
    else return false;
    return true;
  }

  bool token_detector::matches(const plx_string& text, bool name_role) const
  {
    plx_string clean = text.trim();
    if (clean.empty())
    {
      return false;
    }
    if (method == detector_method::regex)
    {
      return compiled && std::regex_match(clean.to_std_const(), *compiled);
    }
    if (static_cast<int>(clean.char_count()) < min_length)
    {
      return false;
    }
    if (name_role)
    {
      return clean.is_upper() && clean.is_alpha();
    }
    return true;
  }

  bool exclude_rule::matches(const plx_string& text) const
  {
    return compiled && std::regex_match(text.trim().to_std_const(), *compiled);
  }

  rule_payload parse_rule_payload(const plxv_map& raw_in, int index)
  {
    const plxv_map& raw = unwrap(raw_in);
    try
    {
      plx_string kind = string_field(raw, "kind").lower();
      if (kind == "token_detector")
      {
        return parse_detector(raw);
      }
      if (kind == "pairing")
      {
        return parse_pairing(raw);
      }
      if (kind == "exclude")
      {
        return parse_exclude(raw);
      }
      throw malformed_rule_error(kind.empty() ? plx_string("Payload without kind")
                                              : plx_string("Unknown payload kind '") + kind + "'");
    }
    catch (const malformed_rule_error& e)
    {
      if (e.get_payload_index() == index)
      {
        throw;
      }
      throw malformed_rule_error(e.what(), index);
    }
  }

  std::vector<rule_payload> parse_rule_payloads(const plx_variant& document, rule_parse_report* report)
  {
    std::vector<rule_payload> payloads;
    rule_parse_report local;

    const plxv_vector* list = nullptr;
    if (document.is_vector())
    {
      list = &document.vector_value();
    }
    else if (document.is_map())
    {
      const plxv_map& root = document.map_value();
      for (const char* key : {"payloads", "rules"})
      {
        auto it = root.find(key);
        if (it != root.end() && it->second.is_vector())
        {
          list = &it->second.vector_value();
          break;
        }
      }
    }

    if (!list)
    {
      std::cerr << "Warning: Rule document contains no payload list" << std::endl;
    }
    else
    {
      for (size_t i = 0; i < list->size(); ++i)
      {
        const plx_variant& entry = (*list)[i];
        try
        {
          if (!entry.is_map())
          {
            throw malformed_rule_error("Payload is not an object", static_cast<int>(i));
          }
          payloads.push_back(parse_rule_payload(entry.map_value(), static_cast<int>(i)));
          ++local.accepted;
        }
        catch (const malformed_rule_error& e)
        {
          std::cerr << "Warning: Skipping malformed rule payload #" << i << ": " << e.what() << std::endl;
          ++local.malformed;
          local.errors.push_back(e.what());
        }
      }
    }

    if (report)
    {
      *report = local;
    }
    return payloads;
  }

  bool load_rule_payloads(const plx_string& path, std::vector<rule_payload>& out, rule_parse_report* report)
  {
    std::ifstream file(path.c_str());
    if (!file.is_open())
    {
      std::cerr << "Error: Cannot open rules file " << path << std::endl;
      return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    plx_variant document;
    if (!plx_json::parse_value(buffer.str(), document))
    {
      std::cerr << "Error: Rules file is not valid JSON: " << path << std::endl;
      return false;
    }
    out = parse_rule_payloads(document, report);
    return true;
  }

  plxv_map payload_to_map(const rule_payload& payload)
  {
    plxv_map m;
    std::visit(overloaded{
      [&m](const token_detector& d) {
        m["kind"] = "token_detector";
        m["token_type"] = d.role;
        if (d.method == detector_method::regex)
        {
          m["detector"] = "regex";
          m["pattern"] = d.pattern;
        }
        else
        {
          m["detector"] = "length";
          m["min_len"] = d.min_length;
        }
      },
      [&m](const pairing_rule& p) {
        m["kind"] = "pairing";
        m["name_token"] = p.name_role;
        m["number_token"] = p.number_role;
        m["relation"] = relation_to_string(p.relation);
        m["max_distance_px"] = p.max_distance_px;
      },
      [&m](const exclude_rule& x) {
        m["kind"] = "exclude";
        m["pattern"] = x.pattern;
        m["reason"] = x.reason;
      }
    }, payload);
    return m;
  }

  const pairing_rule* find_pairing_rule(const std::vector<rule_payload>& payloads)
  {
    const pairing_rule* found = nullptr;
    for (const auto& payload : payloads)
    {
      if (const auto* rule = std::get_if<pairing_rule>(&payload))
      {
        found = rule;
      }
    }
    return found;
  }

  bool has_detectors(const std::vector<rule_payload>& payloads)
  {
    for (const auto& payload : payloads)
    {
      if (std::holds_alternative<token_detector>(payload))
      {
        return true;
      }
    }
    return false;
  }

} // namespace plx::extraction
