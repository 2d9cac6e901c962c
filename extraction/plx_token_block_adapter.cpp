#include "plx_token_block_adapter.h"
#include <algorithm>
#include <iostream>
#include <limits>

namespace plx::extraction {

  plxv_map synthetic_block::to_map() const
  {
    plxv_map m;
    m["bbox"] = bbox.to_variant();
    m["text"] = text;
    m["name"] = name_value;
    m["number"] = number_value ? plx_variant(*number_value) : plx_variant();
    m["confidence"] = confidence;
    plxv_vector sources;
    for (const auto& s : source_tokens)
    {
      sources.push_back(s);
    }
    m["source_tokens"] = sources;
    return m;
  }

  double adapter_metrics::rooms_with_number_ratio() const
  {
    if (blocks_created == 0)
    {
      return 0.0;
    }
    return static_cast<double>(paired_with_number) / static_cast<double>(blocks_created);
  }

  plxv_map adapter_metrics::to_map() const
  {
    plxv_map m;
    m["tokens_input"] = static_cast<long long>(tokens_input);
    m["room_name_tokens"] = static_cast<long long>(name_tokens);
    m["room_number_tokens"] = static_cast<long long>(number_tokens);
    m["blocks_created"] = static_cast<long long>(blocks_created);
    m["paired_with_number"] = static_cast<long long>(paired_with_number);
    m["name_only_no_number"] = static_cast<long long>(name_only_no_number);
    m["rooms_with_number_ratio"] = rooms_with_number_ratio();
    m["excluded_by_rule"] = static_cast<long long>(excluded_by_rule);
    plxv_map reasons;
    for (const auto& entry : excluded_reasons)
    {
      reasons[entry.first] = static_cast<long long>(entry.second);
    }
    m["excluded_reasons"] = reasons;
    return m;
  }

  token_block_adapter::token_block_adapter(const std::vector<rule_payload>& payloads)
    : has_pairing_(false)
  {
    for (const auto& payload : payloads)
    {
      if (const auto* detector = std::get_if<token_detector>(&payload))
      {
        detectors_.push_back(*detector);
      }
      else if (const auto* exclude = std::get_if<exclude_rule>(&payload))
      {
        excludes_.push_back(*exclude);
      }
    }
    if (const pairing_rule* rule = find_pairing_rule(payloads))
    {
      pairing_ = *rule;
      has_pairing_ = true;
    }
  }

  bool token_block_adapter::is_name_role(const plx_string& role) const
  {
    return role == pairing_.name_role || role.ends_with("_name");
  }

  bool token_block_adapter::role_has_detectors(const plx_string& role) const
  {
    return std::any_of(detectors_.begin(), detectors_.end(),
                       [&role](const token_detector& d) { return d.role == role; });
  }

  std::vector<plx_text_token> token_block_adapter::tokens_for_role(const std::vector<plx_text_token>& tokens,
                                                                   const plx_string& role) const
  {
    std::vector<plx_text_token> matched;
    bool name_role = is_name_role(role);
    for (const auto& token : tokens)
    {
      for (const auto& detector : detectors_)
      {
        if (detector.role != role)
        {
          continue;
        }
        if (detector.matches(token.get_text(), name_role))
        {
          matched.push_back(token);
          break;
        }
      }
    }
    return matched;
  }

  token_roles token_block_adapter::classify(const std::vector<plx_text_token>& tokens, adapter_metrics* metrics) const
  {
    token_roles roles;
    for (const auto& token : tokens_for_role(tokens, pairing_.name_role))
    {
      const exclude_rule* hit = nullptr;
      for (const auto& rule : excludes_)
      {
        if (rule.matches(token.get_text()))
        {
          hit = &rule;
          break;
        }
      }
      if (hit)
      {
        if (metrics)
        {
          metrics->excluded_by_rule++;
          metrics->excluded_reasons[hit->reason]++;
        }
        continue;
      }
      roles.names.push_back(token);
    }
    roles.numbers = tokens_for_role(tokens, pairing_.number_role);

    if (metrics)
    {
      metrics->name_tokens = roles.names.size();
      metrics->number_tokens = roles.numbers.size();
    }
    return roles;
  }

  bool token_block_adapter::satisfies_relation(pair_relation relation, const plx_layout_bounds& name,
                                               const plx_layout_bounds& candidate)
  {
    switch (relation)
    {
      case pair_relation::below: return candidate.get_top() >= name.get_top() - relation_tolerance_px;
      case pair_relation::above: return candidate.get_top() <= name.get_top() + relation_tolerance_px;
      case pair_relation::right: return candidate.get_left() >= name.get_left() - relation_tolerance_px;
      case pair_relation::left: return candidate.get_left() <= name.get_left() + relation_tolerance_px;
    }
    return false;
  }

  std::vector<synthetic_block> token_block_adapter::create_blocks(const std::vector<plx_text_token>& tokens,
                                                                  adapter_metrics* metrics) const
  {
    adapter_metrics local;
    local.tokens_input = tokens.size();
    std::vector<synthetic_block> blocks;

    if (!role_has_detectors(pairing_.name_role) && !role_has_detectors(pairing_.number_role))
    {
      std::cout << "Token adapter: no detectors for '" << pairing_.name_role << "' or '"
                << pairing_.number_role << "', " << tokens.size() << " tokens ignored" << std::endl;
      if (metrics)
      {
        *metrics = local;
      }
      return blocks;
    }

    token_roles roles = classify(tokens, &local);

    std::stable_sort(roles.names.begin(), roles.names.end(), [](const plx_text_token& a, const plx_text_token& b) {
      if (a.get_bbox().x != b.get_bbox().x)
      {
        return a.get_bbox().x < b.get_bbox().x;
      }
      return a.get_bbox().y < b.get_bbox().y;
    });

    std::vector<bool> consumed(roles.numbers.size(), false);
    for (const auto& name : roles.names)
    {
      size_t best = roles.numbers.size();
      double best_distance = std::numeric_limits<double>::infinity();

      for (size_t i = 0; i < roles.numbers.size(); ++i)
      {
        if (consumed[i])
        {
          continue;
        }
        const plx_text_token& number = roles.numbers[i];
        double distance = name.get_bbox().center_distance(number.get_bbox());
        if (distance > pairing_.max_distance_px)
        {
          continue;
        }
        if (!satisfies_relation(pairing_.relation, name.get_bbox(), number.get_bbox()))
        {
          continue;
        }
        if (distance < best_distance)
        {
          best_distance = distance;
          best = i;
        }
      }

      synthetic_block block;
      block.name_value = name.get_text().trim();
      block.source_tokens.push_back(name.get_text());

      if (best < roles.numbers.size())
      {
        const plx_text_token& number = roles.numbers[best];
        consumed[best] = true;
        block.bbox = name.get_bbox().union_with(number.get_bbox());
        block.text = name.get_text() + "\n" + number.get_text();
        block.number_value = number.get_text().trim();
        block.confidence = std::min(name.get_confidence(), number.get_confidence());
        block.source_tokens.push_back(number.get_text());
        block.pair_distance = best_distance;
        local.paired_with_number++;
      }
      else
      {
        block.bbox = name.get_bbox();
        block.text = name.get_text();
        block.confidence = name.get_confidence();
        local.name_only_no_number++;
      }
      blocks.push_back(block);
    }

    local.blocks_created = blocks.size();
    std::cout << "Token adapter: " << local.name_tokens << " names, " << local.number_tokens << " numbers, "
              << local.paired_with_number << " paired, " << local.name_only_no_number << " name-only, "
              << local.excluded_by_rule << " excluded" << std::endl;

    if (metrics)
    {
      *metrics = local;
    }
    return blocks;
  }

  std::vector<synthetic_block> create_blocks(const std::vector<plx_text_token>& tokens,
                                             const std::vector<rule_payload>& payloads,
                                             adapter_metrics* metrics)
  {
    return token_block_adapter(payloads).create_blocks(tokens, metrics);
  }

} // namespace plx::extraction
