#include "plx_token_summary.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <sstream>

namespace plx::extraction {

  namespace {

    // A-Z plus the French capitals À Â Ä Ç È É Ê Ë Î Ï Ô Ù Û Ü.
    bool is_room_name_letter(uint32_t cp)
    {
      if (cp >= 'A' && cp <= 'Z')
      {
        return true;
      }
      switch (cp)
      {
        case 0xC0: case 0xC2: case 0xC4: case 0xC7:
        case 0xC8: case 0xC9: case 0xCA: case 0xCB:
        case 0xCE: case 0xCF: case 0xD4: case 0xD9:
        case 0xDB: case 0xDC:
          return true;
        default:
          return false;
      }
    }

    // Counts in first-seen order, like an insertion-ordered counter.
    class ordered_counter
    {
      std::vector<std::pair<plx_string, size_t>> entries_;
      std::map<plx_string, size_t> index_;

    public:
      void add(const plx_string& key)
      {
        auto it = index_.find(key);
        if (it == index_.end())
        {
          index_[key] = entries_.size();
          entries_.emplace_back(key, 1);
        }
        else
        {
          entries_[it->second].second++;
        }
      }

      size_t count(const plx_string& key) const
      {
        auto it = index_.find(key);
        return it == index_.end() ? 0 : entries_[it->second].second;
      }

      const std::vector<std::pair<plx_string, size_t>>& entries() const { return entries_; }

      // Highest counts first, first-seen order among equals.
      std::vector<std::pair<plx_string, size_t>> most_common(size_t limit) const
      {
        std::vector<std::pair<plx_string, size_t>> sorted = entries_;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (sorted.size() > limit)
        {
          sorted.resize(limit);
        }
        return sorted;
      }
    };

    std::pair<int, int> integer_center(const plx_layout_bounds& b)
    {
      return {b.x + b.width / 2, b.y + b.height / 2};
    }

    int integer_distance(const plx_layout_bounds& a, const plx_layout_bounds& b)
    {
      auto ca = integer_center(a);
      auto cb = integer_center(b);
      double dx = ca.first - cb.first;
      double dy = ca.second - cb.second;
      return static_cast<int>(std::sqrt(dx * dx + dy * dy));
    }

    plx_string relative_position(const plx_layout_bounds& name, const plx_layout_bounds& number)
    {
      auto cn = integer_center(name);
      auto cm = integer_center(number);
      int dx = cm.first - cn.first;
      int dy = cm.second - cn.second;
      if (std::abs(dy) > std::abs(dx))
      {
        return dy > 0 ? "number_below_name" : "number_above_name";
      }
      return dx > 0 ? "number_right_of_name" : "number_left_of_name";
    }

  } // namespace

  bool looks_like_room_name(const plx_string& text)
  {
    std::vector<uint32_t> cps = text.code_points();
    return cps.size() >= 2 && std::all_of(cps.begin(), cps.end(), is_room_name_letter);
  }

  bool looks_like_room_number(const plx_string& text)
  {
    if (text.size() < 2 || text.size() > 4)
    {
      return false;
    }
    return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
  }

  token_summary summarize_tokens(const std::vector<plx_text_token>& tokens, int max_pairing_distance)
  {
    token_summary summary;
    summary.total_text_blocks = tokens.size();
    if (tokens.empty())
    {
      return summary;
    }

    std::vector<const plx_text_token*> names;
    std::vector<const plx_text_token*> numbers;
    ordered_counter name_counts;
    ordered_counter number_counts;

    for (const auto& token : tokens)
    {
      plx_string text = token.get_text().trim();
      if (looks_like_room_name(text))
      {
        names.push_back(&token);
        name_counts.add(text);
      }
      else if (looks_like_room_number(text))
      {
        numbers.push_back(&token);
        number_counts.add(text);
      }
    }

    for (const auto& entry : name_counts.most_common(20))
    {
      for (const plx_text_token* token : names)
      {
        if (token->get_text().trim() == entry.first)
        {
          summary.name_candidates.push_back({entry.first, entry.second, token->get_bbox()});
          break;
        }
      }
    }

    struct observed_pair
    {
      const plx_text_token* name;
      const plx_text_token* number;
      int distance;
    };
    std::vector<observed_pair> pairs;

    for (const plx_text_token* number : numbers)
    {
      plx_string number_text = number->get_text().trim();
      const plx_text_token* nearest = nullptr;
      int nearest_distance = 0;
      for (const plx_text_token* name : names)
      {
        int d = integer_distance(number->get_bbox(), name->get_bbox());
        if (d <= max_pairing_distance && (!nearest || d < nearest_distance))
        {
          nearest = name;
          nearest_distance = d;
        }
      }

      number_candidate candidate;
      candidate.text = number_text;
      candidate.count = number_counts.count(number_text);
      if (nearest)
      {
        pairs.push_back({nearest, number, nearest_distance});
        candidate.near_name = nearest->get_text().trim();
        candidate.distance_px = nearest_distance;
      }
      summary.number_candidates.push_back(candidate);
    }

    std::stable_sort(summary.number_candidates.begin(), summary.number_candidates.end(),
                     [](const number_candidate& a, const number_candidate& b) {
                       bool a_alone = !a.near_name.has_value();
                       bool b_alone = !b.near_name.has_value();
                       if (a_alone != b_alone)
                       {
                         return !a_alone;
                       }
                       return a.count > b.count;
                     });
    if (summary.number_candidates.size() > 30)
    {
      summary.number_candidates.resize(30);
    }

    for (const auto& entry : number_counts.entries())
    {
      if (entry.second >= high_frequency_threshold)
      {
        summary.high_frequency_numbers.push_back(
          {entry.first, entry.second, entry.first.size() == 2 ? "likely wall/partition code" : "high frequency"});
      }
    }
    std::stable_sort(summary.high_frequency_numbers.begin(), summary.high_frequency_numbers.end(),
                     [](const high_frequency_code& a, const high_frequency_code& b) { return a.count > b.count; });

    if (!pairs.empty())
    {
      ordered_counter positions;
      std::vector<int> distances;
      for (const auto& pair : pairs)
      {
        positions.add(relative_position(pair.name->get_bbox(), pair.number->get_bbox()));
        distances.push_back(pair.distance);
      }

      auto dominant = positions.most_common(1).front();
      double share = static_cast<double>(dominant.second) / static_cast<double>(pairs.size());

      pairing_pattern pattern;
      pattern.observed_relation = dominant.first;
      pattern.confidence = share >= 0.7 ? "high" : (share >= 0.5 ? "medium" : "low");

      std::vector<int> sorted = distances;
      std::sort(sorted.begin(), sorted.end());
      if (sorted.size() > 10)
      {
        pattern.typical_min_px = sorted[sorted.size() / 10];
        pattern.typical_max_px = sorted[9 * sorted.size() / 10];
      }
      else
      {
        pattern.typical_min_px = sorted.front();
        pattern.typical_max_px = sorted.back();
      }

      for (size_t i = 0; i < pairs.size() && i < 10; ++i)
      {
        pattern.sample_pairs.emplace_back(pairs[i].name->get_text().trim(), pairs[i].number->get_text().trim());
      }
      summary.pattern = pattern;
    }

    std::cout << "Token summary: " << tokens.size() << " tokens, " << summary.name_candidates.size()
              << " name candidates, " << summary.number_candidates.size() << " number candidates, "
              << summary.high_frequency_numbers.size() << " high-frequency codes" << std::endl;
    return summary;
  }

  plx_string token_summary::to_prompt_text() const
  {
    std::ostringstream out;
    out << "Total text blocks: " << total_text_blocks << "\n";
    out << "\n";
    out << "Room name candidates (uppercase words 2+ chars):\n";
    for (size_t i = 0; i < name_candidates.size() && i < 10; ++i)
    {
      out << "  - " << name_candidates[i].text << ": " << name_candidates[i].count << " occurrences\n";
    }

    out << "\n";
    out << "Room number candidates (2-4 digit numbers):\n";
    for (size_t i = 0; i < number_candidates.size() && i < 15; ++i)
    {
      const number_candidate& c = number_candidates[i];
      if (c.near_name)
      {
        out << "  - " << c.text << ": near '" << *c.near_name << "' (" << c.distance_px << "px)\n";
      }
      else
      {
        out << "  - " << c.text << ": " << c.count << " occurrences\n";
      }
    }

    if (!high_frequency_numbers.empty())
    {
      out << "\n";
      out << "High-frequency codes (likely noise, consider excluding):\n";
      for (const auto& c : high_frequency_numbers)
      {
        out << "  - '" << c.text << "': " << c.count << " occurrences (" << c.note << ")\n";
      }
    }

    if (pattern)
    {
      out << "\n";
      out << "Pairing pattern detected: " << pattern->observed_relation << "\n";
      out << "  Typical distance: " << pattern->typical_min_px << "-" << pattern->typical_max_px << "px\n";
      out << "  Confidence: " << pattern->confidence << "\n";
      if (!pattern->sample_pairs.empty())
      {
        out << "  Sample pairs:\n";
        for (size_t i = 0; i < pattern->sample_pairs.size() && i < 5; ++i)
        {
          out << "    - " << pattern->sample_pairs[i].first << " + " << pattern->sample_pairs[i].second << "\n";
        }
      }
    }

    std::string text = out.str();
    if (!text.empty() && text.back() == '\n')
    {
      text.pop_back();
    }
    return plx_string(text);
  }

  plxv_map token_summary::to_map() const
  {
    plxv_map m;
    m["total_text_blocks"] = static_cast<long long>(total_text_blocks);

    plxv_vector names;
    for (const auto& c : name_candidates)
    {
      plxv_map entry;
      entry["text"] = c.text;
      entry["count"] = static_cast<long long>(c.count);
      entry["example_bbox"] = c.example_bbox.to_variant();
      names.push_back(entry);
    }
    m["room_name_candidates"] = names;

    plxv_vector numbers;
    for (const auto& c : number_candidates)
    {
      plxv_map entry;
      entry["text"] = c.text;
      entry["count"] = static_cast<long long>(c.count);
      entry["near_name"] = c.near_name ? plx_variant(*c.near_name) : plx_variant();
      entry["distance_px"] = c.near_name ? plx_variant(c.distance_px) : plx_variant();
      numbers.push_back(entry);
    }
    m["room_number_candidates"] = numbers;

    plxv_vector codes;
    for (const auto& c : high_frequency_numbers)
    {
      plxv_map entry;
      entry["text"] = c.text;
      entry["count"] = static_cast<long long>(c.count);
      entry["note"] = c.note;
      codes.push_back(entry);
    }
    m["high_frequency_numbers"] = codes;

    if (pattern)
    {
      plxv_map p;
      p["observed_relation"] = pattern->observed_relation;
      p["typical_distance_px"] = plxv_vector{plx_variant(pattern->typical_min_px), plx_variant(pattern->typical_max_px)};
      p["confidence"] = pattern->confidence;
      plxv_vector samples;
      for (const auto& s : pattern->sample_pairs)
      {
        samples.push_back(plxv_vector{plx_variant(s.first), plx_variant(s.second)});
      }
      p["sample_pairs"] = samples;
      m["pairing_pattern"] = p;
    }
    else
    {
      m["pairing_pattern"] = plx_variant();
    }
    return m;
  }

} // namespace plx::extraction
