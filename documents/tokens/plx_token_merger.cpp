#include "plx_token_merger.h"
#include <algorithm>
#include <stdexcept>

plxv_map plx_merge_report::to_map() const
{
  plxv_map m;
  m["input_tokens"] = static_cast<long long>(input_tokens);
  m["kept_tokens"] = static_cast<long long>(kept_tokens);
  m["duplicates_removed"] = static_cast<long long>(duplicates_removed);
  plxv_map by_source;
  for (const auto& entry : kept_by_source)
  {
    by_source[entry.first] = static_cast<long long>(entry.second);
  }
  m["kept_by_source"] = by_source;
  return m;
}

plx_token_merger::plx_token_merger(double iou_threshold) : iou_threshold_(iou_threshold)
{
  if (iou_threshold_ <= 0.0 || iou_threshold_ >= 1.0)
  {
    throw std::invalid_argument("IoU threshold must be in (0, 1)");
  }
}

bool plx_token_merger::texts_similar(const plx_string& a, const plx_string& b)
{
  plx_string ua = a.trim().upper();
  plx_string ub = b.trim().upper();
  if (ua.empty() || ub.empty())
  {
    return ua == ub;
  }
  return ua == ub || ua.contains(ub) || ub.contains(ua);
}

std::vector<plx_text_token> plx_token_merger::merge(const std::vector<plx_text_token>& tokens,
                                                    plx_merge_report* report) const
{
  std::vector<const plx_text_token*> ordered;
  ordered.reserve(tokens.size());
  for (const auto& token : tokens)
  {
    ordered.push_back(&token);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const plx_text_token* a, const plx_text_token* b) {
    return token_source_priority(a->get_source()) < token_source_priority(b->get_source());
  });

  std::vector<plx_text_token> kept;
  size_t duplicates = 0;
  for (const plx_text_token* candidate : ordered)
  {
    bool duplicate = false;
    for (const auto& existing : kept)
    {
      if (candidate->get_bbox().iou(existing.get_bbox()) > iou_threshold_ &&
          texts_similar(candidate->get_text(), existing.get_text()))
      {
        duplicate = true;
        break;
      }
    }
    if (duplicate)
    {
      ++duplicates;
      continue;
    }
    kept.push_back(*candidate);
  }

  if (report)
  {
    report->input_tokens = tokens.size();
    report->kept_tokens = kept.size();
    report->duplicates_removed = duplicates;
    report->kept_by_source.clear();
    for (const auto& token : kept)
    {
      report->kept_by_source[token_source_to_string(token.get_source())]++;
    }
  }
  return kept;
}
