#include "plx_object_assembler.h"
#include "plx_id_generator.h"
#include <algorithm>
#include <iostream>
#include <set>

namespace plx::extraction {

  plx_string policy_to_string(extraction_policy policy)
  {
    return policy == extraction_policy::relaxed ? "relaxed" : "conservative";
  }

  bool policy_from_string(const plx_string& text, extraction_policy& out)
  {
    plx_string t = text.trim().lower();
    if (t == "conservative") out = extraction_policy::conservative;
    else if (t == "relaxed") out = extraction_policy::relaxed;
    else return false;
    return true;
  }

  plxv_map assembly_metrics::to_map() const
  {
    plxv_map m;
    m["blocks_input"] = static_cast<long long>(blocks_input);
    m["rooms_emitted"] = static_cast<long long>(rooms_emitted);
    m["doors_emitted"] = static_cast<long long>(doors_emitted);
    m["dropped_name_only"] = static_cast<long long>(dropped_name_only);
    m["ambiguous_rooms"] = static_cast<long long>(ambiguous_rooms);
    plxv_map reasons;
    for (const auto& entry : drop_reasons)
    {
      reasons[entry.first] = static_cast<long long>(entry.second);
    }
    m["drop_reasons"] = reasons;
    return m;
  }

  object_assembler::object_assembler(extraction_policy policy) : policy_(policy) {}

  void object_assembler::add_policy_tags(std::vector<plx_string>& provenance) const
  {
    if (policy_ == extraction_policy::relaxed)
    {
      provenance.push_back("extraction_policy:relaxed");
      provenance.push_back("guide_source:provisional");
    }
  }

  std::vector<extracted_object> object_assembler::rooms_from_blocks(const page_assembly_input& input,
                                                                    assembly_metrics& metrics) const
  {
    std::vector<extracted_object> rooms;
    for (const auto& block : input.blocks)
    {
      if (!block.is_paired() && input.has_pairing_rule)
      {
        metrics.dropped_name_only++;
        metrics.drop_reasons["name_only_with_pairing_rule"]++;
        continue;
      }

      extracted_object room;
      room.project_id = input.project_id;
      room.page_id = input.page_id;
      room.type = object_type::room;
      room.bbox = block.bbox;

      room_details details;
      details.room_name = block.name_value;
      details.label_bbox = block.bbox;
      if (block.is_paired())
      {
        details.room_number = *block.number_value;
        room.label = block.name_value + " " + *block.number_value;
        room.confidence = std::min(1.0, block.confidence + pairing_bonus);
      }
      else
      {
        room.label = block.name_value;
        room.confidence = block.confidence;
      }
      room.details = details;
      room.id = generate_room_id(input.page_id, room.label, room.bbox,
                                 details.room_number ? *details.room_number : plx_string());

      room.provenance = {"text_detected", "spatial_labeling", "guide_payload"};
      add_policy_tags(room.provenance);
      if (input.transform && input.transform->valid())
      {
        room.pdf_rect = input.transform->pixels_to_pdf_rect(room.bbox);
      }
      rooms.push_back(room);
    }
    return rooms;
  }

  std::vector<extracted_object> object_assembler::doors_from_tokens(const page_assembly_input& input,
                                                                    assembly_metrics& metrics) const
  {
    std::vector<extracted_object> doors;
    std::set<plx_string> seen;
    for (const auto& token : input.door_tokens)
    {
      plx_string number = token.get_text().trim();

      extracted_object door;
      door.project_id = input.project_id;
      door.page_id = input.page_id;
      door.type = object_type::door;
      door.label = number;
      door.bbox = token.get_bbox();
      door.confidence = token.get_confidence();

      door_details details;
      details.door_number = number;
      details.kind = door_kind::unknown;
      door.details = details;
      door.id = generate_door_id(input.page_id, door.label, door.bbox, number);

      if (!seen.insert(door.id).second)
      {
        std::cerr << "Warning: Duplicate door id " << door.id << " for '" << number << "' on page "
                  << input.page_id << ", keeping first" << std::endl;
        metrics.drop_reasons["duplicate_door_id"]++;
        continue;
      }

      door.provenance = {"text_detected", "guide_payload"};
      add_policy_tags(door.provenance);
      if (input.transform && input.transform->valid())
      {
        door.pdf_rect = input.transform->pixels_to_pdf_rect(door.bbox);
      }
      doors.push_back(door);
    }
    return doors;
  }

  size_t object_assembler::flag_door_ambiguity(std::vector<extracted_object>& rooms,
                                               const std::vector<extracted_object>& doors)
  {
    size_t flagged = 0;
    for (auto& room : rooms)
    {
      if (room.get_confidence_level() != confidence_level::low)
      {
        continue;
      }
      auto* details = std::get_if<room_details>(&room.details);
      if (!details)
      {
        continue;
      }
      for (const auto& door : doors)
      {
        if (room.bbox.center_distance(door.bbox) < door_proximity_px)
        {
          details->ambiguity = true;
          details->ambiguity_reason = "Low confidence block near door symbol";
          flagged++;
          break;
        }
      }
    }
    return flagged;
  }

  std::vector<extracted_object> object_assembler::assemble(const page_assembly_input& input,
                                                           assembly_metrics* metrics) const
  {
    assembly_metrics local;
    local.blocks_input = input.blocks.size();

    std::vector<extracted_object> rooms = rooms_from_blocks(input, local);
    std::vector<extracted_object> doors = doors_from_tokens(input, local);
    local.ambiguous_rooms = flag_door_ambiguity(rooms, doors);
    local.rooms_emitted = rooms.size();
    local.doors_emitted = doors.size();

    std::cout << "Assembled page " << input.page_id << " (" << policy_to_string(policy_) << "): "
              << local.rooms_emitted << " rooms, " << local.doors_emitted << " doors, "
              << local.dropped_name_only << " name-only dropped" << std::endl;

    std::vector<extracted_object> objects = std::move(rooms);
    objects.insert(objects.end(), doors.begin(), doors.end());

    if (metrics)
    {
      *metrics = local;
    }
    return objects;
  }

} // namespace plx::extraction
