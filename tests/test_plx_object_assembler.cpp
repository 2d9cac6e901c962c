#include <catch2/catch_all.hpp>
#include "plx_test_helpers.h"
#include "../extraction/plx_object_assembler.h"

using namespace plx::extraction;

namespace {

    synthetic_block make_block(const plx_string& name, const plx_string& number, plx_layout_bounds bbox,
                               double confidence) {
        synthetic_block block;
        block.name_value = name;
        block.bbox = bbox;
        block.confidence = confidence;
        if (number.empty()) {
            block.text = name;
        } else {
            block.number_value = number;
            block.text = name + "\n" + number;
        }
        return block;
    }

    page_assembly_input make_input(const std::vector<synthetic_block>& blocks, bool has_pairing_rule) {
        page_assembly_input input;
        input.project_id = "proj-a";
        input.page_id = "page-1";
        input.blocks = blocks;
        input.has_pairing_rule = has_pairing_rule;
        return input;
    }

} // namespace

SCENARIO("Rooms are assembled from synthetic blocks", "[assembler][unit]") {
    GIVEN("A paired block and a name-only block under a pairing rule") {
        page_assembly_input input = make_input({make_block("CLASSE", "203", plx_layout_bounds(100, 80, 60, 50), 0.8),
                                                make_block("PREAU", "", plx_layout_bounds(400, 80, 60, 20), 0.9)},
                                               true);

        WHEN("Assembling conservatively") {
            assembly_metrics metrics;
            std::vector<extracted_object> objects = object_assembler().assemble(input, &metrics);

            THEN("Only the paired room is emitted and the drop is counted") {
                REQUIRE(objects.size() == 1);
                const extracted_object& room = objects[0];
                REQUIRE(room.type == object_type::room);
                REQUIRE(room.label == "CLASSE 203");
                REQUIRE(room.project_id == "proj-a");
                REQUIRE(room.room()->room_number == plx_string("203"));
                REQUIRE(room.room()->room_name == plx_string("CLASSE"));
                REQUIRE(room.confidence == Catch::Approx(0.9));
                REQUIRE(room.id == generate_room_id("page-1", "CLASSE 203", room.bbox, "203"));
                REQUIRE(room.has_provenance("spatial_labeling"));
                REQUIRE_FALSE(room.pdf_rect.has_value());

                REQUIRE(metrics.dropped_name_only == 1);
                REQUIRE(metrics.drop_reasons["name_only_with_pairing_rule"] == 1);
                REQUIRE(metrics.rooms_emitted == 1);
            }
        }

        WHEN("Assembling under the relaxed policy") {
            std::vector<extracted_object> strict = object_assembler().assemble(input);
            std::vector<extracted_object> relaxed = object_assembler(extraction_policy::relaxed).assemble(input);

            THEN("The same rooms carry the provisional tags") {
                REQUIRE(relaxed.size() == strict.size());
                REQUIRE(relaxed[0].id == strict[0].id);
                REQUIRE(relaxed[0].has_provenance("extraction_policy:relaxed"));
                REQUIRE(relaxed[0].has_provenance("guide_source:provisional"));
                REQUIRE_FALSE(strict[0].has_provenance("extraction_policy:relaxed"));
            }
        }
    }

    GIVEN("A name-only block without a pairing rule") {
        page_assembly_input input = make_input({make_block("PREAU", "", plx_layout_bounds(400, 80, 60, 20), 0.9)}, false);

        THEN("It becomes a room without a number or bonus") {
            std::vector<extracted_object> objects = object_assembler().assemble(input);
            REQUIRE(objects.size() == 1);
            REQUIRE(objects[0].label == "PREAU");
            REQUIRE_FALSE(objects[0].room()->room_number.has_value());
            REQUIRE(objects[0].confidence == Catch::Approx(0.9));
        }
    }

    GIVEN("A paired block that is already highly confident") {
        page_assembly_input input = make_input({make_block("HALL", "01", plx_layout_bounds(0, 0, 40, 40), 0.95)}, true);

        THEN("The pairing bonus is capped at 1.0") {
            std::vector<extracted_object> objects = object_assembler().assemble(input);
            REQUIRE(objects[0].confidence == Catch::Approx(1.0));
            REQUIRE(objects[0].get_confidence_level() == confidence_level::high);
        }
    }

    GIVEN("A page transform") {
        plx_raster_spec raster;
        raster.width_px = 1000;
        raster.height_px = 500;
        plx_page_transform transform = plx_page_transform::for_page(500.0, 500.0, raster);

        page_assembly_input input = make_input({make_block("BUREAU", "12", plx_layout_bounds(100, 100, 50, 50), 1.0)}, true);
        input.transform = &transform;

        THEN("Rooms carry their rectangle in PDF points") {
            std::vector<extracted_object> objects = object_assembler().assemble(input);
            REQUIRE(objects[0].pdf_rect.has_value());
            const std::vector<double>& rect = *objects[0].pdf_rect;
            REQUIRE(rect[0] == Catch::Approx(50.0));
            REQUIRE(rect[1] == Catch::Approx(350.0));
            REQUIRE(rect[2] == Catch::Approx(75.0));
            REQUIRE(rect[3] == Catch::Approx(400.0));
        }
    }
}

SCENARIO("Doors are assembled from door number tokens", "[assembler][doors][unit]") {
    GIVEN("Two identical door tokens and a distinct one") {
        page_assembly_input input = make_input({}, true);
        input.door_tokens = {make_token("P01", 300, 300, 30, 15, 0.9), make_token("P01", 300, 300, 30, 15, 0.9),
                             make_token("P02", 600, 300, 30, 15, 0.9)};

        THEN("The duplicate id is dropped and counted") {
            assembly_metrics metrics;
            std::vector<extracted_object> objects = object_assembler().assemble(input, &metrics);
            REQUIRE(objects.size() == 2);
            REQUIRE(objects[0].type == object_type::door);
            REQUIRE(objects[0].door()->door_number == plx_string("P01"));
            REQUIRE(objects[0].door()->kind == door_kind::unknown);
            REQUIRE(objects[0].id.starts_with("door_"));
            REQUIRE(metrics.doors_emitted == 2);
            REQUIRE(metrics.drop_reasons["duplicate_door_id"] == 1);
        }
    }

    GIVEN("A low-confidence room next to a door and a confident room next to another") {
        page_assembly_input input = make_input({make_block("DEGT", "07", plx_layout_bounds(100, 100, 50, 50), 0.3),
                                                make_block("SALLE", "08", plx_layout_bounds(600, 100, 50, 50), 0.9)},
                                               true);
        input.door_tokens = {make_token("P07", 130, 130, 20, 10), make_token("P08", 630, 130, 20, 10)};

        THEN("Only the low-confidence room is flagged as ambiguous") {
            assembly_metrics metrics;
            std::vector<extracted_object> objects = object_assembler().assemble(input, &metrics);
            REQUIRE(objects.size() == 4);
            REQUIRE(objects[0].room()->ambiguity);
            REQUIRE(objects[0].room()->ambiguity_reason == "Low confidence block near door symbol");
            REQUIRE_FALSE(objects[1].room()->ambiguity);
            REQUIRE(metrics.ambiguous_rooms == 1);
        }
    }
}

SCENARIO("Extracted objects survive their map form", "[assembler][objects][unit]") {
    GIVEN("An assembled room") {
        plx_raster_spec raster;
        plx_page_transform transform = plx_page_transform::for_page(595.0, 842.0, raster);
        page_assembly_input input = make_input({make_block("CLASSE", "203", plx_layout_bounds(100, 80, 60, 50), 1.0)}, true);
        input.transform = &transform;
        extracted_object room = object_assembler().assemble(input)[0];

        WHEN("Written to a map and read back") {
            plxv_map m = room.to_map();
            extracted_object restored;
            REQUIRE(extracted_object::from_map(m, restored));

            THEN("The identity and room fields are kept") {
                REQUIRE(m["confidence_level"].string_value() == "high");
                REQUIRE(m["type"].string_value() == "room");
                REQUIRE(restored.id == room.id);
                REQUIRE(restored.bbox == room.bbox);
                REQUIRE(restored.room()->room_number == plx_string("203"));
                REQUIRE(restored.provenance == room.provenance);
                REQUIRE(restored.pdf_rect.has_value());
            }
        }

        THEN("A map without an id is rejected") {
            plxv_map m = room.to_map();
            m.erase("id");
            extracted_object restored;
            REQUIRE_FALSE(extracted_object::from_map(m, restored));
        }
    }
}
