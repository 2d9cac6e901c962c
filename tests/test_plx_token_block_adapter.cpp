#include <catch2/catch_all.hpp>
#include "plx_test_helpers.h"
#include "../extraction/plx_token_block_adapter.h"

using namespace plx::extraction;

SCENARIO("Name and number tokens are paired into synthetic blocks", "[adapter][pairing][unit]") {
    GIVEN("A name with a number 30px below it") {
        std::vector<plx_text_token> tokens = {
            make_token("BUREAU", 100, 100, 50, 20),
            make_token("104", 100, 130, 30, 20),
        };

        WHEN("The pairing allows 200px") {
            adapter_metrics metrics;
            std::vector<synthetic_block> blocks = create_blocks(tokens, room_rules(200), &metrics);

            THEN("One paired block covers both tokens") {
                REQUIRE(blocks.size() == 1);
                REQUIRE(blocks[0].is_paired());
                REQUIRE(blocks[0].name_value == "BUREAU");
                REQUIRE(*blocks[0].number_value == "104");
                REQUIRE(blocks[0].bbox == plx_layout_bounds(100, 100, 50, 50));
                REQUIRE(blocks[0].pair_distance == Catch::Approx(31.62).epsilon(0.01));
                REQUIRE(blocks[0].text == "BUREAU\n104");
                REQUIRE(metrics.paired_with_number == 1);
                REQUIRE(metrics.rooms_with_number_ratio() == Catch::Approx(1.0));
            }
        }

        WHEN("The pairing allows only 10px") {
            adapter_metrics metrics;
            std::vector<synthetic_block> blocks = create_blocks(tokens, room_rules(10), &metrics);

            THEN("The name stands alone and the number forms no block") {
                REQUIRE(blocks.size() == 1);
                REQUIRE_FALSE(blocks[0].is_paired());
                REQUIRE(blocks[0].bbox == plx_layout_bounds(100, 100, 50, 20));
                REQUIRE(metrics.name_only_no_number == 1);
                REQUIRE(metrics.number_tokens == 1);
            }
        }
    }

    GIVEN("The CLASSE 203 label") {
        std::vector<plx_text_token> tokens = {
            make_token("CLASSE", 100, 80, 60, 20),
            make_token("203", 100, 110, 40, 20),
        };

        THEN("One block with confidence 1.0 is produced") {
            std::vector<synthetic_block> blocks = create_blocks(tokens, room_rules(200));
            REQUIRE(blocks.size() == 1);
            REQUIRE(blocks[0].name_value == "CLASSE");
            REQUIRE(blocks[0].number_value == plx_string("203"));
            REQUIRE(blocks[0].confidence == Catch::Approx(1.0));
        }

        THEN("Creating the blocks twice gives identical results") {
            std::vector<synthetic_block> a = create_blocks(tokens, room_rules(200));
            std::vector<synthetic_block> b = create_blocks(tokens, room_rules(200));
            REQUIRE(a.size() == b.size());
            REQUIRE(a[0].bbox == b[0].bbox);
            REQUIRE(a[0].text == b[0].text);
        }
    }

    GIVEN("Two names competing for one number") {
        std::vector<plx_text_token> tokens = {
            make_token("HALL", 300, 100, 50, 20),
            make_token("SALON", 100, 100, 50, 20, 0.7),
            make_token("12", 200, 130, 30, 20, 0.9),
        };

        THEN("The leftmost name takes it and the other stays unpaired") {
            std::vector<synthetic_block> blocks = create_blocks(tokens, room_rules(200));
            REQUIRE(blocks.size() == 2);
            REQUIRE(blocks[0].name_value == "SALON");
            REQUIRE(blocks[0].number_value == plx_string("12"));
            REQUIRE(blocks[0].confidence == Catch::Approx(0.7));
            REQUIRE(blocks[1].name_value == "HALL");
            REQUIRE_FALSE(blocks[1].is_paired());
        }
    }

    GIVEN("A number far above the name and a relation of below") {
        std::vector<plx_text_token> tokens = {
            make_token("CUISINE", 100, 200, 60, 20),
            make_token("21", 100, 100, 30, 20),
        };

        THEN("The relation predicate rejects the candidate") {
            std::vector<synthetic_block> blocks = create_blocks(tokens, room_rules(200));
            REQUIRE(blocks.size() == 1);
            REQUIRE_FALSE(blocks[0].is_paired());
        }
    }

    GIVEN("Exclude rules over name candidates") {
        std::vector<rule_payload> rules = room_rules(200);
        rules.push_back(exclude("NIVEAU|COUPE", "drawing_annotation"));
        std::vector<plx_text_token> tokens = {
            make_token("NIVEAU", 10, 10, 60, 20),
            make_token("COUPE", 400, 10, 60, 20),
            make_token("CHAMBRE", 100, 100, 60, 20),
            make_token("31", 100, 130, 30, 20),
        };

        THEN("Excluded names produce no blocks and are counted by reason") {
            adapter_metrics metrics;
            std::vector<synthetic_block> blocks = create_blocks(tokens, rules, &metrics);
            REQUIRE(blocks.size() == 1);
            REQUIRE(blocks[0].name_value == "CHAMBRE");
            REQUIRE(metrics.excluded_by_rule == 2);
            REQUIRE(metrics.excluded_reasons["drawing_annotation"] == 2);
            REQUIRE(metrics.to_map()["room_name_tokens"].int_value() == 1);
        }
    }

    GIVEN("No detector payloads") {
        std::vector<plx_text_token> tokens = {make_token("CLASSE", 100, 80, 60, 20)};
        std::vector<rule_payload> rules = {pairing("below", 200)};

        THEN("No blocks are produced") {
            adapter_metrics metrics;
            REQUIRE(create_blocks(tokens, rules, &metrics).empty());
            REQUIRE(metrics.tokens_input == 1);
            REQUIRE(metrics.blocks_created == 0);
        }
    }
}

SCENARIO("Relation predicates allow 50px of slack", "[adapter][unit]") {
    GIVEN("A name box at (100, 100)") {
        plx_layout_bounds name(100, 100, 50, 20);

        THEN("below accepts candidates whose top is at most 50px higher") {
            REQUIRE(token_block_adapter::satisfies_relation(pair_relation::below, name, plx_layout_bounds(100, 50, 10, 10)));
            REQUIRE_FALSE(token_block_adapter::satisfies_relation(pair_relation::below, name, plx_layout_bounds(100, 49, 10, 10)));
        }

        THEN("above accepts candidates whose top is at most 50px lower") {
            REQUIRE(token_block_adapter::satisfies_relation(pair_relation::above, name, plx_layout_bounds(100, 150, 10, 10)));
            REQUIRE_FALSE(token_block_adapter::satisfies_relation(pair_relation::above, name, plx_layout_bounds(100, 151, 10, 10)));
        }

        THEN("right and left compare left edges") {
            REQUIRE(token_block_adapter::satisfies_relation(pair_relation::right, name, plx_layout_bounds(50, 100, 10, 10)));
            REQUIRE_FALSE(token_block_adapter::satisfies_relation(pair_relation::right, name, plx_layout_bounds(49, 100, 10, 10)));
            REQUIRE(token_block_adapter::satisfies_relation(pair_relation::left, name, plx_layout_bounds(150, 100, 10, 10)));
            REQUIRE_FALSE(token_block_adapter::satisfies_relation(pair_relation::left, name, plx_layout_bounds(151, 100, 10, 10)));
        }
    }
}
