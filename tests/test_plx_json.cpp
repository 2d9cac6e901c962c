#include <catch2/catch_all.hpp>
#include "../api/json/plx_json.h"

SCENARIO("plx_json reads and writes documents", "[json][unit]") {
    GIVEN("A rules document") {
        plx_string text = R"({"payloads": [{"kind": "pairing", "max_distance_px": 150, "ratio": 0.5, "strict": true, "note": null}]})";

        WHEN("Parsing it into a map") {
            plxv_map doc;
            plx_json json(&doc);
            bool ok = json.parse(text);

            THEN("Types are kept") {
                REQUIRE(ok);
                const plxv_vector& payloads = doc["payloads"].vector_value();
                REQUIRE(payloads.size() == 1);
                const plxv_map& p = payloads[0].map_value();
                REQUIRE(p.at("kind").string_value() == "pairing");
                REQUIRE(p.at("max_distance_px").is_int());
                REQUIRE(p.at("max_distance_px").int_value() == 150);
                REQUIRE(p.at("ratio").is_double());
                REQUIRE(p.at("strict").bool_value());
                REQUIRE(p.at("note").is_null());
            }

            AND_WHEN("Serializing it again") {
                plx_string out = json.create();
                plx_variant reparsed;

                THEN("The same content comes back") {
                    REQUIRE(plx_json::parse_value(out, reparsed));
                    REQUIRE(reparsed == plx_variant(doc));
                }
            }
        }
    }

    GIVEN("Invalid input") {
        plxv_map doc;
        plx_json json(&doc);

        THEN("Syntax errors and non-object documents are rejected") {
            REQUIRE_FALSE(json.parse("{not json"));
            REQUIRE_FALSE(json.parse("[1, 2]"));

            plx_variant value;
            REQUIRE(plx_json::parse_value("[1, 2]", value));
            REQUIRE(value.is_vector());
        }
    }

    GIVEN("A map with nested values") {
        plxv_map m;
        m["id"] = "room_0011223344556677";
        m["bbox"] = plxv_vector{plx_variant(100), plx_variant(80), plx_variant(60), plx_variant(50)};

        THEN("Compact output is stable") {
            REQUIRE(plx_json::dump(m) == R"({"bbox":[100,80,60,50],"id":"room_0011223344556677"})");
        }
    }
}
