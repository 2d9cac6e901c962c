#include <catch2/catch_all.hpp>
#include "../extraction/plx_id_generator.h"
#include <cctype>

using namespace plx::extraction;

SCENARIO("Object identifiers are deterministic", "[ids][unit]") {
    GIVEN("A room label and its box") {
        plx_layout_bounds bbox(100, 80, 60, 50);

        THEN("The same inputs give the same id") {
            plx_string a = generate_room_id("page-1", "CLASSE 203", bbox, "203");
            plx_string b = generate_room_id("page-1", "CLASSE 203", bbox, "203");
            REQUIRE(a == b);
        }

        THEN("The id is the type followed by 16 lowercase hex digits") {
            plx_string id = generate_room_id("page-1", "CLASSE 203", bbox, "203");
            REQUIRE(id.starts_with("room_"));
            REQUIRE(id.size() == 5 + 16);
            for (size_t i = 5; i < id.size(); ++i) {
                char c = id.to_std_const()[i];
                REQUIRE((std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'f')));
            }
            REQUIRE(generate_door_id("page-1", "P01", bbox).starts_with("door_"));
        }

        THEN("Jitter inside the same buckets keeps the id") {
            REQUIRE(generate_room_id("page-1", "CLASSE 203", bbox, "203") ==
                    generate_room_id("page-1", "CLASSE 203", plx_layout_bounds(102, 83, 60, 50), "203"));
        }

        THEN("Crossing a bucket boundary changes the id") {
            REQUIRE(generate_room_id("page-1", "CLASSE 203", bbox, "203") !=
                    generate_room_id("page-1", "CLASSE 203", plx_layout_bounds(151, 80, 60, 50), "203"));
        }

        THEN("Label, page and qualifier all take part") {
            plx_string base = generate_room_id("page-1", "CLASSE 203", bbox, "203");
            REQUIRE(base != generate_room_id("page-1", "CLASSE 204", bbox, "203"));
            REQUIRE(base != generate_room_id("page-2", "CLASSE 203", bbox, "203"));
            REQUIRE(base != generate_room_id("page-1", "CLASSE 203", bbox, "204"));
            REQUIRE(base != generate_room_id("page-1", "CLASSE 203", bbox));
        }

        THEN("Labels that normalize alike share an id") {
            REQUIRE(generate_room_id("page-1", "Classe  203.", bbox, "203") ==
                    generate_room_id("page-1", " classe 203", bbox, "203"));
        }
    }
}

SCENARIO("Coordinates are floored to the bucket grid", "[ids][unit]") {
    THEN("Positive values floor down") {
        REQUIRE(bucket_coordinate(0) == 0);
        REQUIRE(bucket_coordinate(49) == 0);
        REQUIRE(bucket_coordinate(50) == 50);
        REQUIRE(bucket_coordinate(149) == 100);
    }

    THEN("Negative values floor toward negative infinity") {
        REQUIRE(bucket_coordinate(-1) == -50);
        REQUIRE(bucket_coordinate(-50) == -50);
        REQUIRE(bucket_coordinate(-51) == -100);
    }

    THEN("Corners are bucketed from the box edges") {
        std::array<int, 4> corners = bucket_corners(plx_layout_bounds(100, 80, 60, 50));
        REQUIRE(corners == std::array<int, 4>{100, 50, 150, 100});
    }

    THEN("A non-positive bucket size is rejected") {
        REQUIRE_THROWS_AS(bucket_coordinate(10, 0), std::invalid_argument);
    }
}

SCENARIO("Labels are normalized before hashing", "[ids][unit]") {
    THEN("Case, punctuation and repeated whitespace are removed") {
        REQUIRE(normalize_label("  Salle   203 ") == "salle 203");
        REQUIRE(normalize_label("W.C.") == "wc");
        REQUIRE(normalize_label("") == "");
    }

    THEN("The SHA-256 digest matches the reference vectors") {
        REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
        REQUIRE(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }
}
