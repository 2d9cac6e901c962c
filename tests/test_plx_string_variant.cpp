#include <catch2/catch_all.hpp>
#include "../utils/plx_variant.h"
#include "../utils/plx_config.h"
#include "../utils/plx_env.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>

SCENARIO("plx_string normalizes printed labels", "[utils][unit]") {
    GIVEN("A label with padding, punctuation and mixed case") {
        plx_string label("  Salle   de-classe, 203 ");

        WHEN("Trimming and collapsing whitespace") {
            THEN("Only single inner spaces remain") {
                REQUIRE(label.trim() == "Salle   de-classe, 203");
                REQUIRE(label.normalize_whitespace() == "Salle de-classe, 203");
            }
        }

        WHEN("Stripping punctuation") {
            THEN("Letters, digits and spaces survive") {
                REQUIRE(label.strip_punctuation().normalize_whitespace() == "Salle declasse 203");
            }
        }
    }

    GIVEN("Accented uppercase text encoded as UTF-8") {
        plx_string word("DÉGAGEMENT");

        THEN("It counts as alphabetic and uppercase") {
            REQUIRE(word.is_alpha());
            REQUIRE(word.is_upper());
            REQUIRE_FALSE(plx_string("Classe").is_upper());
            REQUIRE_FALSE(plx_string("B12").is_alpha());
        }

        THEN("Length and case follow characters") {
            REQUIRE(word.size() == 11);
            REQUIRE(word.char_count() == 10);
            REQUIRE_FALSE(plx_string("DÉGAGEMENè").is_upper());
            REQUIRE_FALSE(plx_string("ŒUVRE œ").is_upper());
            REQUIRE(plx_string("ÉCOLE").code_points().size() == 5);
        }
    }

    GIVEN("Bytes that are not valid UTF-8") {
        plx_string broken(std::string("AB\xC3"));

        THEN("They are neither alphabetic nor uppercase") {
            REQUIRE(broken.char_count() == 3);
            REQUIRE(broken.code_points().empty());
            REQUIRE_FALSE(broken.is_alpha());
            REQUIRE_FALSE(broken.is_upper());
        }
    }

    GIVEN("Numeric strings") {
        THEN("Integer checks require a full parse") {
            REQUIRE(plx_string("203").is_integer());
            REQUIRE(plx_string("-7").is_integer());
            REQUIRE_FALSE(plx_string("20A").is_integer());
            REQUIRE(plx_string("20A").to_int(-1) == -1);
            REQUIRE(plx_string("0.75").is_number());
            REQUIRE_FALSE(plx_string("0.75x").is_number());
        }
    }

    GIVEN("A delimited list") {
        plx_string list("a|b||c");

        THEN("Split keeps empty parts and join restores the text") {
            std::vector<plx_string> parts = list.split("|");
            REQUIRE(parts.size() == 4);
            REQUIRE(parts[2].empty());
            REQUIRE(plx_string("|").join(parts) == list);
        }
    }
}

SCENARIO("plx_variant holds and converts loosely typed values", "[utils][unit]") {
    GIVEN("Variants of each scalar type") {
        plx_variant s("42");
        plx_variant i(7);
        plx_variant d(0.5);
        plx_variant b(true);
        plx_variant n;

        THEN("Type checks report the stored state") {
            REQUIRE(s.is_string());
            REQUIRE(i.is_int());
            REQUIRE(d.is_double());
            REQUIRE(b.is_bool());
            REQUIRE(n.is_null());
            REQUIRE(i.is_number());
            REQUIRE(d.is_number());
        }

        WHEN("Converting a numeric string") {
            THEN("Int and double conversions are offered") {
                REQUIRE(s.converts_to(plx_variant::int_state));
                REQUIRE(s.convert(plx_variant::int_state).int_value() == 42);
                REQUIRE(s.convert(plx_variant::double_state).double_value() == Catch::Approx(42.0));
                REQUIRE_FALSE(plx_variant("abc").converts_to(plx_variant::int_state));
            }
        }

        WHEN("Comparing numbers of different storage") {
            THEN("An int equals the same double") {
                REQUIRE(plx_variant(2) == plx_variant(2.0));
                REQUIRE(plx_variant(2) != plx_variant("2"));
            }
        }

        WHEN("Reading a number with a default") {
            THEN("Non-numbers fall back to the default") {
                REQUIRE(i.number_value() == Catch::Approx(7.0));
                REQUIRE(s.number_value(-1.0) == Catch::Approx(-1.0));
            }
        }
    }

    GIVEN("A nested map") {
        plxv_map inner;
        inner["x"] = 10;
        plxv_map outer;
        outer["bbox"] = plxv_vector{plx_variant(1), plx_variant(2)};
        outer["inner"] = inner;

        WHEN("Copying and moving it") {
            plx_variant original(outer);
            plx_variant copy = original;
            plx_variant moved = std::move(copy);

            THEN("Content is preserved") {
                REQUIRE(moved.is_map());
                REQUIRE(moved.map_value().at("inner").map_value().at("x").int_value() == 10);
                REQUIRE(moved.map_value().at("bbox").vector_value().size() == 2);
                REQUIRE(moved == original);
            }
        }
    }
}

SCENARIO("Runtime settings come from the environment", "[utils][config][unit]") {
    GIVEN("A .env file with planlex settings") {
        std::filesystem::path env_path = std::filesystem::temp_directory_path() / "planlex_test.env";
        {
            std::ofstream out(env_path);
            out << "# planlex settings\n";
            out << "PLX_DEFAULT_DPI=300\n";
            out << "PLX_MAX_PARALLEL_PAGES = 2\n";
            out << "PLX_USE_VISION=\"false\"\n";
            out << "PLX_MERGE_IOU=1.5\n";
        }

        WHEN("Loading it and reading the config") {
            REQUIRE(load_env_file(plx_string(env_path.string())));
            plx_config config = plx_config::from_env();

            THEN("Valid values are applied and invalid ones keep defaults") {
                REQUIRE(config.default_dpi == Catch::Approx(300.0));
                REQUIRE(config.max_parallel_pages == 2);
                REQUIRE_FALSE(config.use_vision);
                REQUIRE(config.merge_iou_threshold == Catch::Approx(0.5));
            }
        }

        unsetenv("PLX_DEFAULT_DPI");
        unsetenv("PLX_MAX_PARALLEL_PAGES");
        unsetenv("PLX_USE_VISION");
        unsetenv("PLX_MERGE_IOU");
        std::filesystem::remove(env_path);
    }

    GIVEN("A missing .env file") {
        THEN("Loading reports failure") {
            REQUIRE_FALSE(load_env_file("/nonexistent/planlex/.env"));
        }
    }
}
