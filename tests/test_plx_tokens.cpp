#include <catch2/catch_all.hpp>
#include "plx_test_helpers.h"
#include "../documents/tokens/plx_model_token_provider.h"
#include "../documents/tokens/plx_page_tokens.h"
#include "../documents/tokens/plx_token_merger.h"
#include <limits>

SCENARIO("Text tokens validate their geometry and confidence", "[tokens][unit]") {
    GIVEN("Token construction input") {
        THEN("Valid input is kept as given") {
            plx_text_token token = make_token("CLASSE", 100, 80, 60, 20, 0.9, plx_token_source::model, "p7");
            REQUIRE(token.get_text() == "CLASSE");
            REQUIRE(token.get_bbox() == plx_layout_bounds(100, 80, 60, 20));
            REQUIRE(token.get_source() == plx_token_source::model);
            REQUIRE(token.get_page_id() == "p7");
            REQUIRE(token.to_map().at("source").string_value() == "model");
        }

        THEN("Non-positive sizes and out of range confidence are rejected") {
            REQUIRE_THROWS_AS(make_token("A", 0, 0, 0, 10), std::invalid_argument);
            REQUIRE_THROWS_AS(make_token("A", 0, 0, 10, -1), std::invalid_argument);
            REQUIRE_THROWS_AS(make_token("A", 0, 0, 10, 10, 1.5), std::invalid_argument);
        }
    }
}

SCENARIO("The merger removes duplicate observations by source priority", "[tokens][merger][unit]") {
    GIVEN("The same word seen by the model and in the vector text") {
        std::vector<plx_text_token> tokens = {
            make_token("classe", 102, 80, 60, 20, 0.7, plx_token_source::model),
            make_token("CLASSE", 100, 80, 60, 20, 1.0, plx_token_source::vector),
            make_token("203", 100, 110, 40, 20, 0.8, plx_token_source::model),
        };

        WHEN("Merging") {
            plx_merge_report report;
            std::vector<plx_text_token> kept = plx_token_merger().merge(tokens, &report);

            THEN("Only the vector token of the duplicate pair survives") {
                REQUIRE(kept.size() == 2);
                REQUIRE(kept[0].get_source() == plx_token_source::vector);
                REQUIRE(kept[0].get_text() == "CLASSE");
                REQUIRE(kept[1].get_text() == "203");
                REQUIRE(report.duplicates_removed == 1);
                REQUIRE(report.kept_by_source["vector"] == 1);
                REQUIRE(report.kept_by_source["model"] == 1);
            }
        }
    }

    GIVEN("Overlapping tokens whose texts differ") {
        std::vector<plx_text_token> tokens = {
            make_token("HALL", 0, 0, 60, 20, 1.0, plx_token_source::vector),
            make_token("104", 0, 0, 60, 20, 1.0, plx_token_source::model),
        };

        THEN("Both are kept") {
            REQUIRE(plx_token_merger().merge(tokens).size() == 2);
        }
    }

    GIVEN("A fragment contained in a longer overlapping text") {
        std::vector<plx_text_token> tokens = {
            make_token("SALLE 203", 0, 0, 100, 20, 1.0, plx_token_source::vector),
            make_token("salle", 5, 0, 90, 20, 0.6, plx_token_source::ocr),
        };

        THEN("The containment counts as a duplicate") {
            REQUIRE(plx_token_merger::texts_similar("SALLE 203", " salle "));
            REQUIRE(plx_token_merger().merge(tokens).size() == 1);
        }
    }

    GIVEN("An invalid threshold") {
        THEN("Construction fails") {
            REQUIRE_THROWS_AS(plx_token_merger(1.0), std::invalid_argument);
            REQUIRE_THROWS_AS(plx_token_merger(0.0), std::invalid_argument);
        }
    }
}

SCENARIO("Model tokens come from the text detector", "[tokens][model][unit]") {
    GIVEN("A detector returning valid and invalid blocks") {
        auto store = std::make_shared<mock_page_store>();
        auto detector = std::make_shared<mock_text_detector>();
        detector->detections = {
            {{100, 80, 60, 20}, "CLASSE", 0.9},
            {{100, 110, 40, 20}, " 203 ", 0.8},
            {{1, 2, 3}, "SHORT", 0.9},
            {{10, 10, 0, 5}, "FLAT", 0.9},
            {{10, 10, 5, 5}, "   ", 0.9},
            {{-5, 10, 5, 5}, "NEG", 0.9},
            {{10, 10, 5, 5}, "HIGH", 1.2},
        };
        plx_model_token_provider provider(store, detector);
        plx_page_ref page;
        page.page_id = "p1";

        WHEN("Reading tokens") {
            std::vector<plx_text_token> tokens = provider.get_tokens(page);

            THEN("Only valid blocks become model tokens") {
                REQUIRE(tokens.size() == 2);
                REQUIRE(tokens[1].get_text() == "203");
                REQUIRE(tokens[0].get_source() == plx_token_source::model);
                REQUIRE(tokens[0].get_confidence() == Catch::Approx(0.9));
                REQUIRE(provider.get_detector_calls() == 1);
            }
        }
    }

    GIVEN("A detector returning boxes beyond the pixel range") {
        auto store = std::make_shared<mock_page_store>();
        auto detector = std::make_shared<mock_text_detector>();
        detector->detections = {
            {{1e12, 10, 50, 20}, "CLASSE", 0.9},
            {{2147483600, 10, 500, 20}, "BUREAU", 0.9},
            {{10, 2147483000, 50, 1000}, "HALL", 0.9},
            {{std::numeric_limits<double>::quiet_NaN(), 10, 50, 20}, "NAN", 0.9},
            {{10, 10, std::numeric_limits<double>::infinity(), 20}, "INF", 0.9},
            {{100, 80, 60, 20}, "SALLE", 0.9},
        };
        plx_model_token_provider provider(store, detector);
        plx_page_ref page;
        page.page_id = "p1";

        THEN("Only the box that fits in pixel coordinates is kept") {
            std::vector<plx_text_token> tokens = provider.get_tokens(page);
            REQUIRE(tokens.size() == 1);
            REQUIRE(tokens[0].get_text() == "SALLE");
            REQUIRE(tokens[0].get_bbox().get_right() == 160);
        }
    }

    GIVEN("A failing detector or a missing image") {
        auto store = std::make_shared<mock_page_store>();
        auto detector = std::make_shared<mock_text_detector>();
        plx_model_token_provider provider(store, detector);
        plx_page_ref page;
        page.page_id = "p1";

        THEN("The provider returns no tokens instead of throwing") {
            detector->fail = true;
            REQUIRE(provider.get_tokens(page).empty());

            store->missing = true;
            REQUIRE(provider.get_tokens(page).empty());
            REQUIRE(detector->get_calls() == 1);
        }
    }
}

SCENARIO("Page tokens use the fallback only when vector text is absent", "[tokens][fallback][unit]") {
    GIVEN("A vector source with text and a model fallback") {
        auto vector = std::make_shared<mock_token_provider>(plx_token_source::vector);
        auto store = std::make_shared<mock_page_store>();
        auto detector = std::make_shared<mock_text_detector>();
        detector->detections = {{{10, 10, 40, 20}, "BUREAU", 0.9}};
        auto model = std::make_shared<plx_model_token_provider>(store, detector);

        vector->set_tokens("with-text", {make_token("CLASSE", 100, 80, 60, 20)});
        vector->transform = plx_page_transform::for_page(595.0, 842.0, plx_raster_spec());
        plx_page_tokens source(vector, model);

        WHEN("The page has vector text") {
            plx_page_ref page;
            page.page_id = "with-text";
            plx_page_tokens_result result = source.get_tokens_for_page(page);

            THEN("The detector is never called") {
                REQUIRE(result.source_used == "vector");
                REQUIRE(result.tokens.size() == 1);
                REQUIRE(result.has_transform);
                REQUIRE(detector->get_calls() == 0);
            }
        }

        WHEN("The page has no vector text") {
            plx_page_ref page;
            page.page_id = "scanned";
            plx_page_tokens_result result = source.get_tokens_for_page(page);

            THEN("The model tokens are used alone") {
                REQUIRE(result.source_used == "model");
                REQUIRE(result.tokens.size() == 1);
                REQUIRE(result.tokens[0].get_text() == "BUREAU");
                REQUIRE_FALSE(result.has_transform);
                REQUIRE(detector->get_calls() == 1);
            }
        }
    }

    GIVEN("No fallback and no vector text") {
        auto vector = std::make_shared<mock_token_provider>(plx_token_source::vector);
        plx_page_tokens source(vector, nullptr);
        plx_page_ref page;
        page.page_id = "blank";

        THEN("The result is empty with source none") {
            plx_page_tokens_result result = source.get_tokens_for_page(page);
            REQUIRE(result.tokens.empty());
            REQUIRE(result.source_used == "none");
        }
    }

    GIVEN("No primary provider") {
        THEN("Construction fails") {
            REQUIRE_THROWS_AS(plx_page_tokens(nullptr, nullptr), std::invalid_argument);
        }
    }
}
