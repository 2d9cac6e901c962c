#include <catch2/catch_all.hpp>
#include "plx_test_helpers.h"
#include "../documents/pdf/plx_pdf_document.h"
#include "../documents/tokens/plx_model_token_provider.h"
#include "../documents/tokens/plx_page_tokens.h"
#include "../documents/tokens/plx_vector_token_provider.h"
#include <filesystem>
#include <fstream>

SCENARIO("Vector text degrades to an empty token list", "[tokens][pdf][unit]") {
    GIVEN("A vector provider") {
        plx_vector_token_provider provider(150.0);

        THEN("A page without a PDF yields no tokens") {
            plx_page_ref page;
            page.page_id = "scan-only";
            REQUIRE(provider.get_tokens(page).empty());
        }

        THEN("A missing PDF yields no tokens and leaves the transform untouched") {
            plx_page_ref page;
            page.page_id = "missing";
            page.pdf_path = "/nonexistent/plan.pdf";
            plx_page_transform transform;
            REQUIRE(provider.get_tokens(page, nullptr, &transform).empty());
            REQUIRE_FALSE(transform.valid());
        }

        THEN("A file that is not a PDF yields no tokens") {
            std::filesystem::path path = std::filesystem::temp_directory_path() / "planlex_not_a_pdf.pdf";
            {
                std::ofstream out(path);
                out << "plain text, no PDF header";
            }
            plx_page_ref page;
            page.page_id = "garbage";
            page.pdf_path = path.string();
            REQUIRE(provider.get_tokens(page).empty());
            std::filesystem::remove(path);
        }
    }

    GIVEN("A missing PDF and a model fallback") {
        auto detector = std::make_shared<mock_text_detector>();
        detector->detections = {{{100, 80, 60, 20}, "CLASSE", 0.9}};
        auto fallback = std::make_shared<plx_model_token_provider>(std::make_shared<mock_page_store>(), detector);
        plx_page_tokens tokens(std::make_shared<plx_vector_token_provider>(), fallback);

        plx_page_ref page;
        page.page_id = "page-1";
        page.pdf_path = "/nonexistent/plan.pdf";
        page.image_path = "/nonexistent/plan.png";

        THEN("The fallback supplies the tokens") {
            plx_page_tokens_result result = tokens.get_tokens_for_page(page);
            REQUIRE(result.source_used == "model");
            REQUIRE(result.tokens.size() == 1);
            REQUIRE_FALSE(result.has_transform);
            REQUIRE(detector->get_calls() == 1);
        }
    }

    GIVEN("A PDF whose page tree points at a missing page object") {
        std::filesystem::path path = std::filesystem::temp_directory_path() / "planlex_broken_tree.pdf";
        {
            std::ofstream out(path, std::ios::binary);
            out << "%PDF-1.4\n"
                << "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
                << "2 0 obj\n<< /Type /Pages /Kids [7 0 R] /Count 1 >>\nendobj\n"
                << "trailer\n<< /Root 1 0 R /Size 3 >>\n%%EOF\n";
        }

        auto detector = std::make_shared<mock_text_detector>();
        detector->detections = {{{100, 80, 60, 20}, "CLASSE", 0.9}};
        auto fallback = std::make_shared<plx_model_token_provider>(std::make_shared<mock_page_store>(), detector);
        plx_page_tokens tokens(std::make_shared<plx_vector_token_provider>(), fallback);

        plx_page_ref page;
        page.page_id = "page-1";
        page.pdf_path = path.string();

        THEN("The vector source yields nothing and the fallback still runs") {
            plx_page_tokens_result result = tokens.get_tokens_for_page(page);
            REQUIRE(result.source_used == "model");
            REQUIRE(result.tokens.size() == 1);
            REQUIRE(detector->get_calls() == 1);
        }

        THEN("A page number past the end also yields nothing") {
            page.page_number = 3;
            plx_vector_token_provider provider;
            REQUIRE(provider.get_tokens(page).empty());
        }

        std::filesystem::remove(path);
    }

    GIVEN("A PDF document that was never loaded") {
        plx_pdf_document doc;

        THEN("Reading from it raises source_unavailable_error") {
            double w = 0;
            double h = 0;
            REQUIRE_THROWS_AS(doc.page_size(0, w, h), source_unavailable_error);
        }
    }
}
