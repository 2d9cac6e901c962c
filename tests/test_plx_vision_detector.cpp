#include <catch2/catch_all.hpp>
#include "../api/detectors/plx_vision_text_detector.h"
#include "../api/client/plx_http_request.h"
#include "../extraction/plx_extraction_exceptions.h"
#include <future>
#include <vector>

SCENARIO("Vision model answers are parsed into detections", "[detector][vision][unit]") {
    GIVEN("A completion whose content is a fenced JSON array") {
        plx_string body = R"({"choices": [{"message": {"role": "assistant", "content":
            "```json\n[{\"bbox\": [10, 20, 30, 40], \"text\": \"SALLE\", \"confidence\": 0.8},\n {\"bbox\": [1, 2, 3, 4], \"text\": \"12\"}, \"stray\"]\n```"}}]})";

        WHEN("Parsing the response") {
            std::vector<plx_text_detection> detections = plx_vision_text_detector::parse_response(body);

            THEN("Every object becomes a detection") {
                REQUIRE(detections.size() == 2);
                REQUIRE(detections[0].text == "SALLE");
                REQUIRE(detections[0].bbox == std::vector<double>{10, 20, 30, 40});
                REQUIRE(detections[0].confidence == Catch::Approx(0.8));
            }

            THEN("A missing confidence defaults to 1.0") {
                REQUIRE(detections[1].confidence == Catch::Approx(1.0));
            }
        }
    }

    GIVEN("A completion whose content is a plain array") {
        plx_string body = R"({"choices": [{"message": {"content": "[]"}}]})";

        THEN("An empty list is returned") {
            REQUIRE(plx_vision_text_detector::parse_response(body).empty());
        }
    }

    GIVEN("Responses that are not usable") {
        THEN("Each one raises detector_error") {
            REQUIRE_THROWS_AS(plx_vision_text_detector::parse_response("not json"), detector_error);
            REQUIRE_THROWS_AS(plx_vision_text_detector::parse_response(R"({"choices": []})"), detector_error);
            REQUIRE_THROWS_AS(plx_vision_text_detector::parse_response(R"({"choices": [{"text": "x"}]})"),
                              detector_error);
            REQUIRE_THROWS_AS(
                plx_vision_text_detector::parse_response(R"({"choices": [{"message": {"content": "I see rooms"}}]})"),
                detector_error);
        }
    }
}

SCENARIO("Vision requests carry the page image", "[detector][vision][unit]") {
    GIVEN("A detector and a PNG page") {
        plx_vision_text_detector detector("https://api.example.test/v1/chat/completions", "key", "vision-model");
        std::vector<unsigned char> png = {0x89, 'P', 'N', 'G'};

        WHEN("Building the request") {
            plxv_map request = detector.build_request(png);

            THEN("The model and both messages are present") {
                REQUIRE(request["model"].string_value() == "vision-model");
                plxv_vector messages = request["messages"].vector_value();
                REQUIRE(messages.size() == 2);
                plxv_map system = messages[0].map_value();
                REQUIRE(system["role"].string_value() == "system");

                plxv_map user = messages[1].map_value();
                plxv_vector parts = user["content"].vector_value();
                REQUIRE(parts.size() == 2);
                plxv_map image = parts[1].map_value();
                REQUIRE(image["type"].string_value() == "image_url");
                plxv_map url = image["image_url"].map_value();
                REQUIRE(url["url"].string_value() == "data:image/png;base64,iVBORw==");
            }
        }

        THEN("A JPEG page is encoded without padding and tagged as JPEG") {
            plxv_map request = detector.build_request({0xFF, 0xD8, 0xFF});
            plxv_map user = request["messages"].vector_value()[1].map_value();
            plxv_map image = user["content"].vector_value()[1].map_value();
            plxv_map url = image["image_url"].map_value();
            REQUIRE(url["url"].string_value() == "data:image/jpeg;base64,/9j/");
        }

        THEN("Detection without an API key fails before any request") {
            plx_vision_text_detector keyless("https://api.example.test/v1/chat/completions", "", "vision-model");
            REQUIRE_THROWS_AS(keyless.detect("page-1", png), detector_error);
        }

        THEN("Detection of an empty image fails before any request") {
            REQUIRE_THROWS_AS(detector.detect("page-1", {}), detector_error);
        }
    }
}

SCENARIO("libcurl is initialized once for concurrent page workers", "[detector][http][unit]") {
    GIVEN("Several workers starting requests at the same time") {
        std::vector<std::future<bool>> workers;
        for (int i = 0; i < 8; ++i) {
            workers.push_back(std::async(std::launch::async, [] { return plx_http_request::ensure_global_init(); }));
        }

        THEN("Every worker sees a ready library") {
            for (auto& w : workers) {
                REQUIRE(w.get());
            }
            REQUIRE(plx_http_request::ensure_global_init());
        }
    }

    GIVEN("A request without a URL") {
        plx_http_request request;

        THEN("It fails with an error message and no status") {
            REQUIRE_FALSE(request.send());
            REQUIRE(request.get_status_code() == 0);
            REQUIRE(request.get_error_message() == "URL is empty.");
        }
    }
}
