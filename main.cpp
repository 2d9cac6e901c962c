/**
 * planlex - floor-plan token resolution
 *
 * Usage:
 *   ./planlex extract <manifest.json> <rules.json> [--out=<objects.json>] [--report=<report.json>] [--relaxed]
 *   ./planlex query <objects.json> [--number=<n>] [--name=<name>] [--type=<type>]
 *   ./planlex summarize <manifest.json>
 *
 * Examples:
 *   ./planlex extract project/manifest.json project/rules.json --out=objects.json
 *   ./planlex query objects.json --number=203
 */

#include "api/detectors/plx_vision_text_detector.h"
#include "api/json/plx_json.h"
#include "documents/tokens/plx_model_token_provider.h"
#include "documents/tokens/plx_vector_token_provider.h"
#include "extraction/plx_extraction_exceptions.h"
#include "extraction/plx_extraction_pipeline.h"
#include "extraction/plx_token_summary.h"
#include "index/plx_query_resolver.h"
#include "storage/plx_memory_object_repository.h"
#include "storage/plx_project_manifest.h"
#include "utils/plx_config.h"
#include "utils/plx_env.h"
#include <fstream>
#include <iostream>
#include <string>

using namespace plx::extraction;

void print_usage(const char* program_name) {
    std::cout << "planlex - floor-plan token resolution\n" << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " extract <manifest.json> <rules.json> [options]" << std::endl;
    std::cout << "  " << program_name << " query <objects.json> [criteria]" << std::endl;
    std::cout << "  " << program_name << " summarize <manifest.json>\n" << std::endl;
    std::cout << "Extract options:" << std::endl;
    std::cout << "  --out=<path>         Objects file (default: objects.json)" << std::endl;
    std::cout << "  --report=<path>      Write the run report as JSON" << std::endl;
    std::cout << "  --relaxed            Tag objects as extracted under a provisional guide\n" << std::endl;
    std::cout << "Query criteria (combined with OR):" << std::endl;
    std::cout << "  --number=<n>         Room number" << std::endl;
    std::cout << "  --name=<name>        Room name" << std::endl;
    std::cout << "  --type=<type>        Object type: room, door, schedule_table\n" << std::endl;
    std::cout << "Settings are read from the environment and .env (PLX_*)." << std::endl;
}

std::string get_option_value(const std::string& arg, const std::string& prefix) {
    if (arg.find(prefix) == 0) {
        return arg.substr(prefix.length());
    }
    return "";
}

std::shared_ptr<plx_page_tokens> make_token_source(const plx_config& config) {
    auto vector_provider = std::make_shared<plx_vector_token_provider>(config.default_dpi);

    std::shared_ptr<i_token_provider> fallback;
    if (config.use_vision && !config.vision_api_key.empty()) {
        auto detector = std::make_shared<plx_vision_text_detector>(config.vision_endpoint, config.vision_api_key,
                                                                   config.vision_model);
        fallback = std::make_shared<plx_model_token_provider>(std::make_shared<plx_file_page_store>(), detector);
    } else if (config.use_vision) {
        std::cerr << "Warning: PLX_VISION_API_KEY not set, model fallback disabled" << std::endl;
    }
    return std::make_shared<plx_page_tokens>(vector_provider, fallback);
}

int run_extract(const plx_config& config, int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }
    std::string manifest_path = argv[2];
    std::string rules_path = argv[3];
    std::string out_path = "objects.json";
    std::string report_path;
    extraction_policy policy = extraction_policy::conservative;

    for (int i = 4; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--out=") == 0) {
            out_path = get_option_value(arg, "--out=");
        } else if (arg.find("--report=") == 0) {
            report_path = get_option_value(arg, "--report=");
        } else if (arg == "--relaxed") {
            policy = extraction_policy::relaxed;
        } else {
            std::cerr << "Warning: Ignoring unknown option " << arg << std::endl;
        }
    }

    plx_project_manifest manifest;
    if (!plx_project_manifest::load(manifest_path, manifest)) {
        return 1;
    }

    std::vector<rule_payload> payloads;
    rule_parse_report rules_report;
    if (!load_rule_payloads(rules_path, payloads, &rules_report)) {
        return 1;
    }
    std::cout << "Rules: " << rules_report.accepted << " accepted, " << rules_report.malformed << " malformed"
              << std::endl;

    auto extractor = std::make_shared<page_extractor>(make_token_source(config), config.merge_iou_threshold);
    auto repository = std::make_shared<plx_memory_object_repository>();
    extraction_pipeline pipeline(extractor, repository, config.max_parallel_pages);

    run_report report = pipeline.run_project(manifest.project_id, manifest.pages, payloads, policy);

    if (!repository->save_json(manifest.project_id, out_path)) {
        return 1;
    }
    std::cout << "Wrote " << report.objects_total << " objects to " << out_path << std::endl;

    if (!report_path.empty()) {
        std::ofstream file(report_path);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot write " << report_path << std::endl;
            return 1;
        }
        file << plx_json::dump(report.to_map(), 2) << std::endl;
    }
    return report.pages_failed == 0 ? 0 : 2;
}

int run_query(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    std::string objects_path = argv[2];
    plx::index::query_criteria criteria;

    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--number=") == 0) {
            criteria.room_number = plx_string(get_option_value(arg, "--number="));
        } else if (arg.find("--name=") == 0) {
            criteria.room_name = plx_string(get_option_value(arg, "--name="));
        } else if (arg.find("--type=") == 0) {
            criteria.type = plx_string(get_option_value(arg, "--type="));
        } else {
            std::cerr << "Warning: Ignoring unknown option " << arg << std::endl;
        }
    }

    plx_memory_object_repository repository;
    if (!repository.load_json(objects_path)) {
        return 1;
    }
    std::vector<plx_string> projects = repository.project_ids();
    if (projects.empty()) {
        std::cerr << "Error: " << objects_path << " holds no project" << std::endl;
        return 1;
    }

    plx::index::project_index index;
    if (!repository.get_index(projects.front(), index)) {
        index = plx::index::build_index(projects.front(), repository.objects_for_project(projects.front()));
        repository.put_index(index);
    }

    plx::index::query_resolver resolver(repository);
    try {
        plx::index::query_result result = resolver.query(projects.front(), criteria);
        std::cout << plx_json::dump(result.to_map(), 2) << std::endl;
    } catch (const query_error& e) {
        std::cerr << "Error: " << e.get_code() << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int run_summarize(const plx_config& config, int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }
    plx_project_manifest manifest;
    if (!plx_project_manifest::load(argv[2], manifest)) {
        return 1;
    }

    std::shared_ptr<plx_page_tokens> source = make_token_source(config);
    for (const auto& page : manifest.pages) {
        plx_page_tokens_result tokens = source->get_tokens_for_page(page);
        token_summary summary = summarize_tokens(tokens.tokens);
        std::cout << "== " << page.page_id << " (" << tokens.source_used << ") ==" << std::endl;
        std::cout << summary.to_prompt_text() << "\n" << std::endl;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    if (load_env_file(".env")) {
        std::cout << "Loaded settings from .env" << std::endl;
    }
    plx_config config = plx_config::from_env();

    std::string command = argv[1];
    try {
        if (command == "extract") {
            return run_extract(config, argc, argv);
        } else if (command == "query") {
            return run_query(argc, argv);
        } else if (command == "summarize") {
            return run_summarize(config, argc, argv);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
