#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "image_catalog.hpp"
#include "load_test.hpp"
#include "utils.h"
#include "workloads/download_targets.hpp"
#include "workloads/download_workload.hpp"
#include "workloads/search_workload.hpp"
#include "workloads/ui_workload.hpp"
#include "workloads/upload_workload.hpp"

namespace bpo = boost::program_options;

int main(int argc, char* argv[]) {
    bpo::options_description opts_desc("Sends synthetic requests to the image server");
    opts_desc.add_options()
        ("help", "print this message")
        ("images_path", bpo::value<std::string>()->default_value("data"), "location of test images grouped by tag")
        ("target_host", bpo::value<std::string>()->default_value("127.0.0.1"), "IP address or hostname to test")
        ("upload_rate", bpo::value<int>()->default_value(1), "request rate of upload requests (0 disables)")
        ("ui_rate", bpo::value<int>()->default_value(1), "request rate of ui requests (0 disables)")
        ("search_rate", bpo::value<int>()->default_value(1), "request rate of search requests (0 disables)")
        ("download_rate", bpo::value<int>()->default_value(1), "request rate of download requests (0 disables)")
        ("test_duration", bpo::value<std::string>()->default_value("10m"), "duration of the load test")
        ("rampup_time", bpo::value<std::string>()->default_value("2m"), "duration of the rampup to test rate")
        ("user_count", bpo::value<int>()->default_value(1000), "number of random users to generate")
        ("workers", bpo::value<int>()->default_value(200), "number of parallel workers per workload")
        ("report_interval", bpo::value<std::string>()->default_value("10s"), "how often each workload logs a summary")
        ("connect_timeout", bpo::value<std::string>()->default_value("5s"), "HTTP connection timeout")
        ("read_timeout", bpo::value<std::string>()->default_value("30s"), "HTTP read/write timeout")
        ("seed", bpo::value<int>()->default_value(-1), "base random seed, -1 for a random one");

    std::string images_path;
    int upload_rate = 0, ui_rate = 0, search_rate = 0, download_rate = 0;
    int user_count = 0;
    LoadTestConfig config;

    try {
        bpo::variables_map vm;
        auto style = bpo::command_line_style::default_style | bpo::command_line_style::allow_long_disguise;
        bpo::store(bpo::command_line_parser(argc, argv).options(opts_desc).style(style).run(), vm);
        bpo::notify(vm);

        if (vm.count("help")) {
            std::cout << opts_desc << "\n";
            return 0;
        }

        images_path = vm["images_path"].as<std::string>();
        upload_rate = vm["upload_rate"].as<int>();
        ui_rate = vm["ui_rate"].as<int>();
        search_rate = vm["search_rate"].as<int>();
        download_rate = vm["download_rate"].as<int>();
        user_count = vm["user_count"].as<int>();

        config.client.host = vm["target_host"].as<std::string>();
        config.client.connect_timeout = parse_duration(vm["connect_timeout"].as<std::string>());
        config.client.read_timeout = parse_duration(vm["read_timeout"].as<std::string>());
        config.workers = vm["workers"].as<int>();
        config.duration = parse_duration(vm["test_duration"].as<std::string>());
        config.rampup = parse_duration(vm["rampup_time"].as<std::string>());
        config.report_interval = parse_duration(vm["report_interval"].as<std::string>());
        int seed = vm["seed"].as<int>();
        if (seed < -1) {
            throw std::invalid_argument("seed must be -1 (random) or a non-negative integer");
        }
        if (seed != -1) {
            config.seed = static_cast<uint32_t>(seed);
        }

        if (user_count <= 0) {
            throw std::invalid_argument("user_count must be greater than 0");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n" << opts_desc << "\n";
        return 1;
    }

    // --- Preparation Step ---
    std::vector<Fixture> images;
    try {
        images = load_fixtures(images_path);
    } catch (const std::exception& e) {
        log_error("failed to load images from path '" + images_path + "': " + e.what());
        return 1;
    }
    log_line("loaded " + std::to_string(images.size()) + " images from: " + images_path);

    try {
        check_host(config.client);
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
    log_line("target host is alive: " + config.client.host);

    // The ring must outlive the LoadTest that references it.
    DownloadTargets download_targets(DOWNLOAD_TARGETS_CAPACITY);

    try {
        LoadTest test(config);
        test.add_workload(std::make_unique<UploadWorkload>(images, user_count), upload_rate);
        test.add_workload(std::make_unique<UiWorkload>(), ui_rate);
        test.add_workload(std::make_unique<SearchWorkload>(collect_tags(images), download_targets), search_rate);
        test.add_workload(std::make_unique<DownloadWorkload>(download_targets), download_rate);

        std::cout << "Starting load test...\n"
                  << "   Target:    " << base_url(config.client.host) << "\n"
                  << "   Workloads: " << test.workload_count() << "\n"
                  << "   Workers:   " << config.workers << " per workload\n"
                  << "   Rampup:    " << format_duration(config.rampup) << "\n"
                  << "   Duration:  " << format_duration(config.duration) << "\n";
        if (config.seed) {
            std::cout << "   Seed:      " << *config.seed << " (Deterministic, varied per thread)\n\n";
        } else {
            std::cout << "   Seed:      Random\n\n";
        }

        test.run();
    } catch (const std::exception& e) {
        log_error(std::string("load test failed: ") + e.what());
        return 1;
    }

    log_line("load test complete");
    return 0;
}
