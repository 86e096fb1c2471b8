#include "core/config.hpp"

#include <toml++/toml.hpp>
#include <spdlog/spdlog.h>

#include <cstring>
#include <filesystem>

namespace lotledger::core {

Config Config::defaults() {
    return Config{};
}

Config Config::load(const std::string& path) {
    Config cfg;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file not found: {}, using defaults", path);
        return cfg;
    }

    try {
        auto tbl = toml::parse_file(path);

        // [input]
        if (auto input = tbl["input"].as_table()) {
            if (auto v = (*input)["file"].value<std::string>())
                cfg.input.file = *v;
        }

        // [matching]
        if (auto matching = tbl["matching"].as_table()) {
            if (auto v = (*matching)["out_of_order_policy"].value<std::string>())
                cfg.matching.out_of_order_policy = *v;
            if (auto v = (*matching)["price_basis"].value<std::string>())
                cfg.matching.price_basis = *v;
            if (auto v = (*matching)["aggregate_same_day"].value<bool>())
                cfg.matching.aggregate_same_day = *v;
            if (auto v = (*matching)["cost_decimals"].value<int>())
                cfg.matching.cost_decimals = *v;
            if (auto v = (*matching)["worker_threads"].value<int>())
                cfg.matching.worker_threads = *v;
        }

        // [output]
        if (auto output = tbl["output"].as_table()) {
            if (auto v = (*output)["remaining_file"].value<std::string>())
                cfg.output.remaining_file = *v;
            if (auto v = (*output)["summary_file"].value<std::string>())
                cfg.output.summary_file = *v;
            if (auto v = (*output)["report_file"].value<std::string>())
                cfg.output.report_file = *v;
            if (auto v = (*output)["print_summary"].value<bool>())
                cfg.output.print_summary = *v;
        }

        // [logging]
        if (auto logging = tbl["logging"].as_table()) {
            if (auto v = (*logging)["level"].value<std::string>())
                cfg.logging.level = *v;
            if (auto v = (*logging)["file"].value<std::string>())
                cfg.logging.file = *v;
        }
    } catch (const toml::parse_error& e) {
        spdlog::error("Failed to parse config: {}", e.what());
    }

    return cfg;
}

Config Config::load_with_overrides(const std::string& path, int argc, char* argv[]) {
    auto cfg = load(path);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.rfind("--input=", 0) == 0) {
            cfg.input.file = arg.substr(8);
        } else if (arg.rfind("--remaining-out=", 0) == 0) {
            cfg.output.remaining_file = arg.substr(16);
        } else if (arg.rfind("--summary-out=", 0) == 0) {
            cfg.output.summary_file = arg.substr(14);
        } else if (arg.rfind("--report=", 0) == 0) {
            cfg.output.report_file = arg.substr(9);
        } else if (arg.rfind("--out-of-order=", 0) == 0) {
            cfg.matching.out_of_order_policy = arg.substr(15);
        } else if (arg.rfind("--price-basis=", 0) == 0) {
            cfg.matching.price_basis = arg.substr(14);
        } else if (arg == "--no-aggregate") {
            cfg.matching.aggregate_same_day = false;
        } else if (arg.rfind("--threads=", 0) == 0) {
            cfg.matching.worker_threads = std::stoi(arg.substr(10));
        } else if (arg.rfind("--log-level=", 0) == 0) {
            cfg.logging.level = arg.substr(12);
        } else if (arg == "--quiet") {
            cfg.output.print_summary = false;
        } else if (arg.rfind("--config=", 0) == 0) {
            // already handled via path
        } else {
            spdlog::warn("Ignoring unknown argument: {}", arg);
        }
    }

    return cfg;
}

}  // namespace lotledger::core
