#pragma once

#include <string>

namespace lotledger::core {

struct InputConfig {
    std::string file = "trades.csv";
};

struct MatchingConfig {
    std::string out_of_order_policy = "skip";
    std::string price_basis = "auto";
    bool aggregate_same_day = true;
    int cost_decimals = 4;
    int worker_threads = 1;
};

struct OutputConfig {
    std::string remaining_file = "remaining_purchases.csv";
    std::string summary_file = "remaining_summary.csv";
    std::string report_file;  // empty: no JSON report
    bool print_summary = true;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/lotledger.log";
};

struct Config {
    InputConfig input;
    MatchingConfig matching;
    OutputConfig output;
    LoggingConfig logging;

    static Config load(const std::string& path);
    static Config load_with_overrides(const std::string& path, int argc, char* argv[]);
    static Config defaults();
};

}  // namespace lotledger::core
