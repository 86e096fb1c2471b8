#include <exception>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "booking/book_keeper.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "io/csv_reader.hpp"
#include "io/csv_writer.hpp"
#include "io/report.hpp"

int main(int argc, char* argv[]) {
    // Find config file from --config= arg, or use default path
    std::string config_path = "config/default.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        }
    }

    try {
        auto cfg = lotledger::core::Config::load_with_overrides(config_path, argc, argv);

        lotledger::core::init_logging(cfg.logging.level, cfg.logging.file);

        auto options = lotledger::booking::make_booking_options(cfg.matching);
        spdlog::info("Matching with out-of-order policy '{}', price basis '{}', {} worker(s)",
                     lotledger::booking::out_of_order_policy_to_string(options.out_of_order),
                     lotledger::booking::price_basis_to_string(options.aggregation.price_basis),
                     options.worker_threads);

        auto rows = lotledger::io::load_trade_csv(cfg.input.file);

        lotledger::booking::BookKeeper book_keeper(options);
        auto result = book_keeper.book_rows(rows);
        lotledger::io::log_booking(result);

        int decimals = options.aggregation.cost_decimals;
        if (result.remaining_lots.empty()) {
            spdlog::info("No remaining purchases found.");
        } else {
            spdlog::info("Total remaining purchases: {}", result.remaining_lots.size());
            lotledger::io::save_remaining_lots(cfg.output.remaining_file,
                                               result.remaining_lots, decimals);
            lotledger::io::save_summary(cfg.output.summary_file, result.summary, decimals);

            if (cfg.output.print_summary) {
                std::cout << "Summary of remaining purchases by company:\n"
                          << lotledger::io::render_summary_table(result.summary);
            }
        }

        if (!cfg.output.report_file.empty()) {
            lotledger::io::save_report(cfg.output.report_file,
                                       lotledger::io::make_report(result, cfg.input.file));
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
