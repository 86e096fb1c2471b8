#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/date.hpp"

namespace lotledger::booking {

struct MalformedRow {
    size_t row = 0;
    std::string reason;
};

struct OutOfOrderWarning {
    std::string security;
    size_t row = 0;             // first event that went backwards in time
    core::Date date;            // its date
    core::Date previous_date;   // latest date seen before it
    bool skipped = true;        // false when processed under the lenient policy
};

struct OverSellWarning {
    std::string security;
    core::Date date;
    size_t row = 0;
    int64_t requested = 0;
    int64_t shortfall = 0;
};

/// Everything the engine noticed about its input, returned with the output.
struct Diagnostics {
    std::vector<MalformedRow> malformed;
    size_t noop_rows = 0;
    std::vector<OutOfOrderWarning> out_of_order;
    std::vector<OverSellWarning> over_sells;

    size_t malformed_count() const { return malformed.size(); }

    bool clean() const {
        return malformed.empty() && out_of_order.empty() && over_sells.empty();
    }
};

}  // namespace lotledger::booking
