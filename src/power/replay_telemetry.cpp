// src/power/replay_telemetry.cpp
#include "power/replay_telemetry.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <map>
#include <optional>

namespace power {

bool ReplayTelemetry::load(const std::string& csv_path) {
    utils::CsvReader csv;
    if (!csv.open(csv_path)) {
        LOG_ERROR("[Replay] Cannot open %s", csv_path.c_str());
        return false;
    }

    for (const char* col : {"cycle", "source"}) {
        if (!csv.has_column(col)) {
            LOG_ERROR("[Replay] %s: missing column '%s'", csv_path.c_str(), col);
            return false;
        }
    }

    std::map<int, Cycle> by_cycle;
    utils::CsvRow row;

    while (csv.next(row)) {
        const auto cycle = csv.int_cell(row, "cycle");
        const std::string source = csv.cell(row, "source");
        if (!cycle || *cycle < 0) {
            LOG_WARN("[Replay] %s:%zu: bad cycle number, row skipped", csv_path.c_str(), row.line_no);
            continue;
        }

        PowerSourceSample s;
        if (source == "phone") {
            s.id = PowerSourceId::Phone;
        } else if (source == "keyboard") {
            s.id = PowerSourceId::Keyboard;
        } else {
            LOG_WARN("[Replay] %s:%zu: unknown source '%s', row skipped",
                     csv_path.c_str(), row.line_no, source.c_str());
            continue;
        }

        s.voltage_mV = csv.int_cell(row, "voltage_mv");
        s.current_mA = csv.int_cell(row, "current_ma");
        s.capacity_pct = csv.int_cell(row, "capacity_pct");
        s.current_limit_mA = csv.int_cell(row, "limit_ma");
        s.status = parse_charge_status(csv.cell(row, "status").c_str());

        auto& c = by_cycle[*cycle];
        if (s.id == PowerSourceId::Phone) {
            c.phone = s;
        } else {
            c.keyboard = s;
        }
    }

    cycles_.clear();
    length_ = 0;
    position_ = 0;

    uint64_t pos = 0;
    std::optional<int> prev;
    for (auto& [n, c] : by_cycle) {
        if (prev) {
            uint64_t gap = static_cast<uint64_t>(n - *prev) - 1;
            if (gap > kMaxGapCycles) {
                LOG_WARN("[Replay] %s: %llu missing cycles after cycle %d shortened to %llu",
                         csv_path.c_str(), static_cast<unsigned long long>(gap), *prev,
                         static_cast<unsigned long long>(kMaxGapCycles));
                gap = kMaxGapCycles;
            }
            pos += gap + 1;
        }
        cycles_[pos] = c;
        prev = n;
    }
    if (prev) {
        length_ = pos + 1;
    }

    LOG_INFO("[Replay] Loaded %llu cycles from %s", static_cast<unsigned long long>(length_), csv_path.c_str());
    return true;
}

PowerSourceSample ReplayTelemetry::read(PowerSourceId id) {
    if (finished()) {
        return PowerSourceSample::unavailable(id);
    }
    auto it = cycles_.find(position_);
    if (it == cycles_.end()) {
        return PowerSourceSample::unavailable(id);
    }
    return id == PowerSourceId::Phone ? it->second.phone : it->second.keyboard;
}

} // namespace power
