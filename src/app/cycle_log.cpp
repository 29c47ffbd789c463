// src/app/cycle_log.cpp
#include "app/cycle_log.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

#include <optional>
#include <sstream>

namespace app {

namespace {

std::string opt_str(const std::optional<int>& v, const char* unknown) {
    return v ? std::to_string(*v) : std::string(unknown);
}

void append_source(std::ostringstream& out, const char* tag, const power::PowerSourceSample& s) {
    out << tag << " v: " << opt_str(s.voltage_mV, "n/a")
        << ", a: " << opt_str(s.current_mA, "n/a")
        << ", s: " << power::to_string(s.status)
        << ", l: " << opt_str(s.current_limit_mA, "n/a")
        << ", c: " << opt_str(s.capacity_pct, "n/a");
}

const char* csv_source(power::PowerSourceId id) {
    return id == power::PowerSourceId::Phone ? "phone" : "keyboard";
}

} // namespace

std::string format_cycle_line(const power::PowerSourceSample& phone,
                              const power::PowerSourceSample& keyboard,
                              const control::Decision& decision) {
    std::ostringstream out;
    append_source(out, "ph", phone);
    out << ", ";
    append_source(out, "kb", keyboard);
    out << ", act: " << control::to_string(decision.action);
    return out.str();
}

bool CycleCsvWriter::open(const std::string& path) {
    out_.open(path);
    if (!out_) {
        LOG_ERROR("Failed to open CSV: %s", path.c_str());
        return false;
    }
    out_ << "cycle,source,voltage_mv,current_ma,status,capacity_pct,limit_ma,"
         << "action,target_ma,kb_target_ma,direction,kb_soc_pct,reason\n";
    return true;
}

void CycleCsvWriter::write(uint64_t cycle,
                           const power::PowerSourceSample& phone,
                           const power::PowerSourceSample& keyboard,
                           const control::Decision& decision) {
    if (!out_.is_open()) return;
    write_row_(cycle, phone, decision);
    write_row_(cycle, keyboard, decision);
    out_.flush();
}

void CycleCsvWriter::write_row_(uint64_t cycle, const power::PowerSourceSample& s,
                                const control::Decision& decision) {
    const char* status = s.status == power::ChargeStatus::Unknown ? "" : power::to_string(s.status);
    out_ << cycle << ","
         << csv_source(s.id) << ","
         << opt_str(s.voltage_mV, "") << ","
         << opt_str(s.current_mA, "") << ","
         << status << ","
         << opt_str(s.capacity_pct, "") << ","
         << opt_str(s.current_limit_mA, "") << ","
         << control::to_string(decision.action) << ","
         << decision.target_limit_mA << ","
         << opt_str(decision.keyboard_limit_mA, "") << ","
         << control::to_string(decision.phone_direction) << ","
         << opt_str(decision.keyboard_soc_pct, "") << ","
         << utils::csv_quote(decision.reason ? decision.reason : "") << "\n";
}

void CycleCsvWriter::close() {
    if (out_.is_open()) {
        out_.close();
    }
}

} // namespace app
