// utils/influx.hpp
#pragma once

#include "control/decision_engine.hpp"
#include "power/power_sample.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB exporter for per-cycle balancer telemetry
 *
 * Mirrors the CSV cycle log into InfluxDB so a phone on the bench can be
 * watched live. Disabled unless --influx is given or influx.enabled is set.
 *
 * Measurement schema:
 *   - power_balance: both battery samples plus the decision of the cycle.
 *     Unknown readings are omitted from the field set.
 */
class InfluxExporter {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "pine64";                  // Organization name
        std::string bucket = "kbd-balancer";         // Bucket name
        double write_interval_s = 5.0;               // Minimum spacing between writes
        bool enabled = false;
    };

    /**
     * @throws std::runtime_error if libcurl cannot be initialized
     */
    explicit InfluxExporter(const Config& config);
    ~InfluxExporter();

    InfluxExporter(const InfluxExporter&) = delete;
    InfluxExporter& operator=(const InfluxExporter&) = delete;

    /**
     * Write one cycle to InfluxDB
     *
     * Skipped when disabled or when less than write_interval_s has passed
     * since the previous write (elapsed_s is daemon uptime).
     *
     * @return true if data was written, false if skipped or failed
     */
    bool write_cycle(const power::PowerSourceSample& phone,
                     const power::PowerSourceSample& keyboard,
                     const control::Decision& decision,
                     uint64_t cycle,
                     double elapsed_s);

    /**
     * Build the line protocol record for one cycle
     *
     * Measurement: power_balance
     * Tags: none (one device per daemon)
     */
    static std::string build_cycle_line(const power::PowerSourceSample& phone,
                                        const power::PowerSourceSample& keyboard,
                                        const control::Decision& decision,
                                        uint64_t cycle,
                                        int64_t timestamp_ns);

    bool is_enabled() const { return config_.enabled; }
    const Config& get_config() const { return config_; }
    uint64_t write_count() const { return write_count_; }

private:
    Config config_;
    double last_write_time_;
    uint64_t write_count_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool send_to_influx(const std::string& line_protocol);

    static int64_t wall_clock_time_ns();
};

} // namespace utils
