// utils/influx.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace utils {

// One line-protocol point: measurement, tags, numeric and string fields
struct InfluxPoint {
    std::string measurement;
    std::vector<std::pair<std::string, std::string>> tags;
    std::vector<std::pair<std::string, double>> fields;
    std::vector<std::pair<std::string, std::string>> string_fields;
};

/**
 * InfluxDB v2 client for time-series telemetry
 *
 * Points are rate limited by the caller's control time, queued, and posted
 * as one request once batch_size lines are waiting. Only enabled with
 * --influx (or influx.enabled in YAML).
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";
        std::string token = "";
        std::string org = "locomotion";
        std::string bucket = "teleop";
        double write_interval_s = 0.1;   // 10 Hz
        int batch_size = 1;              // lines per POST
        bool enabled = false;
    };

    /**
     * @throws std::runtime_error if libcurl can't be initialised
     */
    explicit InfluxClient(const Config& config);
    ~InfluxClient();

    InfluxClient(const InfluxClient&) = delete;
    InfluxClient& operator=(const InfluxClient&) = delete;

    /**
     * Queue one point stamped with the wall clock
     *
     * Skipped (returns false) when disabled or when less than
     * write_interval_s of control time t_s has passed since the last point.
     * A full batch is posted at once and its result returned.
     */
    bool write_point(double t_s, const InfluxPoint& point);

    /**
     * Post the queued lines. The queue is emptied even if the post fails.
     * Returns true when nothing was queued or the server accepted the batch.
     */
    bool flush();

    size_t pending() const { return batch_.size(); }
    bool is_enabled() const { return config_.enabled; }
    const Config& get_config() const { return config_; }

    // Line protocol for one point (no trailing newline)
    static std::string format_line(const InfluxPoint& point, int64_t timestamp_ns);

private:
    bool send_to_influx(const std::string& body);
    static int64_t wall_clock_time_ns();

    Config config_;
    double last_write_time_;
    int write_count_ = 0;
    std::vector<std::string> batch_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace utils
