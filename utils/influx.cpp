// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace utils {

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// Response body is not needed, only the HTTP status
static size_t discard_body(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// Field-value strings escape quotes and backslashes
static std::string escape_string_field(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// Measurement names, tag keys/values and field keys escape commas, spaces and '='
static std::string escape_key(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '=') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_write_time_(-1.0)
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Client created but disabled (use --influx flag to enable)");
        return;
    }

    impl_ = std::make_unique<Impl>();

    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, discard_body);
    // Keep the control loop responsive if the server is unreachable
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT_MS, 200L);
    curl_easy_setopt(impl_->curl, CURLOPT_CONNECTTIMEOUT_MS, 100L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s interval=%.0fms batch=%d",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.write_interval_s * 1000.0, config_.batch_size);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        if (!flush()) {
            LOG_WARN("[InfluxDB] Final flush failed");
        }
        LOG_INFO("[InfluxDB] Client shutdown after %d posts", write_count_);
    }
}

bool InfluxClient::write_point(double t_s, const InfluxPoint& point) {
    if (!config_.enabled) {
        return false;
    }

    if (last_write_time_ >= 0.0 && (t_s - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    last_write_time_ = t_s;

    batch_.push_back(format_line(point, wall_clock_time_ns()));
    if (static_cast<int>(batch_.size()) < config_.batch_size) {
        return true;
    }
    return flush();
}

bool InfluxClient::flush() {
    if (batch_.empty()) {
        return true;
    }

    std::string body;
    for (size_t i = 0; i < batch_.size(); ++i) {
        if (i > 0) body += '\n';
        body += batch_[i];
    }
    const size_t lines = batch_.size();
    batch_.clear();

    if (!send_to_influx(body)) {
        LOG_WARN("[InfluxDB] Dropped %zu queued point(s)", lines);
        return false;
    }
    return true;
}

std::string InfluxClient::format_line(const InfluxPoint& point, int64_t timestamp_ns) {
    std::ostringstream line;
    line << escape_key(point.measurement);
    for (const auto& tag : point.tags) {
        line << "," << escape_key(tag.first) << "=" << escape_key(tag.second);
    }

    char sep = ' ';
    for (const auto& field : point.fields) {
        line << sep << escape_key(field.first) << "=" << field.second;
        sep = ',';
    }
    for (const auto& field : point.string_fields) {
        line << sep << escape_key(field.first) << "=\"" << escape_string_field(field.second) << "\"";
        sep = ',';
    }

    line << " " << timestamp_ns;
    return line.str();
}

bool InfluxClient::send_to_influx(const std::string& body) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    CURLcode res = curl_easy_perform(impl_->curl);
    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    write_count_++;
    if (write_count_ == 1) {
        LOG_INFO("[InfluxDB] First post successful");
    } else if (write_count_ % 100 == 0) {
        LOG_DEBUG("[InfluxDB] %d posts accepted", write_count_);
    }
    return true;
}

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

} // namespace utils
