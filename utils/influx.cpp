// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxExporter::Impl {
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

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    // Response body is not used, only the HTTP status
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// ============================================================================
// Line protocol helpers
// ============================================================================

namespace {

class FieldSet {
public:
    void add_int(const char* key, const std::optional<int>& v) {
        if (!v) return;
        sep();
        out_ << key << '=' << *v << 'i';
    }

    void add_int(const char* key, int64_t v) {
        sep();
        out_ << key << '=' << v << 'i';
    }

    void add_str(const char* key, const std::string& v) {
        sep();
        out_ << key << "=\"";
        for (char c : v) {
            if (c == '"' || c == '\\') out_ << '\\';
            out_ << c;
        }
        out_ << '"';
    }

    std::string str() const { return out_.str(); }

private:
    void sep() {
        if (!first_) out_ << ',';
        first_ = false;
    }

    std::ostringstream out_;
    bool first_ = true;
};

void add_sample(FieldSet& f, const char* prefix, const power::PowerSourceSample& s) {
    const std::string p(prefix);
    f.add_int((p + "_v_mv").c_str(), s.voltage_mV);
    f.add_int((p + "_i_ma").c_str(), s.current_mA);
    f.add_int((p + "_cap_pct").c_str(), s.capacity_pct);
    f.add_int((p + "_lim_ma").c_str(), s.current_limit_mA);
    f.add_str((p + "_status").c_str(), power::to_string(s.status));
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxExporter::InfluxExporter(const Config& config)
    : config_(config)
    , last_write_time_(-1.0e9)  // Force first write
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_DEBUG("[InfluxDB] Exporter created but disabled");
        return;
    }

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
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 2L);

    LOG_INFO("[InfluxDB] Exporter initialized: url=%s org=%s bucket=%s interval=%.1fs",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.write_interval_s);
}

InfluxExporter::~InfluxExporter() {
    if (config_.enabled) {
        LOG_INFO("[InfluxDB] Exporter shutdown after %llu writes",
                 static_cast<unsigned long long>(write_count_));
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxExporter::write_cycle(const power::PowerSourceSample& phone,
                                 const power::PowerSourceSample& keyboard,
                                 const control::Decision& decision,
                                 uint64_t cycle,
                                 double elapsed_s)
{
    if (!config_.enabled) {
        return false;
    }

    if ((elapsed_s - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    last_write_time_ = elapsed_s;

    const std::string line = build_cycle_line(phone, keyboard, decision, cycle, wall_clock_time_ns());
    return send_to_influx(line + "\n");
}

std::string InfluxExporter::build_cycle_line(const power::PowerSourceSample& phone,
                                             const power::PowerSourceSample& keyboard,
                                             const control::Decision& decision,
                                             uint64_t cycle,
                                             int64_t timestamp_ns)
{
    FieldSet f;
    add_sample(f, "ph", phone);
    add_sample(f, "kb", keyboard);
    f.add_int("kb_soc_pct", decision.keyboard_soc_pct);
    f.add_int("target_ma", static_cast<int64_t>(decision.target_limit_mA));
    f.add_int("kb_target_ma", decision.keyboard_limit_mA);
    f.add_int("cycle", static_cast<int64_t>(cycle));
    f.add_str("action", control::to_string(decision.action));
    f.add_str("direction", control::to_string(decision.phone_direction));
    f.add_str("reason", decision.reason ? decision.reason : "");

    std::ostringstream line;
    line << "power_balance " << f.str() << " " << timestamp_ns;
    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxExporter::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

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
        LOG_INFO("[InfluxDB] First write successful");
    } else if (write_count_ % 100 == 0) {
        LOG_DEBUG("[InfluxDB] Successfully wrote %llu points",
                  static_cast<unsigned long long>(write_count_));
    }

    return true;
}

int64_t InfluxExporter::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

} // namespace utils
