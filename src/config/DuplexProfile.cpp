#include "DuplexProfile.hpp"

#include "esp_log.h"

#include <cctype>

static const char *TAG = "DuplexProfile";

// Centralized limits for easy tweaking
namespace duplex_cfg
{
    constexpr float MIN_THRESHOLD_S = 0.05f;   // below one poll tick makes no sense
    constexpr float MIN_INTERVAL_S = 0.5f;
    constexpr uint32_t MIN_TICK_MS = 10;
    constexpr uint32_t MAX_POLL_MS = 100;      // cancellation must be seen within 100 ms
    constexpr uint32_t MIN_SAMPLE_RATE = 8000;
    constexpr uint32_t MAX_SAMPLE_RATE = 48000;
    constexpr size_t MIN_QUEUE_DEPTH = 2;
}

DuplexConfig DuplexProfile::defaults()
{
    return DuplexConfig{};
}

std::string DuplexProfile::normalizeLanguage(const std::string &lang)
{
    std::string primary;
    for (char c : lang) {
        if (c == '-' || c == '_') break;
        primary.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (primary.empty() || primary == "auto") {
        return "en";
    }
    return primary;
}

DuplexConfig DuplexProfile::sanitize(const DuplexConfig &cfg)
{
    DuplexConfig out = cfg;

    if (out.interruption_threshold < duplex_cfg::MIN_THRESHOLD_S) {
        ESP_LOGW(TAG, "interruption_threshold %.3fs too small, using %.3fs",
                 out.interruption_threshold, duplex_cfg::MIN_THRESHOLD_S);
        out.interruption_threshold = duplex_cfg::MIN_THRESHOLD_S;
    }
    if (out.backchannel_interval < duplex_cfg::MIN_INTERVAL_S) {
        ESP_LOGW(TAG, "backchannel_interval %.3fs too small, using %.3fs",
                 out.backchannel_interval, duplex_cfg::MIN_INTERVAL_S);
        out.backchannel_interval = duplex_cfg::MIN_INTERVAL_S;
    }
    if (out.backchannel_freshness <= 0.0f) {
        ESP_LOGW(TAG, "backchannel_freshness must be > 0, using 0.5s");
        out.backchannel_freshness = 0.5f;
    }
    if (out.silence_timeout < 0.0f) {
        out.silence_timeout = 0.0f;
    }

    if (out.sample_rate < duplex_cfg::MIN_SAMPLE_RATE || out.sample_rate > duplex_cfg::MAX_SAMPLE_RATE) {
        ESP_LOGW(TAG, "sample_rate %u unsupported, using 16000", static_cast<unsigned>(out.sample_rate));
        out.sample_rate = 16000;
    }
    if (out.listen_chunk_samples == 0) {
        out.listen_chunk_samples = out.sample_rate / 50;
    }

    const std::string lang = normalizeLanguage(out.language);
    if (lang != out.language) {
        ESP_LOGI(TAG, "language '%s' → '%s'", out.language.c_str(), lang.c_str());
        out.language = lang;
    }

    if (out.poll_interval_ms < duplex_cfg::MIN_TICK_MS || out.poll_interval_ms > duplex_cfg::MAX_POLL_MS) {
        ESP_LOGW(TAG, "poll_interval_ms %u out of range, using 100", static_cast<unsigned>(out.poll_interval_ms));
        out.poll_interval_ms = 100;
    }
    if (out.monitor_tick_ms < duplex_cfg::MIN_TICK_MS || out.monitor_tick_ms > duplex_cfg::MAX_POLL_MS) {
        ESP_LOGW(TAG, "monitor_tick_ms %u out of range, using 100", static_cast<unsigned>(out.monitor_tick_ms));
        out.monitor_tick_ms = 100;
    }
    if (out.shutdown_timeout_ms < out.poll_interval_ms * 2) {
        out.shutdown_timeout_ms = out.poll_interval_ms * 2;
    }

    if (out.queue_depth < duplex_cfg::MIN_QUEUE_DEPTH) {
        ESP_LOGW(TAG, "queue_depth %u too small", static_cast<unsigned>(out.queue_depth));
        out.queue_depth = duplex_cfg::MIN_QUEUE_DEPTH;
    }
    if (out.event_queue_depth < duplex_cfg::MIN_QUEUE_DEPTH) {
        ESP_LOGW(TAG, "event_queue_depth %u too small", static_cast<unsigned>(out.event_queue_depth));
        out.event_queue_depth = duplex_cfg::MIN_QUEUE_DEPTH;
    }

    return out;
}
