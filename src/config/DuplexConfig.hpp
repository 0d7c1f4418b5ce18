#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * DuplexConfig
 * ============================================================================
 * Tham số của một phiên full-duplex. Tạo một lần, truyền vào
 * DuplexController, không sửa sau đó.
 *
 * Times in the first block are seconds (float) to match the values product
 * people tune; loop timings below are milliseconds.
 */
struct DuplexConfig {
    // ------------------------------------------------------------------
    // Turn-taking
    // ------------------------------------------------------------------
    float interruption_threshold = 0.3f; // user speech fresher than this cuts the response
    float backchannel_interval = 3.0f;   // minimum gap between two backchannels
    float silence_timeout = 1.5f;        // reserved, not consumed by any loop
    float backchannel_freshness = 0.5f;  // user must have spoken this recently

    bool allow_interruptions = true;
    bool enable_backchannels = true;

    // ------------------------------------------------------------------
    // Audio / language
    // ------------------------------------------------------------------
    uint32_t sample_rate = 16000;
    std::string language = "en";          // "en", "vi", "auto"
    size_t listen_chunk_samples = 320;    // 20 ms @ 16 kHz

    // ------------------------------------------------------------------
    // Loop timing
    // ------------------------------------------------------------------
    uint32_t poll_interval_ms = 100;      // queue pull timeout
    uint32_t monitor_tick_ms = 100;
    uint32_t shutdown_timeout_ms = 1000;  // per stop(), for all tasks together

    // ------------------------------------------------------------------
    // Buffers
    // ------------------------------------------------------------------
    size_t queue_depth = 16;              // transcription + response queues
    size_t event_queue_depth = 32;        // per subscriber
    size_t context_window = 10;           // past intents handed to the analyzer

    // ------------------------------------------------------------------
    // FreeRTOS task placement (core < 0 = no affinity)
    // ------------------------------------------------------------------
    struct TaskParams {
        const char* name;
        uint32_t stack_size;
        uint32_t priority;
        int core;
    };

    TaskParams listen_task  {"DuplexListen",  4096, 5, 0};
    TaskParams process_task {"DuplexProcess", 6144, 4, 1};
    TaskParams speak_task   {"DuplexSpeak",   4096, 5, 1};
    TaskParams monitor_task {"DuplexMonitor", 3072, 3, -1};
    TaskParams backchannel_task {"DuplexBackch", 4096, 3, -1};
};
