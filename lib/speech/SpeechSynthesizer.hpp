#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "esp_err.h"
#include "SpeechTypes.hpp"

/**
 * SpeechSynthesizer
 * ============================================================================
 * Vai trò:
 *  - Chuyển text → PCM, theo từng chunk (streaming) hoặc một lần (one-shot)
 *  - KHÔNG phát ra loa; Speak task ghi chunk vào AudioOutput
 *
 * Streaming:
 *   beginStream(text) → nextChunk() until ESP_ERR_NOT_FOUND
 *
 * nextChunk() return codes:
 *   ESP_OK             chunk written to `out`
 *   ESP_ERR_NOT_FOUND  stream finished normally
 *   ESP_ERR_TIMEOUT    nothing ready yet, call again
 *   anything else      synthesis failed, stream is dead
 *
 * stop() is safe from any task at any time and makes the current stream end
 * at the next nextChunk() call.
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    virtual esp_err_t beginStream(const std::string& text, const std::string& language) = 0;

    virtual esp_err_t nextChunk(speech::AudioChunk& out, uint32_t timeout_ms) = 0;

    virtual void stop() = 0;

    /// One-shot synthesis used for short phrases (backchannels).
    /// Must not disturb a stream started with beginStream().
    virtual esp_err_t synthesize(const std::string& text, const std::string& language,
                                 std::vector<int16_t>& pcm_out) = 0;
};
