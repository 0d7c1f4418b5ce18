#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "esp_err.h"
#include "SpeechTypes.hpp"

/**
 * SpeechRecognizer
 * ============================================================================
 * Vai trò:
 *  - Nhận PCM từ Listen task, trả về các Transcription (partial + final)
 *  - KHÔNG đọc mic trực tiếp
 *
 * One recognition stream per session:
 *   beginStream() → feed() ... feed() → cancelStream()
 *
 * feed() may produce zero or more transcriptions per chunk. cancelStream()
 * can be called from another task while feed() is running and must make it
 * return promptly.
 */
class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    virtual esp_err_t beginStream(uint32_t sample_rate, const std::string& language) = 0;

    /**
     * Push one chunk of audio into the stream.
     * @param pcm      PCM samples
     * @param samples  number of samples
     * @param out      transcriptions produced by this chunk are appended here
     * @return ESP_OK, or an error for this chunk only (stream stays usable)
     */
    virtual esp_err_t feed(const int16_t* pcm, size_t samples,
                           std::vector<speech::Transcription>& out) = 0;

    virtual void cancelStream() = 0;
};
