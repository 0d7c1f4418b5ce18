#pragma once

#include <cstdint>
#include <cstddef>

/**
 * AudioInput
 * ============================================================================
 * Vai trò:
 *  - Thu PCM thô từ mic (I2S / ADC / PDM / test source)
 *  - KHÔNG nhận dạng giọng nói
 *  - DuplexController điều khiển vòng đời
 *
 * A source is consumed by exactly one session. Once stopCapture() has been
 * called it is not restarted; a new session needs a new source.
 *
 * Dòng dữ liệu:
 *   MIC → AudioInput → PCM → Listen task → SpeechRecognizer
 */
class AudioInput {
public:
    virtual ~AudioInput() = default;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Bắt đầu capture mic
    virtual bool startCapture() = 0;

    // Dừng capture hoàn toàn.
    // May be called from another task while readPcm() is blocked; that
    // readPcm() must then return promptly (0 samples is fine).
    virtual void stopCapture() = 0;

    // ========================================================================
    // Data access
    // ========================================================================

    /**
     * Read PCM samples
     * @param pcm          output buffer
     * @param max_samples  capacity of pcm in samples
     * @return number of samples read (0 = no data yet)
     */
    virtual size_t readPcm(int16_t* pcm, size_t max_samples) = 0;

    // ========================================================================
    // Info
    // ========================================================================

    virtual uint32_t sampleRate() const = 0;
};
