#pragma once

#include <cstdint>
#include <cstddef>

/**
 * AudioOutput
 * ============================================================================
 * Vai trò:
 *  - Phát PCM thô ra loa (I2S / DAC / file / test sink)
 *  - KHÔNG tổng hợp giọng nói
 *
 * Writes are fire-and-forget. The controller serializes calls, so an
 * implementation does not need its own locking.
 *
 * Dòng dữ liệu:
 *   SpeechSynthesizer → PCM → Speak task → AudioOutput → SPEAKER
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    // Chuẩn bị phát (init DMA, buffer, v.v.)
    virtual bool startPlayback() = 0;

    // Dừng phát, bỏ phần còn lại trong buffer
    virtual void stopPlayback() = 0;

    // ========================================================================
    // Data write
    // ========================================================================

    /**
     * Write PCM samples to speaker
     * @param pcm          PCM buffer
     * @param pcm_samples  number of samples
     * @return samples actually written
     */
    virtual size_t writePcm(const int16_t* pcm, size_t pcm_samples) = 0;

    // ========================================================================
    // Info
    // ========================================================================

    virtual uint32_t sampleRate() const = 0;
};
