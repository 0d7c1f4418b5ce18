#pragma once
#include <cstdint>
#include <string>

namespace duplex
{

    // ---------- Audio direction (who is using the channel) ----------
    enum class DuplexState : uint8_t
    {
        IDLE,      // before start() / after stop()
        LISTENING, // mic only
        SPEAKING,  // response playing, user silent since it began
        DUPLEX     // response playing AND user spoke since it began
    };

    // ---------- Conversational floor ----------
    enum class TurnState : uint8_t
    {
        USER,
        ASSISTANT,
        OVERLAP
    };

    // ---------- Public event stream ----------
    enum class EventType : uint8_t
    {
        TRANSCRIPTION, // text = hypothesis (partial or final)
        RESPONSE,      // text = response that finished playing
        INTERRUPTION,  // timestamp_us = trigger time, text = response cut off
        BACKCHANNEL    // text = phrase
    };

    struct DuplexEvent
    {
        EventType type = EventType::TRANSCRIPTION;
        std::string text;
        bool is_final = false;      // TRANSCRIPTION only
        int64_t timestamp_us = 0;   // esp_timer_get_time()
    };

    const char* stateName(DuplexState s);
    const char* turnName(TurnState t);
    const char* eventName(EventType e);

} // namespace duplex
