#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace speech
{

    // ---------- Recognizer output ----------
    struct Transcription
    {
        std::string text;
        bool is_final = false;   // stable hypothesis, ready for intent analysis
        float confidence = 0.0f;
        std::string language;    // recognizer's guess, empty if unknown
    };

    // ---------- Synthesizer output ----------
    struct AudioChunk
    {
        std::vector<int16_t> pcm;
        uint32_t sample_rate = 16000;
    };

    // ---------- Intent actions ----------
    enum class ActionType : uint8_t
    {
        // Mouse / keyboard
        CLICK,
        TYPE,
        SCROLL,
        DRAG,

        // Application
        OPEN,
        CLOSE,
        SWITCH,

        // Browser
        NAVIGATE,
        SEARCH,
        GO_BACK,
        GO_FORWARD,

        // File
        SAVE,
        COPY,
        PASTE,
        DELETE,

        // System
        SCREENSHOT,
        WAIT,

        // Conversation
        QUESTION,
        CLARIFY,
        CONFIRM,
        CANCEL,

        UNKNOWN
    };

    /// Lower-case wire name ("click", "go_back", ...)
    const char* actionName(ActionType a);

    /// Parse a wire name; anything unrecognized maps to UNKNOWN
    ActionType parseAction(const std::string& name);

    struct Intent
    {
        ActionType action = ActionType::UNKNOWN;
        std::string target;     // empty when the utterance names none
        std::string raw;        // text the intent was derived from
        std::string language;   // empty = use session language
        float confidence = 0.0f;
    };

    // Recent intents, oldest first
    using IntentContext = std::vector<Intent>;

} // namespace speech
