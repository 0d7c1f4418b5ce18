#pragma once

#include <cstddef>
#include <string>

#include "esp_err.h"
#include "SpeechTypes.hpp"

/**
 * ResponseGenerator
 * ============================================================================
 * Intent → câu trả lời ngắn cho Speak task.
 * A backend (LLM, server) can implement this; TemplateResponseGenerator is
 * the built-in lookup used when none is attached.
 */
class ResponseGenerator {
public:
    virtual ~ResponseGenerator() = default;

    /**
     * @param intent    analyzed intent
     * @param language  session language, used when the intent carries none
     * @param out       reply text
     */
    virtual esp_err_t generate(const speech::Intent& intent,
                               const std::string& language,
                               std::string& out) = 0;
};

/**
 * Deterministic template lookup (en / vi).
 *  - desktop actions  → acknowledgment "I'll open chrome now..."
 *  - question         → stalling filler
 *  - screenshot / confirm / cancel → fixed phrases
 *  - anything else    → generic acknowledgment
 * Same (action, target, language) always gives the same text.
 */
class TemplateResponseGenerator : public ResponseGenerator {
public:
    esp_err_t generate(const speech::Intent& intent,
                       const std::string& language,
                       std::string& out) override;

    static bool supportsLanguage(const std::string& lang);

    /// Language used for a reply: intent's if supported, else session's, else "en"
    static std::string resolveLanguage(const speech::Intent& intent, const std::string& session_lang);

    /// Backchannel phrase for a language; index wraps around the phrase list
    static std::string backchannelPhrase(const std::string& lang, size_t index);
};
