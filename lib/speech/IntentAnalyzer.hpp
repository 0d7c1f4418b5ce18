#pragma once

#include <string>

#include "esp_err.h"
#include "SpeechTypes.hpp"

/**
 * IntentAnalyzer
 * ============================================================================
 * Vai trò:
 *  - Chuyển câu nói đã final → Intent {action, target, raw}
 *  - Context = các intent gần nhất (cũ nhất trước)
 */
class IntentAnalyzer {
public:
    virtual ~IntentAnalyzer() = default;

    virtual esp_err_t analyze(const std::string& text,
                              const speech::IntentContext& context,
                              speech::Intent& out) = 0;
};
