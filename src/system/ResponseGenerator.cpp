#include "ResponseGenerator.hpp"

#include "esp_log.h"

static const char *TAG = "ResponseGenerator";

using speech::ActionType;
using speech::Intent;

namespace {

struct LanguageTemplates {
    const char* lang;
    const char* acknowledge;   // {action} {target}
    const char* default_target;
    const char* screenshot;
    const char* confirm;
    const char* cancel;
    const char* question;
    const char* fallback;
    const char* backchannels[5];
};

const LanguageTemplates kTemplates[] = {
    {
        "en",
        "I'll {action} {target} now...",
        "that",
        "Taking a screenshot...",
        "Got it!",
        "Cancelled.",
        "Let me think about that...",
        "I understand. How can I help?",
        {"uh-huh", "okay", "got it", "I see", "right"},
    },
    {
        "vi",
        "Tôi sẽ {action} {target} ngay...",
        "cái đó",
        "Đang chụp màn hình...",
        "Được rồi!",
        "Đã hủy.",
        "Để tôi suy nghĩ...",
        "Tôi hiểu. Tôi có thể giúp gì?",
        {"ừ", "được", "hiểu rồi", "à", "vâng"},
    },
};

constexpr size_t kBackchannelCount = 5;

// Spoken verb per desktop action; nullptr = not a desktop action
const char* enVerb(ActionType a)
{
    switch (a) {
    case ActionType::CLICK:      return "click";
    case ActionType::TYPE:       return "type";
    case ActionType::SCROLL:     return "scroll";
    case ActionType::DRAG:       return "drag";
    case ActionType::OPEN:       return "open";
    case ActionType::CLOSE:      return "close";
    case ActionType::SWITCH:     return "switch to";
    case ActionType::NAVIGATE:   return "navigate to";
    case ActionType::SEARCH:     return "search";
    case ActionType::GO_BACK:    return "go back to";
    case ActionType::GO_FORWARD: return "go forward to";
    case ActionType::SAVE:       return "save";
    case ActionType::COPY:       return "copy";
    case ActionType::PASTE:      return "paste";
    case ActionType::DELETE:     return "delete";
    default:                     return nullptr;
    }
}

const char* viVerb(ActionType a)
{
    switch (a) {
    case ActionType::CLICK:      return "nhấn";
    case ActionType::TYPE:       return "gõ";
    case ActionType::SCROLL:     return "cuộn";
    case ActionType::DRAG:       return "kéo";
    case ActionType::OPEN:       return "mở";
    case ActionType::CLOSE:      return "đóng";
    case ActionType::SWITCH:     return "chuyển sang";
    case ActionType::NAVIGATE:   return "chuyển tới";
    case ActionType::SEARCH:     return "tìm";
    case ActionType::GO_BACK:    return "quay lại";
    case ActionType::GO_FORWARD: return "tiến tới";
    case ActionType::SAVE:       return "lưu";
    case ActionType::COPY:       return "sao chép";
    case ActionType::PASTE:      return "dán";
    case ActionType::DELETE:     return "xóa";
    default:                     return nullptr;
    }
}

const LanguageTemplates& templatesFor(const std::string& lang)
{
    for (const auto& t : kTemplates) {
        if (lang == t.lang) return t;
    }
    return kTemplates[0];
}

void replaceAll(std::string& s, const std::string& key, const std::string& value)
{
    size_t pos = 0;
    while ((pos = s.find(key, pos)) != std::string::npos) {
        s.replace(pos, key.size(), value);
        pos += value.size();
    }
}

} // namespace

bool TemplateResponseGenerator::supportsLanguage(const std::string& lang)
{
    for (const auto& t : kTemplates) {
        if (lang == t.lang) return true;
    }
    return false;
}

std::string TemplateResponseGenerator::resolveLanguage(const Intent& intent, const std::string& session_lang)
{
    if (!intent.language.empty() && supportsLanguage(intent.language)) {
        return intent.language;
    }
    if (supportsLanguage(session_lang)) {
        return session_lang;
    }
    return "en";
}

esp_err_t TemplateResponseGenerator::generate(const Intent& intent,
                                              const std::string& language,
                                              std::string& out)
{
    const std::string lang = resolveLanguage(intent, language);
    const LanguageTemplates& t = templatesFor(lang);

    const char* verb = lang == "vi" ? viVerb(intent.action) : enVerb(intent.action);
    if (verb) {
        out = t.acknowledge;
        replaceAll(out, "{action}", verb);
        replaceAll(out, "{target}", intent.target.empty() ? t.default_target : intent.target);
    } else {
        switch (intent.action) {
        case ActionType::SCREENSHOT: out = t.screenshot; break;
        case ActionType::CONFIRM:    out = t.confirm; break;
        case ActionType::CANCEL:     out = t.cancel; break;
        case ActionType::QUESTION:   out = t.question; break;
        default:                     out = t.fallback; break;
        }
    }

    ESP_LOGD(TAG, "%s/%s → \"%s\"", speech::actionName(intent.action), lang.c_str(), out.c_str());
    return ESP_OK;
}

std::string TemplateResponseGenerator::backchannelPhrase(const std::string& lang, size_t index)
{
    return templatesFor(lang).backchannels[index % kBackchannelCount];
}
