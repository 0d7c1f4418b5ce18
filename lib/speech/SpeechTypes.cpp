#include "SpeechTypes.hpp"

namespace speech
{

namespace {

struct ActionName {
    ActionType action;
    const char* name;
};

constexpr ActionName kActionNames[] = {
    {ActionType::CLICK, "click"},
    {ActionType::TYPE, "type"},
    {ActionType::SCROLL, "scroll"},
    {ActionType::DRAG, "drag"},
    {ActionType::OPEN, "open"},
    {ActionType::CLOSE, "close"},
    {ActionType::SWITCH, "switch"},
    {ActionType::NAVIGATE, "navigate"},
    {ActionType::SEARCH, "search"},
    {ActionType::GO_BACK, "go_back"},
    {ActionType::GO_FORWARD, "go_forward"},
    {ActionType::SAVE, "save"},
    {ActionType::COPY, "copy"},
    {ActionType::PASTE, "paste"},
    {ActionType::DELETE, "delete"},
    {ActionType::SCREENSHOT, "screenshot"},
    {ActionType::WAIT, "wait"},
    {ActionType::QUESTION, "question"},
    {ActionType::CLARIFY, "clarify"},
    {ActionType::CONFIRM, "confirm"},
    {ActionType::CANCEL, "cancel"},
    {ActionType::UNKNOWN, "unknown"},
};

} // namespace

const char* actionName(ActionType a)
{
    for (const auto& entry : kActionNames) {
        if (entry.action == a) return entry.name;
    }
    return "unknown";
}

ActionType parseAction(const std::string& name)
{
    for (const auto& entry : kActionNames) {
        if (name == entry.name) return entry.action;
    }
    return ActionType::UNKNOWN;
}

} // namespace speech
