#include "DuplexTypes.hpp"

namespace duplex
{

const char* stateName(DuplexState s)
{
    switch (s) {
    case DuplexState::IDLE:      return "IDLE";
    case DuplexState::LISTENING: return "LISTENING";
    case DuplexState::SPEAKING:  return "SPEAKING";
    case DuplexState::DUPLEX:    return "DUPLEX";
    }
    return "?";
}

const char* turnName(TurnState t)
{
    switch (t) {
    case TurnState::USER:      return "USER";
    case TurnState::ASSISTANT: return "ASSISTANT";
    case TurnState::OVERLAP:   return "OVERLAP";
    }
    return "?";
}

const char* eventName(EventType e)
{
    switch (e) {
    case EventType::TRANSCRIPTION: return "transcription";
    case EventType::RESPONSE:      return "response";
    case EventType::INTERRUPTION:  return "interruption";
    case EventType::BACKCHANNEL:   return "backchannel";
    }
    return "?";
}

} // namespace duplex
