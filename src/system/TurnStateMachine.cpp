#include "TurnStateMachine.hpp"
#include "esp_log.h"
#include <algorithm>
#include <exception>

static const char *TAG = "TurnStateMachine";

using duplex::DuplexState;
using duplex::TurnState;

// ===========================================================
// Transitions
// ===========================================================

bool TurnStateMachine::transition(std::initializer_list<DuplexState> from,
                                  DuplexState to, TurnState t)
{
    std::vector<std::pair<int, StateCb>> callbacks;

    {
        std::lock_guard<std::mutex> lk(mtx);

        if (std::find(from.begin(), from.end(), state) == from.end()) {
            return false;
        }
        if (state == to && turn == t) {
            return true;  // No change
        }

        ESP_LOGI(TAG, "%s/%s -> %s/%s",
                 duplex::stateName(state), duplex::turnName(turn),
                 duplex::stateName(to), duplex::turnName(t));

        state = to;
        turn = t;

        // Copy callbacks under lock
        callbacks = state_cbs;
    }

    notify(to, t, callbacks);
    return true;
}

bool TurnStateMachine::startSession()
{
    return transition({DuplexState::IDLE}, DuplexState::LISTENING, TurnState::USER);
}

DuplexState TurnStateMachine::onUserSpeech()
{
    // Only SPEAKING moves; LISTENING and DUPLEX already reflect user speech
    transition({DuplexState::SPEAKING}, DuplexState::DUPLEX, TurnState::OVERLAP);
    return getState();
}

bool TurnStateMachine::beginResponse()
{
    return transition({DuplexState::LISTENING}, DuplexState::SPEAKING, TurnState::ASSISTANT);
}

bool TurnStateMachine::finishResponse()
{
    return transition({DuplexState::SPEAKING, DuplexState::DUPLEX},
                      DuplexState::LISTENING, TurnState::USER);
}

bool TurnStateMachine::interrupt()
{
    return transition({DuplexState::DUPLEX}, DuplexState::LISTENING, TurnState::USER);
}

void TurnStateMachine::stopSession()
{
    transition({DuplexState::IDLE, DuplexState::LISTENING, DuplexState::SPEAKING, DuplexState::DUPLEX},
               DuplexState::IDLE, TurnState::USER);
}

// ===========================================================
// Getters
// ===========================================================

DuplexState TurnStateMachine::getState()
{
    std::lock_guard<std::mutex> lk(mtx);
    return state;
}

TurnState TurnStateMachine::getTurn()
{
    std::lock_guard<std::mutex> lk(mtx);
    return turn;
}

TurnStateMachine::Snapshot TurnStateMachine::snapshot()
{
    std::lock_guard<std::mutex> lk(mtx);
    return Snapshot{state, turn};
}

// ===========================================================
// Subscription
// ===========================================================

int TurnStateMachine::subscribe(StateCb cb)
{
    std::lock_guard<std::mutex> lk(mtx);
    int id = next_sub_id++;
    state_cbs.emplace_back(id, std::move(cb));
    return id;
}

void TurnStateMachine::unsubscribe(int id)
{
    std::lock_guard<std::mutex> lk(mtx);
    state_cbs.erase(
        std::remove_if(state_cbs.begin(), state_cbs.end(),
        [id](auto &p){ return p.first == id; }),
        state_cbs.end()
    );
}

void TurnStateMachine::notify(DuplexState s, TurnState t,
                              const std::vector<std::pair<int, StateCb>>& callbacks)
{
    for (auto &p : callbacks) {
        if (!p.second) continue;
        try {
            p.second(s, t);
        } catch (const std::exception& e) {
            ESP_LOGE(TAG, "State subscriber %d threw: %s", p.first, e.what());
        } catch (...) {
            ESP_LOGE(TAG, "State subscriber %d threw a non-std exception", p.first);
        }
    }
}
