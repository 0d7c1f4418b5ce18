#pragma once
#include <functional>
#include <initializer_list>
#include <vector>
#include <mutex>
#include "DuplexTypes.hpp"

/**
 * TurnStateMachine
 * ============================================================================
 * - Giữ DuplexState + TurnState dưới MỘT mutex
 * - Mỗi transition là một bước compare-and-set: Listen task và Speak task
 *   có thể gọi cùng lúc mà không tạo trạng thái lai
 * - Callback được gọi NGOÀI lock
 *
 *   IDLE ──startSession──► LISTENING ──beginResponse──► SPEAKING
 *                             ▲  ▲                         │ onUserSpeech
 *              finishResponse │  └──── interrupt ──── DUPLEX ◄┘
 *                             └──── finishResponse ────┘
 *   any ──stopSession──► IDLE
 */
class TurnStateMachine {
public:
    using StateCb = std::function<void(duplex::DuplexState, duplex::TurnState)>;

    struct Snapshot {
        duplex::DuplexState state;
        duplex::TurnState turn;
    };

    TurnStateMachine() = default;
    TurnStateMachine(const TurnStateMachine&) = delete;
    TurnStateMachine& operator=(const TurnStateMachine&) = delete;

    // ---- Transitions ----
    /// IDLE → LISTENING, turn USER. False if a session is already active.
    bool startSession();

    /// User speech registered. SPEAKING → DUPLEX (turn OVERLAP);
    /// LISTENING/DUPLEX unchanged. Returns the state after the update.
    duplex::DuplexState onUserSpeech();

    /// LISTENING → SPEAKING, turn ASSISTANT. False from any other state.
    bool beginResponse();

    /// SPEAKING/DUPLEX → LISTENING, turn USER (normal end or synthesis failure)
    bool finishResponse();

    /// DUPLEX → LISTENING, turn USER. False if not in DUPLEX.
    bool interrupt();

    /// any → IDLE
    void stopSession();

    // ---- Getters ----
    duplex::DuplexState getState();
    duplex::TurnState getTurn();
    Snapshot snapshot();

    // ---- Subscribe ----
    int subscribe(StateCb cb);
    void unsubscribe(int id);

private:
    // Applies `to` if the current state is one of `from`. Notifies on change.
    bool transition(std::initializer_list<duplex::DuplexState> from,
                    duplex::DuplexState to, duplex::TurnState turn);

    void notify(duplex::DuplexState s, duplex::TurnState t,
                const std::vector<std::pair<int, StateCb>>& callbacks);

    std::mutex mtx;

    duplex::DuplexState state = duplex::DuplexState::IDLE;
    duplex::TurnState turn = duplex::TurnState::USER;

    int next_sub_id = 1;
    std::vector<std::pair<int, StateCb>> state_cbs;
};
