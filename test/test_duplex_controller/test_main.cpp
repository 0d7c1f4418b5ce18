#include <unity.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "system/DuplexController.hpp"
#include "system/EventStream.hpp"
#include "../support/FakeComponents.hpp"

using duplex::DuplexEvent;
using duplex::DuplexState;
using duplex::EventType;
using duplex::TurnState;

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// Rig: controller wired to fakes. The fakes are owned by the controller;
// the raw pointers stay valid for the rig's lifetime.
// ============================================================================
struct Rig {
    explicit Rig(const DuplexConfig& cfg, uint32_t utterance_ms = 400)
        : ctl(cfg),
          in_log(std::make_shared<fake::SilentInput::Log>()),
          out_log(std::make_shared<fake::RecordingOutput::Log>())
    {
        auto r = std::make_unique<fake::ScriptedRecognizer>();
        auto s = std::make_unique<fake::PacedSynthesizer>(utterance_ms, 50);
        auto a = std::make_unique<fake::KeywordIntentAnalyzer>();
        stt = r.get();
        tts = s.get();
        nlu = a.get();
        ctl.setComponents(std::move(r), std::move(s), std::move(a));
    }

    esp_err_t start()
    {
        return ctl.start(std::make_unique<fake::SilentInput>(in_log),
                         std::make_unique<fake::RecordingOutput>(out_log));
    }

    DuplexController::Stats stats() const { return ctl.getStats(); }

    DuplexController ctl;
    std::shared_ptr<fake::SilentInput::Log> in_log;
    std::shared_ptr<fake::RecordingOutput::Log> out_log;
    fake::ScriptedRecognizer* stt = nullptr;
    fake::PacedSynthesizer* tts = nullptr;
    fake::KeywordIntentAnalyzer* nlu = nullptr;
};

static DuplexConfig quietConfig()
{
    DuplexConfig cfg;
    cfg.enable_backchannels = false;
    return cfg;
}

// Everything currently buffered in the stream
static std::vector<DuplexEvent> drain(EventStream& stream)
{
    std::vector<DuplexEvent> out;
    DuplexEvent ev;
    while (stream.next(ev, 0))
        out.push_back(ev);
    return out;
}

static std::vector<DuplexEvent> ofType(const std::vector<DuplexEvent>& events, EventType type)
{
    std::vector<DuplexEvent> out;
    for (const auto& ev : events)
        if (ev.type == type)
            out.push_back(ev);
    return out;
}

static void sleepMs(uint32_t ms)
{
    vTaskDelay(pdMS_TO_TICKS(ms));
}

// ============================================================================
// Lifecycle
// ============================================================================
void test_start_without_components_is_rejected()
{
    DuplexController ctl;
    auto in_log = std::make_shared<fake::SilentInput::Log>();
    auto out_log = std::make_shared<fake::RecordingOutput::Log>();

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE,
                      ctl.start(std::make_unique<fake::SilentInput>(in_log),
                                std::make_unique<fake::RecordingOutput>(out_log)));
    TEST_ASSERT_EQUAL(DuplexState::IDLE, ctl.state());
    TEST_ASSERT_FALSE(ctl.isRunning());
}

void test_start_without_audio_endpoint_is_rejected()
{
    Rig rig(quietConfig());
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG,
                      rig.ctl.start(nullptr, std::make_unique<fake::RecordingOutput>(rig.out_log)));
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
    TEST_ASSERT_EQUAL(0, rig.in_log->starts.load());
}

void test_start_then_stop()
{
    Rig rig(quietConfig());

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    TEST_ASSERT_EQUAL(DuplexState::LISTENING, rig.ctl.state());
    TEST_ASSERT_EQUAL(TurnState::USER, rig.ctl.turn());
    TEST_ASSERT_TRUE(rig.ctl.isListening());
    TEST_ASSERT_FALSE(rig.ctl.isSpeaking());
    TEST_ASSERT_EQUAL(1, rig.stt->begun.load());

    // Second start while running
    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, rig.start());

    // The Listen task is actually pulling audio
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.in_log->chunks.load() >= 3; }, 1000));

    rig.ctl.stop();
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
    TEST_ASSERT_FALSE(rig.ctl.isListening());
    TEST_ASSERT_FALSE(rig.ctl.isRunning());
    TEST_ASSERT_EQUAL(1, rig.in_log->stops.load());
    TEST_ASSERT_TRUE(rig.stt->cancelled.load() >= 1);

    rig.ctl.stop();  // no-op
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
    TEST_ASSERT_EQUAL(1, rig.in_log->stops.load());
}

void test_recognizer_refusal_aborts_start()
{
    Rig rig(quietConfig());
    rig.stt->begin_result = ESP_ERR_NOT_SUPPORTED;

    TEST_ASSERT_EQUAL(ESP_ERR_NOT_SUPPORTED, rig.start());
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
    TEST_ASSERT_FALSE(rig.ctl.isRunning());

    // Nothing left half-started; a retry works
    rig.stt->begin_result = ESP_OK;
    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    TEST_ASSERT_EQUAL(DuplexState::LISTENING, rig.ctl.state());
    rig.ctl.stop();
}

// ============================================================================
// Request / response
// ============================================================================
void test_partials_then_final_give_one_response()
{
    Rig rig(quietConfig());
    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    auto events = rig.ctl.getEvents();

    rig.stt->inject(fake::makePartial("open"));
    rig.stt->inject(fake::makePartial("open chr"));
    rig.stt->inject(fake::makePartial("open chrom"));
    rig.stt->inject(fake::makeFinal("open chrome"));

    // While the assistant holds the turn alone it is not listening
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.state() == DuplexState::SPEAKING; }, 2000));
    TEST_ASSERT_FALSE(rig.ctl.isListening());
    TEST_ASSERT_TRUE(rig.ctl.isSpeaking());

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));
    TEST_ASSERT_TRUE(rig.ctl.isListening());

    const std::vector<std::string> spoken = rig.tts->spoken();
    TEST_ASSERT_EQUAL(1, spoken.size());
    TEST_ASSERT_EQUAL_STRING("I'll open chrome now...", spoken[0].c_str());
    TEST_ASSERT_TRUE(rig.out_log->writes() >= 8);

    const DuplexController::Stats st = rig.stats();
    TEST_ASSERT_EQUAL(4, st.transcriptions);
    TEST_ASSERT_EQUAL(1, st.final_transcriptions);
    TEST_ASSERT_EQUAL(1, st.responses_enqueued);
    TEST_ASSERT_EQUAL(0, st.interruptions);

    const auto all = drain(*events);
    const auto transcripts = ofType(all, EventType::TRANSCRIPTION);
    const auto responses = ofType(all, EventType::RESPONSE);
    TEST_ASSERT_EQUAL(4, transcripts.size());
    TEST_ASSERT_FALSE(transcripts[0].is_final);
    TEST_ASSERT_TRUE(transcripts[3].is_final);
    TEST_ASSERT_EQUAL_STRING("open chrome", transcripts[3].text.c_str());
    TEST_ASSERT_EQUAL(1, responses.size());
    TEST_ASSERT_EQUAL_STRING("I'll open chrome now...", responses[0].text.c_str());
    TEST_ASSERT_TRUE(responses[0].timestamp_us >= transcripts[3].timestamp_us);

    TEST_ASSERT_EQUAL(DuplexState::LISTENING, rig.ctl.state());
    TEST_ASSERT_EQUAL(TurnState::USER, rig.ctl.turn());
    rig.ctl.stop();
}

void test_responses_are_spoken_in_order()
{
    Rig rig(quietConfig());
    TEST_ASSERT_EQUAL(ESP_OK, rig.start());

    rig.stt->inject(fake::makeFinal("open chrome"));
    rig.stt->inject(fake::makeFinal("close notepad"));
    rig.stt->inject(fake::makeFinal("what time is it"));

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 3; }, 5000));

    const std::vector<std::string> spoken = rig.tts->spoken();
    TEST_ASSERT_EQUAL(3, spoken.size());
    TEST_ASSERT_EQUAL_STRING("I'll open chrome now...", spoken[0].c_str());
    TEST_ASSERT_EQUAL_STRING("I'll close notepad now...", spoken[1].c_str());
    TEST_ASSERT_EQUAL_STRING("Let me think about that...", spoken[2].c_str());
    rig.ctl.stop();
}

void test_state_subscriber_follows_the_turn()
{
    Rig rig(quietConfig());

    std::mutex mtx;
    std::vector<DuplexState> seen;
    const int id = rig.ctl.subscribeState([&](DuplexState s, TurnState) {
        std::lock_guard<std::mutex> lk(mtx);
        seen.push_back(s);
    });

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    rig.stt->inject(fake::makeFinal("click the button"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));
    rig.ctl.stop();
    rig.ctl.unsubscribeState(id);

    std::lock_guard<std::mutex> lk(mtx);
    TEST_ASSERT_EQUAL(4, seen.size());
    TEST_ASSERT_EQUAL(DuplexState::LISTENING, seen[0]);
    TEST_ASSERT_EQUAL(DuplexState::SPEAKING, seen[1]);
    TEST_ASSERT_EQUAL(DuplexState::LISTENING, seen[2]);
    TEST_ASSERT_EQUAL(DuplexState::IDLE, seen[3]);
}

// ============================================================================
// Interruption
// ============================================================================
void test_user_speech_interrupts_long_response()
{
    DuplexConfig cfg = quietConfig();
    cfg.interruption_threshold = 0.3f;
    Rig rig(cfg, 2000);

    std::atomic<int64_t> interrupted_at{0};
    rig.ctl.setCallbacks(nullptr, nullptr, nullptr,
                         [&](int64_t ts_us) { interrupted_at = ts_us; });

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    auto events = rig.ctl.getEvents();

    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.isSpeaking(); }, 2000));
    sleepMs(500);

    const int64_t spoke_at_ms = fake::nowMs();
    rig.stt->inject(fake::makePartial("wait"));

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().interruptions >= 1; }, 1000));
    TEST_ASSERT_TRUE(fake::nowMs() - spoke_at_ms < 500);

    TEST_ASSERT_EQUAL(DuplexState::LISTENING, rig.ctl.state());
    TEST_ASSERT_EQUAL(TurnState::USER, rig.ctl.turn());
    TEST_ASSERT_FALSE(rig.ctl.isSpeaking());

    // Well before the 2 s utterance would have ended
    TEST_ASSERT_TRUE(interrupted_at.load() / 1000 - rig.tts->stream_started_ms.load() < 2000);
    TEST_ASSERT_TRUE(rig.tts->stops.load() >= 1);
    TEST_ASSERT_TRUE(rig.out_log->stops.load() >= 1);  // buffered audio flushed

    // Nothing more reaches the speaker
    const size_t writes = rig.out_log->writes();
    TEST_ASSERT_TRUE(writes < 40);
    sleepMs(300);
    TEST_ASSERT_EQUAL(writes, rig.out_log->writes());

    const auto all = drain(*events);
    const auto interruptions = ofType(all, EventType::INTERRUPTION);
    TEST_ASSERT_EQUAL(1, interruptions.size());
    TEST_ASSERT_EQUAL_STRING("I'll open chrome now...", interruptions[0].text.c_str());
    TEST_ASSERT_EQUAL(0, ofType(all, EventType::RESPONSE).size());
    TEST_ASSERT_EQUAL(0, rig.stats().responses_completed);
    rig.ctl.stop();
}

void test_interruptions_disabled_lets_response_finish()
{
    DuplexConfig cfg = quietConfig();
    cfg.allow_interruptions = false;
    Rig rig(cfg, 600);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());

    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.isSpeaking(); }, 2000));
    sleepMs(100);
    rig.stt->inject(fake::makePartial("hmm"));

    // Overlap is still tracked
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.state() == DuplexState::DUPLEX; }, 500));
    TEST_ASSERT_EQUAL(TurnState::OVERLAP, rig.ctl.turn());
    TEST_ASSERT_TRUE(rig.ctl.isListening());
    TEST_ASSERT_TRUE(rig.ctl.isSpeaking());

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 2000));
    TEST_ASSERT_EQUAL(0, rig.stats().interruptions);
    TEST_ASSERT_EQUAL(DuplexState::LISTENING, rig.ctl.state());
    rig.ctl.stop();
}

void test_synthesis_failure_returns_to_listening()
{
    Rig rig(quietConfig(), 600);
    rig.tts->fail_after_chunks = 2;

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    auto events = rig.ctl.getEvents();

    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().synthesis_failures >= 1; }, 3000));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.state() == DuplexState::LISTENING; }, 500));

    const auto failed = ofType(drain(*events), EventType::INTERRUPTION);
    TEST_ASSERT_EQUAL(1, failed.size());
    TEST_ASSERT_EQUAL_STRING("I'll open chrome now...", failed[0].text.c_str());

    // The session keeps going
    rig.stt->inject(fake::makeFinal("close notepad"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));
    TEST_ASSERT_EQUAL(2, rig.tts->spoken().size());
    TEST_ASSERT_EQUAL(0, rig.stats().interruptions);
    rig.ctl.stop();
}

// ============================================================================
// Backchannels
// ============================================================================
void test_backchannels_are_rate_limited()
{
    DuplexConfig cfg;
    cfg.backchannel_interval = 1.0f;
    cfg.event_queue_depth = 256;
    Rig rig(cfg);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    auto events = rig.ctl.getEvents();

    rig.stt->talkFor(5000, 100);
    sleepMs(5800);  // last speech goes stale 500 ms after talking ends

    const auto backchannels = ofType(drain(*events), EventType::BACKCHANNEL);
    TEST_ASSERT_TRUE(backchannels.size() >= 3);
    TEST_ASSERT_TRUE(backchannels.size() <= 5);
    for (size_t i = 1; i < backchannels.size(); ++i) {
        TEST_ASSERT_TRUE(backchannels[i].timestamp_us - backchannels[i - 1].timestamp_us > 1000000);
    }
    TEST_ASSERT_EQUAL_STRING("uh-huh", backchannels[0].text.c_str());
    TEST_ASSERT_EQUAL_STRING("okay", backchannels[1].text.c_str());

    // Played outside the response path
    TEST_ASSERT_TRUE(rig.tts->spoken().empty());
    TEST_ASSERT_EQUAL(backchannels.size(), rig.tts->oneShots().size());
    TEST_ASSERT_EQUAL(backchannels.size(), rig.stats().backchannels);
    rig.ctl.stop();
}

void test_no_backchannel_without_recent_speech()
{
    DuplexConfig cfg;
    cfg.backchannel_interval = 0.5f;
    Rig rig(cfg);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    sleepMs(1500);
    TEST_ASSERT_EQUAL(0, rig.stats().backchannels);
    rig.ctl.stop();
}

// ============================================================================
// Stop mid-response
// ============================================================================
void test_stop_while_speaking()
{
    Rig rig(quietConfig(), 3000);
    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    auto events = rig.ctl.getEvents();

    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.isSpeaking(); }, 2000));
    sleepMs(200);

    const int64_t t0 = fake::nowMs();
    rig.ctl.stop();
    TEST_ASSERT_TRUE(fake::nowMs() - t0 < 500);

    TEST_ASSERT_FALSE(rig.ctl.isSpeaking());
    TEST_ASSERT_FALSE(rig.ctl.isListening());
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
    TEST_ASSERT_TRUE(rig.tts->stops.load() >= 1);

    DuplexEvent ev;
    TEST_ASSERT_FALSE(events->next(ev, 50));
    TEST_ASSERT_TRUE(events->isClosed());

    const size_t writes = rig.out_log->writes();
    sleepMs(300);
    TEST_ASSERT_EQUAL(writes, rig.out_log->writes());
    TEST_ASSERT_EQUAL(0, rig.stats().responses_completed);
}

// ============================================================================
// Resilience
// ============================================================================
void test_component_errors_do_not_end_session()
{
    Rig rig(quietConfig());
    rig.stt->fail_every = 5;

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    rig.stt->inject(fake::makeFinal("fail"));
    rig.stt->inject(fake::makeFinal("open chrome"));

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));

    const std::vector<std::string> spoken = rig.tts->spoken();
    TEST_ASSERT_EQUAL(1, spoken.size());
    TEST_ASSERT_EQUAL_STRING("I'll open chrome now...", spoken[0].c_str());
    // Analyzer failure plus at least one recognizer failure
    TEST_ASSERT_TRUE(rig.stats().component_errors >= 2);
    TEST_ASSERT_TRUE(rig.ctl.isListening());
    rig.ctl.stop();
}

void test_throwing_callback_keeps_loops_alive()
{
    Rig rig(quietConfig());

    std::mutex mtx;
    std::vector<std::string> intents;
    std::vector<std::string> responses;
    rig.ctl.setCallbacks(
        [](const speech::Transcription&) { throw std::runtime_error("bad handler"); },
        [&](const std::string& text) {
            std::lock_guard<std::mutex> lk(mtx);
            responses.push_back(text);
        },
        [&](const speech::Intent& intent) {
            {
                std::lock_guard<std::mutex> lk(mtx);
                intents.push_back(speech::actionName(intent.action));
            }
            throw 42;  // not a std::exception
        },
        nullptr);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));
    rig.stt->inject(fake::makeFinal("screenshot"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 2; }, 3000));
    rig.ctl.stop();

    std::lock_guard<std::mutex> lk(mtx);
    TEST_ASSERT_EQUAL(2, intents.size());
    TEST_ASSERT_EQUAL_STRING("open", intents[0].c_str());
    TEST_ASSERT_EQUAL_STRING("screenshot", intents[1].c_str());
    TEST_ASSERT_EQUAL(2, responses.size());
    TEST_ASSERT_EQUAL_STRING("Taking a screenshot...", responses[1].c_str());
}

void test_analyzer_sees_bounded_context()
{
    DuplexConfig cfg = quietConfig();
    cfg.context_window = 2;
    Rig rig(cfg, 100);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    rig.stt->inject(fake::makeFinal("open a"));
    rig.stt->inject(fake::makeFinal("open b"));
    rig.stt->inject(fake::makeFinal("open c"));
    rig.stt->inject(fake::makeFinal("open d"));

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_enqueued >= 4; }, 3000));
    const std::vector<size_t> sizes = rig.nlu->contextSizes();
    TEST_ASSERT_EQUAL(0, sizes[0]);
    TEST_ASSERT_EQUAL(1, sizes[1]);
    TEST_ASSERT_EQUAL(2, sizes[2]);
    TEST_ASSERT_EQUAL(2, sizes[3]);

    rig.ctl.clearContext();
    rig.stt->inject(fake::makeFinal("open e"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.nlu->contextSizes().size() >= 5; }, 3000));
    TEST_ASSERT_EQUAL(0, rig.nlu->contextSizes()[4]);
    rig.ctl.stop();
}

void test_each_subscriber_gets_every_event()
{
    Rig rig(quietConfig());
    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    auto first = rig.ctl.getEvents();
    auto second = rig.ctl.getEvents();

    rig.stt->inject(fake::makeFinal("hello"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));

    const auto a = drain(*first);
    const auto b = drain(*second);
    TEST_ASSERT_EQUAL(a.size(), b.size());
    TEST_ASSERT_EQUAL(1, ofType(a, EventType::TRANSCRIPTION).size());
    TEST_ASSERT_EQUAL(1, ofType(b, EventType::RESPONSE).size());
    TEST_ASSERT_EQUAL_STRING("I understand. How can I help?",
                             ofType(b, EventType::RESPONSE)[0].text.c_str());
    TEST_ASSERT_EQUAL(0, rig.stats().dropped_events);
    rig.ctl.stop();

    TEST_ASSERT_TRUE(first->isClosed());
    TEST_ASSERT_TRUE(second->isClosed());
}

void test_start_rejects_sample_rate_mismatch()
{
    DuplexConfig cfg = quietConfig();
    cfg.sample_rate = 8000;   // fakes run at 16 kHz
    Rig rig(cfg);

    TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, rig.start());
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
    TEST_ASSERT_EQUAL(0, rig.in_log->starts.load());
    TEST_ASSERT_EQUAL(0, rig.stt->begun.load());
}

void test_stop_unblocks_a_stuck_mic()
{
    Rig rig(quietConfig());

    TEST_ASSERT_EQUAL(ESP_OK, rig.ctl.start(std::make_unique<fake::BlockingInput>(rig.in_log),
                                            std::make_unique<fake::RecordingOutput>(rig.out_log)));
    sleepMs(100);

    const int64_t t0 = fake::nowMs();
    rig.ctl.stop();
    const int64_t took = fake::nowMs() - t0;

    // Listen task saw the closed mic instead of being force-deleted at the deadline
    TEST_ASSERT_TRUE(took < 300);
    TEST_ASSERT_EQUAL(1, rig.in_log->stops.load());
    TEST_ASSERT_EQUAL(DuplexState::IDLE, rig.ctl.state());
}

void test_event_stream_outside_session_is_closed()
{
    auto rig = std::make_unique<Rig>(quietConfig());

    auto before = rig->ctl.getEvents();
    TEST_ASSERT_TRUE(before->isClosed());

    TEST_ASSERT_EQUAL(ESP_OK, rig->start());
    auto during = rig->ctl.getEvents();
    TEST_ASSERT_FALSE(during->isClosed());

    rig->ctl.stop();
    TEST_ASSERT_TRUE(during->isClosed());

    auto after = rig->ctl.getEvents();
    TEST_ASSERT_TRUE(after->isClosed());
    DuplexEvent ev;
    TEST_ASSERT_FALSE(after->next(ev, 10));

    // Destroying a running controller ends its streams too
    TEST_ASSERT_EQUAL(ESP_OK, rig->start());
    auto orphan = rig->ctl.getEvents();
    TEST_ASSERT_FALSE(orphan->isClosed());
    rig.reset();
    TEST_ASSERT_TRUE(orphan->isClosed());
}

void test_vietnamese_session_answers_in_vietnamese()
{
    DuplexConfig cfg = quietConfig();
    cfg.language = "vi";
    Rig rig(cfg);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());

    // Recognizer tags its guess as English; the session language still decides
    speech::Transcription t = fake::makeFinal("open chrome");
    t.language = "en";
    rig.stt->inject(t);

    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));
    const std::vector<std::string> spoken = rig.tts->spoken();
    TEST_ASSERT_EQUAL(1, spoken.size());
    TEST_ASSERT_EQUAL_STRING("Tôi sẽ mở chrome ngay...", spoken[0].c_str());
    rig.ctl.stop();
}

void test_timing_tracks_both_speakers()
{
    Rig rig(quietConfig());

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    DuplexController::Timing tm = rig.ctl.getTiming();
    TEST_ASSERT_TRUE(tm.last_user_speech_us == DuplexController::kNever);
    TEST_ASSERT_TRUE(tm.last_assistant_speech_us == DuplexController::kNever);
    TEST_ASSERT_TRUE(tm.last_backchannel_us == DuplexController::kNever);

    const int64_t t0_us = fake::nowMs() * 1000;
    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.stats().responses_completed >= 1; }, 3000));

    tm = rig.ctl.getTiming();
    TEST_ASSERT_TRUE(tm.last_user_speech_us >= t0_us);
    TEST_ASSERT_TRUE(tm.last_assistant_speech_us > tm.last_user_speech_us);
    TEST_ASSERT_TRUE(tm.last_backchannel_us == DuplexController::kNever);  // disabled
    rig.ctl.stop();
}

void test_no_backchannel_while_assistant_holds_turn()
{
    DuplexConfig cfg;
    cfg.backchannel_interval = 0.5f;
    cfg.allow_interruptions = false;
    cfg.event_queue_depth = 128;
    Rig rig(cfg, 3000);

    TEST_ASSERT_EQUAL(ESP_OK, rig.start());
    rig.stt->inject(fake::makeFinal("open chrome"));
    TEST_ASSERT_TRUE(fake::waitFor([&] { return rig.ctl.isSpeaking(); }, 2000));
    sleepMs(20);

    auto events = rig.ctl.getEvents();
    const uint32_t before = rig.stats().backchannels;

    // User keeps talking over the response: turn is OVERLAP, never USER
    rig.stt->talkFor(2000, 100);
    sleepMs(2100);

    TEST_ASSERT_EQUAL(DuplexState::DUPLEX, rig.ctl.state());
    TEST_ASSERT_EQUAL(TurnState::OVERLAP, rig.ctl.turn());

    const auto all = drain(*events);
    TEST_ASSERT_TRUE(ofType(all, EventType::TRANSCRIPTION).size() >= 10);
    TEST_ASSERT_EQUAL(0, ofType(all, EventType::BACKCHANNEL).size());
    TEST_ASSERT_EQUAL(before, rig.stats().backchannels);
    rig.ctl.stop();
}

extern "C" void app_main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_start_without_components_is_rejected);
    RUN_TEST(test_start_without_audio_endpoint_is_rejected);
    RUN_TEST(test_start_then_stop);
    RUN_TEST(test_recognizer_refusal_aborts_start);
    RUN_TEST(test_partials_then_final_give_one_response);
    RUN_TEST(test_responses_are_spoken_in_order);
    RUN_TEST(test_state_subscriber_follows_the_turn);
    RUN_TEST(test_user_speech_interrupts_long_response);
    RUN_TEST(test_interruptions_disabled_lets_response_finish);
    RUN_TEST(test_synthesis_failure_returns_to_listening);
    RUN_TEST(test_backchannels_are_rate_limited);
    RUN_TEST(test_no_backchannel_without_recent_speech);
    RUN_TEST(test_stop_while_speaking);
    RUN_TEST(test_component_errors_do_not_end_session);
    RUN_TEST(test_throwing_callback_keeps_loops_alive);
    RUN_TEST(test_analyzer_sees_bounded_context);
    RUN_TEST(test_each_subscriber_gets_every_event);
    RUN_TEST(test_start_rejects_sample_rate_mismatch);
    RUN_TEST(test_stop_unblocks_a_stuck_mic);
    RUN_TEST(test_event_stream_outside_session_is_closed);
    RUN_TEST(test_vietnamese_session_answers_in_vietnamese);
    RUN_TEST(test_timing_tracks_both_speakers);
    RUN_TEST(test_no_backchannel_while_assistant_holds_turn);
    UNITY_END();
}
