#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/queue.h"
#include "freertos/event_groups.h"

#include "esp_err.h"

#include "SpeechTypes.hpp"
#include "config/DuplexConfig.hpp"
#include "system/DuplexTypes.hpp"
#include "system/TurnStateMachine.hpp"

// Forward declarations
class AudioInput;
class AudioOutput;
class SpeechRecognizer;
class SpeechSynthesizer;
class IntentAnalyzer;
class ResponseGenerator;
class EventStream;

/**
 * DuplexController
 * ============================================================================
 * - Nghe liên tục KỂ CẢ khi đang nói (full-duplex)
 * - 4 FreeRTOS task chạy song song suốt phiên:
 *
 *     AudioInput → [Listen] → transcription_queue → [Process]
 *                                 → response_queue → [Speak] → AudioOutput
 *     [Monitor] tick 100 ms → backchannel ("uh-huh")
 *
 * - DuplexState/TurnState chỉ thay đổi qua TurnStateMachine (một mutex)
 * - Mọi task đều có thể emit DuplexEvent ra EventStream của subscriber
 * - KHÔNG nhận dạng / tổng hợp giọng nói, KHÔNG NLU (component bên ngoài)
 *
 * Lifecycle:
 *   setComponents() → start(in, out) ... stop()
 * start() returns once the tasks run; the session lasts until stop().
 * stop() blocks until every task has exited, so no audio is written after
 * it returns.
 */
class DuplexController {
public:
    // Callbacks run on the owning task and must not block
    using TranscriptionCb = std::function<void(const speech::Transcription&)>;
    using ResponseCb = std::function<void(const std::string&)>;
    using IntentCb = std::function<void(const speech::Intent&)>;
    using InterruptionCb = std::function<void(int64_t timestamp_us)>;

    struct Stats {
        uint32_t transcriptions = 0;        // partial + final
        uint32_t final_transcriptions = 0;
        uint32_t responses_enqueued = 0;
        uint32_t responses_completed = 0;
        uint32_t interruptions = 0;
        uint32_t synthesis_failures = 0;
        uint32_t backchannels = 0;
        uint32_t component_errors = 0;      // recovered recognizer/analyzer/generator errors
        uint32_t dropped_events = 0;
    };

    // esp_timer_get_time() values; kNever until first written
    struct Timing {
        int64_t last_user_speech_us;
        int64_t last_assistant_speech_us;
        int64_t last_backchannel_us;
    };

    static constexpr int64_t kNever = INT64_MIN;

    explicit DuplexController(const DuplexConfig& cfg = DuplexConfig{});
    ~DuplexController();

    DuplexController(const DuplexController&) = delete;
    DuplexController& operator=(const DuplexController&) = delete;

    // ------------------------------------------------------------------------
    // Dependency injection (before start)
    // ------------------------------------------------------------------------
    void setComponents(std::unique_ptr<SpeechRecognizer> stt,
                       std::unique_ptr<SpeechSynthesizer> tts,
                       std::unique_ptr<IntentAnalyzer> intentAnalyzer);

    /// Optional. TemplateResponseGenerator is used when none is set.
    void setResponseGenerator(std::unique_ptr<ResponseGenerator> gen);

    void setCallbacks(TranscriptionCb onTranscription,
                      ResponseCb onResponse,
                      IntentCb onIntent,
                      InterruptionCb onInterruption);

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------
    /**
     * Start a session: create queues, spawn the four tasks, IDLE → LISTENING.
     * @return ESP_OK
     *         ESP_ERR_INVALID_STATE  components missing or already started
     *         ESP_ERR_INVALID_ARG    null audio endpoint
     *         ESP_ERR_NO_MEM         queue/task allocation failed
     *         other                  recognizer/audio refused to start
     */
    esp_err_t start(std::unique_ptr<AudioInput> in, std::unique_ptr<AudioOutput> out);

    /// Cancel all tasks and wait for them. Safe to call multiple times.
    void stop();

    // ------------------------------------------------------------------------
    // Observation
    // ------------------------------------------------------------------------
    /// New independent event stream; closed when the session stops
    std::shared_ptr<EventStream> getEvents();

    int subscribeState(TurnStateMachine::StateCb cb);
    void unsubscribeState(int id);

    duplex::DuplexState state();
    duplex::TurnState turn();
    bool isListening();
    bool isSpeaking();
    bool isRunning() const { return running.load(); }

    Stats getStats() const;
    Timing getTiming() const;
    const DuplexConfig& config() const { return config_; }

    /// Forget the intents handed to the analyzer as context
    void clearContext();

private:
    // Heap item on response_queue, owned by whoever holds it
    struct PendingResponse {
        std::string text;
        std::string language;
    };

    // ------------------------------------------------------------------------
    // Tasks
    // ------------------------------------------------------------------------
    static void listenTaskEntry(void* arg);
    static void processTaskEntry(void* arg);
    static void speakTaskEntry(void* arg);
    static void monitorTaskEntry(void* arg);
    static void backchannelTaskEntry(void* arg);

    void listenTaskLoop();
    void processTaskLoop();
    void speakTaskLoop();
    void monitorTaskLoop();

    bool spawnTask(const DuplexConfig::TaskParams& params, TaskFunction_t entry,
                   void* arg, TaskHandle_t* handle);

    // ------------------------------------------------------------------------
    // Loop bodies
    // ------------------------------------------------------------------------
    void handleTranscription(const speech::Transcription& t);
    void handleFinalTranscription(const speech::Transcription& t);
    void playResponse(const PendingResponse& resp);
    void monitorTick(int64_t now_us);
    void playBackchannel(const std::string& phrase, const std::string& language);

    bool interruptionPending(int64_t now_us);
    void handleInterruption(const std::string& text, int64_t now_us);
    void handleSynthesisFailure(const std::string& text, esp_err_t err);
    void flushOutput();

    // ------------------------------------------------------------------------
    // Plumbing
    // ------------------------------------------------------------------------
    void emitEvent(duplex::EventType type, const std::string& text, int64_t ts_us,
                   bool is_final = false);
    void closeStreams();
    speech::IntentContext contextSnapshot();
    void rememberIntent(const speech::Intent& intent);
    void releaseSession();

    template <typename Fn>
    void invokeCallback(const char* name, Fn&& fn);

private:
    // ------------------------------------------------------------------------
    // Config
    // ------------------------------------------------------------------------
    const DuplexConfig config_;
    const int64_t interruption_threshold_us;
    const int64_t backchannel_interval_us;
    const int64_t backchannel_freshness_us;

    // ------------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------------
    TurnStateMachine sm;
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::atomic<bool> backchannel_busy{false};

    // single writer, many readers
    std::atomic<int64_t> last_user_speech_us{kNever};
    std::atomic<int64_t> last_assistant_speech_us{kNever};
    std::atomic<int64_t> last_backchannel_us{kNever};

    size_t backchannel_index = 0;   // Monitor task only

    // ------------------------------------------------------------------------
    // Components
    // ------------------------------------------------------------------------
    std::unique_ptr<SpeechRecognizer>  recognizer;
    std::unique_ptr<SpeechSynthesizer> synthesizer;
    std::unique_ptr<IntentAnalyzer>    analyzer;
    std::unique_ptr<ResponseGenerator> responder;
    std::unique_ptr<AudioInput>  input;
    std::unique_ptr<AudioOutput> output;

    std::mutex output_mtx;          // Speak task + backchannel task write the sink

    // ------------------------------------------------------------------------
    // Callbacks
    // ------------------------------------------------------------------------
    std::mutex cb_mtx;
    TranscriptionCb on_transcription_cb = nullptr;
    ResponseCb on_response_cb = nullptr;
    IntentCb on_intent_cb = nullptr;
    InterruptionCb on_interruption_cb = nullptr;

    // ------------------------------------------------------------------------
    // Event subscribers
    // ------------------------------------------------------------------------
    std::mutex streams_mtx;
    std::vector<std::shared_ptr<EventStream>> streams;

    // ------------------------------------------------------------------------
    // Intent context (Process task writes, clearContext may reset)
    // ------------------------------------------------------------------------
    std::mutex context_mtx;
    std::deque<speech::Intent> context;

    // ------------------------------------------------------------------------
    // Counters
    // ------------------------------------------------------------------------
    struct Counters {
        std::atomic<uint32_t> transcriptions{0};
        std::atomic<uint32_t> final_transcriptions{0};
        std::atomic<uint32_t> responses_enqueued{0};
        std::atomic<uint32_t> responses_completed{0};
        std::atomic<uint32_t> interruptions{0};
        std::atomic<uint32_t> synthesis_failures{0};
        std::atomic<uint32_t> backchannels{0};
        std::atomic<uint32_t> component_errors{0};
        std::atomic<uint32_t> dropped_events{0};
    } counters;

    // ------------------------------------------------------------------------
    // Queues (FreeRTOS, items are heap pointers owned by the consumer)
    // ------------------------------------------------------------------------
    QueueHandle_t transcription_queue = nullptr;   // speech::Transcription*
    QueueHandle_t response_queue = nullptr;        // PendingResponse*

    // ------------------------------------------------------------------------
    // Tasks
    // ------------------------------------------------------------------------
    TaskHandle_t listen_task = nullptr;
    TaskHandle_t process_task = nullptr;
    TaskHandle_t speak_task = nullptr;
    TaskHandle_t monitor_task = nullptr;
    TaskHandle_t backchannel_task = nullptr;

    // Each task sets its bit right before vTaskDelete(nullptr)
    EventGroupHandle_t task_events = nullptr;
};
