#include "DuplexController.hpp"

#include "AudioInput.hpp"
#include "AudioOutput.hpp"
#include "SpeechRecognizer.hpp"
#include "SpeechSynthesizer.hpp"
#include "IntentAnalyzer.hpp"
#include "config/DuplexProfile.hpp"
#include "system/EventStream.hpp"
#include "system/ResponseGenerator.hpp"

#include "esp_log.h"
#include "esp_timer.h"

#include <exception>
#include <utility>

static const char *TAG = "DuplexController";

using duplex::DuplexState;
using duplex::EventType;
using duplex::TurnState;

namespace {

// task_events bits
constexpr EventBits_t LISTEN_EXITED      = BIT0;
constexpr EventBits_t PROCESS_EXITED     = BIT1;
constexpr EventBits_t SPEAK_EXITED       = BIT2;
constexpr EventBits_t MONITOR_EXITED     = BIT3;
constexpr EventBits_t BACKCHANNEL_IDLE   = BIT4;
constexpr EventBits_t ALL_TASKS_EXITED   = LISTEN_EXITED | PROCESS_EXITED | SPEAK_EXITED |
                                           MONITOR_EXITED | BACKCHANNEL_IDLE;

constexpr uint32_t YIELD_MS = 10;

inline int64_t nowUs()
{
    return esp_timer_get_time();
}

inline int64_t secondsToUs(float s)
{
    return static_cast<int64_t>(static_cast<double>(s) * 1000000.0);
}

struct BackchannelJob {
    DuplexController* self;
    std::string phrase;
    std::string language;
};

} // namespace

// ============================================================================
// Callback guard
// ============================================================================
template <typename Fn>
void DuplexController::invokeCallback(const char *name, Fn &&fn)
{
    // A faulty application callback must not take its task down
    try
    {
        fn();
    }
    catch (const std::exception &e)
    {
        ESP_LOGE(TAG, "%s callback threw: %s", name, e.what());
    }
    catch (...)
    {
        ESP_LOGE(TAG, "%s callback threw a non-std exception", name);
    }
}

// ============================================================================
// Constructor / Destructor
// ============================================================================
DuplexController::DuplexController(const DuplexConfig& cfg)
    : config_(DuplexProfile::sanitize(cfg)),
      interruption_threshold_us(secondsToUs(config_.interruption_threshold)),
      backchannel_interval_us(secondsToUs(config_.backchannel_interval)),
      backchannel_freshness_us(secondsToUs(config_.backchannel_freshness)),
      responder(std::make_unique<TemplateResponseGenerator>())
{
}

DuplexController::~DuplexController()
{
    stop();
    closeStreams();
}

// ============================================================================
// Dependency injection
// ============================================================================
void DuplexController::setComponents(std::unique_ptr<SpeechRecognizer> stt,
                                     std::unique_ptr<SpeechSynthesizer> tts,
                                     std::unique_ptr<IntentAnalyzer> intentAnalyzer)
{
    if (started.load())
    {
        ESP_LOGW(TAG, "setComponents called after start; ignoring");
        return;
    }

    recognizer = std::move(stt);
    synthesizer = std::move(tts);
    analyzer = std::move(intentAnalyzer);
}

void DuplexController::setResponseGenerator(std::unique_ptr<ResponseGenerator> gen)
{
    if (started.load())
    {
        ESP_LOGW(TAG, "setResponseGenerator called after start; ignoring");
        return;
    }
    if (gen)
        responder = std::move(gen);
}

void DuplexController::setCallbacks(TranscriptionCb onTranscription,
                                    ResponseCb onResponse,
                                    IntentCb onIntent,
                                    InterruptionCb onInterruption)
{
    std::lock_guard<std::mutex> lk(cb_mtx);
    on_transcription_cb = std::move(onTranscription);
    on_response_cb = std::move(onResponse);
    on_intent_cb = std::move(onIntent);
    on_interruption_cb = std::move(onInterruption);
}

// ============================================================================
// Start / Stop
// ============================================================================
esp_err_t DuplexController::start(std::unique_ptr<AudioInput> in, std::unique_ptr<AudioOutput> out)
{
    if (!recognizer || !synthesizer || !analyzer)
    {
        ESP_LOGE(TAG, "start() before setComponents (stt=%d tts=%d intent=%d)",
                 recognizer != nullptr, synthesizer != nullptr, analyzer != nullptr);
        return ESP_ERR_INVALID_STATE;
    }
    if (!in || !out)
    {
        ESP_LOGE(TAG, "start() needs both audio input and output");
        return ESP_ERR_INVALID_ARG;
    }
    if (in->sampleRate() != config_.sample_rate || out->sampleRate() != config_.sample_rate)
    {
        ESP_LOGE(TAG, "Sample rate mismatch: config=%u in=%u out=%u",
                 static_cast<unsigned>(config_.sample_rate),
                 static_cast<unsigned>(in->sampleRate()),
                 static_cast<unsigned>(out->sampleRate()));
        return ESP_ERR_INVALID_ARG;
    }
    if (started.exchange(true))
    {
        ESP_LOGW(TAG, "DuplexController already started");
        return ESP_ERR_INVALID_STATE;
    }

    ESP_LOGI(TAG, "start() lang=%s rate=%u interrupt=%d(%.2fs) backchannel=%d(%.2fs)",
             config_.language.c_str(), static_cast<unsigned>(config_.sample_rate),
             config_.allow_interruptions, config_.interruption_threshold,
             config_.enable_backchannels, config_.backchannel_interval);

    input = std::move(in);
    output = std::move(out);

    // -------------------------------
    // Fresh session state
    // -------------------------------
    last_user_speech_us = kNever;
    last_assistant_speech_us = kNever;
    last_backchannel_us = kNever;
    backchannel_index = 0;
    backchannel_busy = false;
    clearContext();

    counters.transcriptions = 0;
    counters.final_transcriptions = 0;
    counters.responses_enqueued = 0;
    counters.responses_completed = 0;
    counters.interruptions = 0;
    counters.synthesis_failures = 0;
    counters.backchannels = 0;
    counters.component_errors = 0;
    counters.dropped_events = 0;

    // -------------------------------
    // Queues + task bookkeeping
    // -------------------------------
    transcription_queue = xQueueCreate(config_.queue_depth, sizeof(speech::Transcription*));
    response_queue = xQueueCreate(config_.queue_depth, sizeof(PendingResponse*));
    task_events = xEventGroupCreate();

    if (!transcription_queue || !response_queue || !task_events)
    {
        ESP_LOGE(TAG, "Failed to create queues");
        releaseSession();
        return ESP_ERR_NO_MEM;
    }
    xEventGroupSetBits(task_events, BACKCHANNEL_IDLE);

    // -------------------------------
    // External components
    // -------------------------------
    esp_err_t err = recognizer->beginStream(config_.sample_rate, config_.language);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "Recognizer beginStream failed: %s", esp_err_to_name(err));
        releaseSession();
        return err;
    }

    if (!input->startCapture())
    {
        ESP_LOGE(TAG, "Audio input refused to start");
        recognizer->cancelStream();
        releaseSession();
        return ESP_FAIL;
    }

    if (!output->startPlayback())
    {
        ESP_LOGE(TAG, "Audio output refused to start");
        input->stopCapture();
        recognizer->cancelStream();
        releaseSession();
        return ESP_FAIL;
    }

    // -------------------------------
    // Tasks (state first so Listen never sees IDLE)
    // -------------------------------
    running = true;
    sm.startSession();

    bool ok = spawnTask(config_.listen_task, &DuplexController::listenTaskEntry, this, &listen_task);
    ok = ok && spawnTask(config_.process_task, &DuplexController::processTaskEntry, this, &process_task);
    ok = ok && spawnTask(config_.speak_task, &DuplexController::speakTaskEntry, this, &speak_task);
    ok = ok && spawnTask(config_.monitor_task, &DuplexController::monitorTaskEntry, this, &monitor_task);

    if (!ok)
    {
        ESP_LOGE(TAG, "Failed to create duplex tasks");
        // Tasks that never started count as exited
        if (!listen_task)  xEventGroupSetBits(task_events, LISTEN_EXITED);
        if (!process_task) xEventGroupSetBits(task_events, PROCESS_EXITED);
        if (!speak_task)   xEventGroupSetBits(task_events, SPEAK_EXITED);
        if (!monitor_task) xEventGroupSetBits(task_events, MONITOR_EXITED);
        stop();
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGI(TAG, "DuplexController started");
    return ESP_OK;
}

bool DuplexController::spawnTask(const DuplexConfig::TaskParams& params, TaskFunction_t entry,
                                 void* arg, TaskHandle_t* handle)
{
    BaseType_t core = params.core < 0 ? tskNO_AFFINITY : static_cast<BaseType_t>(params.core);
    BaseType_t res = xTaskCreatePinnedToCore(
        entry,
        params.name,
        params.stack_size,
        arg,
        static_cast<UBaseType_t>(params.priority),
        handle,
        core);

    if (res != pdPASS)
    {
        ESP_LOGE(TAG, "Failed to create %s", params.name);
        *handle = nullptr;
        return false;
    }
    return true;
}

void DuplexController::stop()
{
    if (!started.load())
        return;

    ESP_LOGW(TAG, "stop()");

    running = false;

    // Unblock tasks sitting inside component calls
    if (input)
        input->stopCapture();
    if (recognizer)
        recognizer->cancelStream();
    if (synthesizer)
        synthesizer->stop();

    // ✅ Tasks exit themselves after seeing `running == false` (≤ one poll interval)
    if (task_events)
    {
        EventBits_t bits = xEventGroupWaitBits(
            task_events,
            ALL_TASKS_EXITED,
            pdFALSE,                                  // keep bits
            pdTRUE,                                   // wait for all
            pdMS_TO_TICKS(config_.shutdown_timeout_ms));

        auto forceDelete = [&](TaskHandle_t &th, EventBits_t bit, const char *name)
        {
            if (th && !(bits & bit))
            {
                ESP_LOGW(TAG, "%s did not exit; force deleting", name);
                vTaskDelete(th);
            }
            th = nullptr;
        };

        forceDelete(listen_task, LISTEN_EXITED, config_.listen_task.name);
        forceDelete(process_task, PROCESS_EXITED, config_.process_task.name);
        forceDelete(speak_task, SPEAK_EXITED, config_.speak_task.name);
        forceDelete(monitor_task, MONITOR_EXITED, config_.monitor_task.name);
        forceDelete(backchannel_task, BACKCHANNEL_IDLE, config_.backchannel_task.name);
    }

    sm.stopSession();

    // Nothing emits any more; subscribers see end of stream
    closeStreams();

    if (output)
    {
        std::lock_guard<std::mutex> lk(output_mtx);
        output->stopPlayback();
    }

    releaseSession();

    const Stats st = getStats();
    ESP_LOGI(TAG, "DuplexController stopped (finals=%u responses=%u/%u interruptions=%u backchannels=%u errors=%u)",
             static_cast<unsigned>(st.final_transcriptions),
             static_cast<unsigned>(st.responses_completed),
             static_cast<unsigned>(st.responses_enqueued),
             static_cast<unsigned>(st.interruptions),
             static_cast<unsigned>(st.backchannels),
             static_cast<unsigned>(st.component_errors));

    started = false;
}

void DuplexController::releaseSession()
{
    if (transcription_queue)
    {
        speech::Transcription *t = nullptr;
        while (xQueueReceive(transcription_queue, &t, 0) == pdTRUE)
            delete t;
        vQueueDelete(transcription_queue);
        transcription_queue = nullptr;
    }

    if (response_queue)
    {
        PendingResponse *r = nullptr;
        while (xQueueReceive(response_queue, &r, 0) == pdTRUE)
            delete r;
        vQueueDelete(response_queue);
        response_queue = nullptr;
    }

    if (task_events)
    {
        vEventGroupDelete(task_events);
        task_events = nullptr;
    }

    running = false;
    started = false;
}

// ============================================================================
// Observation
// ============================================================================
std::shared_ptr<EventStream> DuplexController::getEvents()
{
    auto stream = std::make_shared<EventStream>(config_.event_queue_depth);
    if (!stream->valid())
        return stream;  // already closed

    std::lock_guard<std::mutex> lk(streams_mtx);
    if (!running.load())
    {
        // No session: nothing will ever be emitted
        stream->close();
        return stream;
    }
    streams.push_back(stream);
    return stream;
}

int DuplexController::subscribeState(TurnStateMachine::StateCb cb)
{
    return sm.subscribe(std::move(cb));
}

void DuplexController::unsubscribeState(int id)
{
    sm.unsubscribe(id);
}

DuplexState DuplexController::state()
{
    return sm.getState();
}

TurnState DuplexController::turn()
{
    return sm.getTurn();
}

bool DuplexController::isListening()
{
    const DuplexState s = sm.getState();
    return running.load() && (s == DuplexState::LISTENING || s == DuplexState::DUPLEX);
}

bool DuplexController::isSpeaking()
{
    const DuplexState s = sm.getState();
    return s == DuplexState::SPEAKING || s == DuplexState::DUPLEX;
}

DuplexController::Stats DuplexController::getStats() const
{
    Stats st;
    st.transcriptions = counters.transcriptions.load();
    st.final_transcriptions = counters.final_transcriptions.load();
    st.responses_enqueued = counters.responses_enqueued.load();
    st.responses_completed = counters.responses_completed.load();
    st.interruptions = counters.interruptions.load();
    st.synthesis_failures = counters.synthesis_failures.load();
    st.backchannels = counters.backchannels.load();
    st.component_errors = counters.component_errors.load();
    st.dropped_events = counters.dropped_events.load();
    return st;
}

DuplexController::Timing DuplexController::getTiming() const
{
    return Timing{last_user_speech_us.load(), last_assistant_speech_us.load(), last_backchannel_us.load()};
}

void DuplexController::clearContext()
{
    std::lock_guard<std::mutex> lk(context_mtx);
    context.clear();
}

// ============================================================================
// Tasks
// ============================================================================
void DuplexController::listenTaskEntry(void *arg)
{
    static_cast<DuplexController *>(arg)->listenTaskLoop();
}

void DuplexController::processTaskEntry(void *arg)
{
    static_cast<DuplexController *>(arg)->processTaskLoop();
}

void DuplexController::speakTaskEntry(void *arg)
{
    static_cast<DuplexController *>(arg)->speakTaskLoop();
}

void DuplexController::monitorTaskEntry(void *arg)
{
    static_cast<DuplexController *>(arg)->monitorTaskLoop();
}

// ============================================================================
// LISTEN task: AudioInput → recognizer → transcription_queue
// ============================================================================
void DuplexController::listenTaskLoop()
{
    ESP_LOGI(TAG, "Listen task started");

    std::vector<int16_t> pcm(config_.listen_chunk_samples);
    std::vector<speech::Transcription> results;

    while (running)
    {
        try
        {
            size_t samples = input->readPcm(pcm.data(), pcm.size());
            if (samples == 0)
            {
                vTaskDelay(pdMS_TO_TICKS(YIELD_MS)); // Yield when no data
                continue;
            }

            results.clear();
            esp_err_t err = recognizer->feed(pcm.data(), samples, results);
            if (err != ESP_OK)
            {
                // One bad chunk is skipped, the stream keeps going
                counters.component_errors++;
                ESP_LOGW(TAG, "Recognizer failed on chunk (%u samples): %s",
                         static_cast<unsigned>(samples), esp_err_to_name(err));
                continue;
            }

            for (const auto &t : results)
            {
                if (!running)
                    break;
                handleTranscription(t);
            }
        }
        catch (const std::exception &e)
        {
            counters.component_errors++;
            ESP_LOGE(TAG, "Listen task: %s", e.what());
        }
    }

    ESP_LOGW(TAG, "Listen task stopped");
    xEventGroupSetBits(task_events, LISTEN_EXITED);
    vTaskDelete(nullptr);
}

void DuplexController::handleTranscription(const speech::Transcription &t)
{
    const int64_t now = nowUs();
    last_user_speech_us = now;
    counters.transcriptions++;

    // SPEAKING → DUPLEX; LISTENING stays LISTENING
    const DuplexState s = sm.onUserSpeech();
    ESP_LOGD(TAG, "[%s] \"%s\" (%.0f%%) state=%s",
             t.is_final ? "final" : "partial", t.text.c_str(),
             t.confidence * 100.0f, duplex::stateName(s));

    // Blocks up to one poll interval so a busy Process task loses nothing
    auto item = std::make_unique<speech::Transcription>(t);
    speech::Transcription *raw = item.get();
    if (xQueueSend(transcription_queue, &raw, pdMS_TO_TICKS(config_.poll_interval_ms)) == pdTRUE)
        item.release();  // Process task owns it now
    else
        ESP_LOGW(TAG, "transcription_queue full, dropping \"%s\"", t.text.c_str());

    emitEvent(EventType::TRANSCRIPTION, t.text, now, t.is_final);

    TranscriptionCb cb;
    {
        std::lock_guard<std::mutex> lk(cb_mtx);
        cb = on_transcription_cb;
    }
    if (cb)
        invokeCallback("onTranscription", [&] { cb(t); });
}

// ============================================================================
// PROCESS task: final transcription → intent → response_queue
// Single consumer, FIFO: responses keep the order of their transcriptions
// ============================================================================
void DuplexController::processTaskLoop()
{
    ESP_LOGI(TAG, "Process task started");

    while (running)
    {
        speech::Transcription *raw = nullptr;

        // Timeout = normal control flow, lets us see `running`
        if (xQueueReceive(transcription_queue, &raw, pdMS_TO_TICKS(config_.poll_interval_ms)) != pdTRUE)
            continue;

        std::unique_ptr<speech::Transcription> t(raw);
        if (!t->is_final)
            continue;

        try
        {
            handleFinalTranscription(*t);
        }
        catch (const std::exception &e)
        {
            counters.component_errors++;
            ESP_LOGE(TAG, "Process task: %s", e.what());
        }
    }

    ESP_LOGW(TAG, "Process task stopped");
    xEventGroupSetBits(task_events, PROCESS_EXITED);
    vTaskDelete(nullptr);
}

void DuplexController::handleFinalTranscription(const speech::Transcription &t)
{
    counters.final_transcriptions++;

    speech::Intent intent;
    esp_err_t err = analyzer->analyze(t.text, contextSnapshot(), intent);
    if (err != ESP_OK)
    {
        counters.component_errors++;
        ESP_LOGW(TAG, "Intent analysis failed for \"%s\": %s", t.text.c_str(), esp_err_to_name(err));
        return;
    }

    if (intent.raw.empty())
        intent.raw = t.text;

    rememberIntent(intent);
    ESP_LOGI(TAG, "Intent %s target='%s'", speech::actionName(intent.action), intent.target.c_str());

    IntentCb cb;
    {
        std::lock_guard<std::mutex> lk(cb_mtx);
        cb = on_intent_cb;
    }
    if (cb)
        invokeCallback("onIntent", [&] { cb(intent); });

    std::string reply;
    err = responder->generate(intent, config_.language, reply);
    if (err != ESP_OK || reply.empty())
    {
        counters.component_errors++;
        ESP_LOGW(TAG, "Response generation failed: %s", esp_err_to_name(err));
        return;
    }

    auto resp = std::make_unique<PendingResponse>();
    resp->text = reply;
    // Reply language: analyzer's if set, otherwise the session's
    resp->language = TemplateResponseGenerator::resolveLanguage(intent, config_.language);

    ESP_LOGD(TAG, "Queueing response: \"%s\"", resp->text.c_str());

    // Never drop a response: wait for room, but keep watching `running`
    PendingResponse *item = resp.get();
    while (running)
    {
        if (xQueueSend(response_queue, &item, pdMS_TO_TICKS(config_.poll_interval_ms)) == pdTRUE)
        {
            resp.release();  // Speak task owns it now
            counters.responses_enqueued++;
            return;
        }
    }
}

// ============================================================================
// SPEAK task: response_queue → synthesizer → AudioOutput
// ============================================================================
void DuplexController::speakTaskLoop()
{
    ESP_LOGI(TAG, "Speak task started");

    while (running)
    {
        PendingResponse *raw = nullptr;
        if (xQueueReceive(response_queue, &raw, pdMS_TO_TICKS(config_.poll_interval_ms)) != pdTRUE)
            continue;

        std::unique_ptr<PendingResponse> resp(raw);

        // A transcription still in flight wins over flipping to SPEAKING
        while (running && uxQueueMessagesWaiting(transcription_queue) > 0)
            vTaskDelay(pdMS_TO_TICKS(YIELD_MS));
        if (!running)
            break;

        if (!sm.beginResponse())
        {
            ESP_LOGW(TAG, "Cannot speak in state %s; dropping \"%s\"",
                     duplex::stateName(sm.getState()), resp->text.c_str());
            continue;
        }

        try
        {
            playResponse(*resp);
        }
        catch (const std::exception &e)
        {
            ESP_LOGE(TAG, "Speak task: %s", e.what());
            handleSynthesisFailure(resp->text, ESP_FAIL);
        }
    }

    ESP_LOGW(TAG, "Speak task stopped");
    xEventGroupSetBits(task_events, SPEAK_EXITED);
    vTaskDelete(nullptr);
}

void DuplexController::playResponse(const PendingResponse &resp)
{
    ESP_LOGI(TAG, "Speaking: \"%s\"", resp.text.c_str());

    esp_err_t err = synthesizer->beginStream(resp.text, resp.language);
    if (err != ESP_OK)
    {
        handleSynthesisFailure(resp.text, err);
        return;
    }

    speech::AudioChunk chunk;
    size_t chunks_played = 0;

    for (;;)
    {
        chunk.pcm.clear();
        err = synthesizer->nextChunk(chunk, config_.poll_interval_ms);

        // stop() owns the state change and the sink
        if (!running)
            break;

        // Checked before every write, also while the synthesizer is slow
        const int64_t now = nowUs();
        if (interruptionPending(now))
        {
            handleInterruption(resp.text, now);
            return;
        }

        if (err == ESP_ERR_TIMEOUT)
            continue;
        if (err == ESP_ERR_NOT_FOUND)
            break;
        if (err != ESP_OK)
        {
            handleSynthesisFailure(resp.text, err);
            return;
        }

        if (!chunk.pcm.empty())
        {
            std::lock_guard<std::mutex> lk(output_mtx);
            output->writePcm(chunk.pcm.data(), chunk.pcm.size());
        }
        last_assistant_speech_us = nowUs();
        chunks_played++;
    }

    if (!running)
    {
        synthesizer->stop();
        ESP_LOGW(TAG, "Response cut by stop() after %u chunks", static_cast<unsigned>(chunks_played));
        return;
    }

    ESP_LOGD(TAG, "Response finished after %u chunks", static_cast<unsigned>(chunks_played));

    if (!sm.finishResponse())
        return;  // session stopped underneath us

    counters.responses_completed++;
    emitEvent(EventType::RESPONSE, resp.text, nowUs());

    ResponseCb cb;
    {
        std::lock_guard<std::mutex> lk(cb_mtx);
        cb = on_response_cb;
    }
    if (cb)
        invokeCallback("onResponse", [&] { cb(resp.text); });
}

// ============================================================================
// Interruption
// ============================================================================
bool DuplexController::interruptionPending(int64_t now_us)
{
    if (!config_.allow_interruptions)
        return false;
    if (sm.getState() != DuplexState::DUPLEX)
        return false;

    const int64_t last = last_user_speech_us.load();
    return last != kNever && (now_us - last) < interruption_threshold_us;
}

void DuplexController::handleInterruption(const std::string &text, int64_t now_us)
{
    synthesizer->stop();
    flushOutput();

    // Listen task may have raced us; only the winner reports
    if (!sm.interrupt())
        return;

    counters.interruptions++;
    ESP_LOGI(TAG, "Interrupted by user (threshold %.0f ms)", interruption_threshold_us / 1000.0);

    emitEvent(EventType::INTERRUPTION, text, now_us);

    InterruptionCb cb;
    {
        std::lock_guard<std::mutex> lk(cb_mtx);
        cb = on_interruption_cb;
    }
    if (cb)
        invokeCallback("onInterruption", [&] { cb(now_us); });
}

void DuplexController::handleSynthesisFailure(const std::string &text, esp_err_t err)
{
    counters.synthesis_failures++;
    ESP_LOGE(TAG, "Synthesis failed for \"%s\": %s", text.c_str(), esp_err_to_name(err));

    synthesizer->stop();
    flushOutput();

    // Same user-visible outcome as an interruption: back to LISTENING
    if (!sm.finishResponse())
        return;

    const int64_t now = nowUs();
    emitEvent(EventType::INTERRUPTION, text, now);

    InterruptionCb cb;
    {
        std::lock_guard<std::mutex> lk(cb_mtx);
        cb = on_interruption_cb;
    }
    if (cb)
        invokeCallback("onInterruption", [&] { cb(now); });
}

void DuplexController::flushOutput()
{
    std::lock_guard<std::mutex> lk(output_mtx);
    output->stopPlayback();
    if (!output->startPlayback())
        ESP_LOGW(TAG, "Audio output did not restart after flush");
}

// ============================================================================
// MONITOR task: fixed tick, backchannels while the user holds the turn
// ============================================================================
void DuplexController::monitorTaskLoop()
{
    ESP_LOGI(TAG, "Monitor task started");

    TickType_t last_wake = xTaskGetTickCount();
    const TickType_t period = pdMS_TO_TICKS(config_.monitor_tick_ms);

    while (running)
    {
        vTaskDelayUntil(&last_wake, period);
        if (!running)
            break;
        if (!config_.enable_backchannels)
            continue;

        try
        {
            monitorTick(nowUs());
        }
        catch (const std::exception &e)
        {
            ESP_LOGE(TAG, "Monitor task: %s", e.what());
        }
    }

    ESP_LOGW(TAG, "Monitor task stopped");
    xEventGroupSetBits(task_events, MONITOR_EXITED);
    vTaskDelete(nullptr);
}

void DuplexController::monitorTick(int64_t now_us)
{
    const TurnStateMachine::Snapshot snap = sm.snapshot();
    if (snap.state == DuplexState::IDLE || snap.turn != TurnState::USER)
        return;

    const int64_t last_bc = last_backchannel_us.load();
    if (last_bc != kNever && (now_us - last_bc) <= backchannel_interval_us)
        return;

    const int64_t last_user = last_user_speech_us.load();
    if (last_user == kNever || (now_us - last_user) >= backchannel_freshness_us)
        return;

    // Previous phrase still playing; try again next tick
    if (backchannel_busy.load())
        return;

    const std::string phrase =
        TemplateResponseGenerator::backchannelPhrase(config_.language, backchannel_index++);

    last_backchannel_us = now_us;
    counters.backchannels++;
    ESP_LOGD(TAG, "Backchannel \"%s\"", phrase.c_str());

    emitEvent(EventType::BACKCHANNEL, phrase, now_us);
    playBackchannel(phrase, config_.language);
}

void DuplexController::playBackchannel(const std::string &phrase, const std::string &language)
{
    backchannel_busy = true;
    xEventGroupClearBits(task_events, BACKCHANNEL_IDLE);

    auto job = std::make_unique<BackchannelJob>();
    job->self = this;
    job->phrase = phrase;
    job->language = language;
    if (spawnTask(config_.backchannel_task, &DuplexController::backchannelTaskEntry, job.get(), &backchannel_task))
    {
        job.release();  // backchannel task owns it now
    }
    else
    {
        backchannel_busy = false;
        xEventGroupSetBits(task_events, BACKCHANNEL_IDLE);
    }
}

// One-shot task: never touches response_queue, so it cannot delay a response
void DuplexController::backchannelTaskEntry(void *arg)
{
    std::unique_ptr<BackchannelJob> job(static_cast<BackchannelJob *>(arg));
    DuplexController *self = job->self;

    std::vector<int16_t> pcm;
    esp_err_t err = ESP_FAIL;
    try
    {
        err = self->synthesizer->synthesize(job->phrase, job->language, pcm);
    }
    catch (const std::exception &e)
    {
        ESP_LOGE(TAG, "Backchannel synthesis threw: %s", e.what());
    }

    if (err != ESP_OK)
    {
        ESP_LOGW(TAG, "Backchannel synthesis failed: %s", esp_err_to_name(err));
    }
    else if (self->running && !pcm.empty())
    {
        std::lock_guard<std::mutex> lk(self->output_mtx);
        // A response may have started meanwhile; it owns the speaker
        if (self->running && self->sm.getTurn() == TurnState::USER)
            self->output->writePcm(pcm.data(), pcm.size());
    }

    self->backchannel_busy = false;
    xEventGroupSetBits(self->task_events, BACKCHANNEL_IDLE);
    job.reset();
    vTaskDelete(nullptr);
}

// ============================================================================
// Events / callbacks / context
// ============================================================================
void DuplexController::emitEvent(EventType type, const std::string &text, int64_t ts_us, bool is_final)
{
    duplex::DuplexEvent ev;
    ev.type = type;
    ev.text = text;
    ev.is_final = is_final;
    ev.timestamp_us = ts_us;

    ESP_LOGD(TAG, "event %s \"%s\"", duplex::eventName(type), text.c_str());

    // Copy subscribers under lock, push outside
    std::vector<std::shared_ptr<EventStream>> targets;
    {
        std::lock_guard<std::mutex> lk(streams_mtx);
        targets = streams;
    }

    for (auto &s : targets)
    {
        const uint32_t before = s->droppedCount();
        s->push(ev);
        if (s->droppedCount() != before)
            counters.dropped_events++;
    }
}

void DuplexController::closeStreams()
{
    std::vector<std::shared_ptr<EventStream>> targets;
    {
        std::lock_guard<std::mutex> lk(streams_mtx);
        targets.swap(streams);
    }
    for (auto &s : targets)
        s->close();
}

speech::IntentContext DuplexController::contextSnapshot()
{
    std::lock_guard<std::mutex> lk(context_mtx);
    return speech::IntentContext(context.begin(), context.end());
}

void DuplexController::rememberIntent(const speech::Intent &intent)
{
    if (config_.context_window == 0)
        return;

    std::lock_guard<std::mutex> lk(context_mtx);
    context.push_back(intent);
    while (context.size() > config_.context_window)
        context.pop_front();
}
