#include "EventStream.hpp"

#include "esp_log.h"

#include <memory>

using duplex::DuplexEvent;

static const char *TAG = "EventStream";

EventStream::EventStream(size_t depth)
{
    // +1 slot keeps room for the close sentinel
    queue = xQueueCreate(depth + 1, sizeof(DuplexEvent*));
    if (!queue) {
        ESP_LOGE(TAG, "Failed to create event queue (depth=%u)", static_cast<unsigned>(depth));
        closed = true;
    }
}

EventStream::~EventStream()
{
    if (queue) {
        drain();
        vQueueDelete(queue);
        queue = nullptr;
    }
}

bool EventStream::push(const DuplexEvent& ev)
{
    std::lock_guard<std::mutex> lk(push_mtx);
    if (closed.load()) {
        return false;
    }

    // Keep one slot free for the sentinel; drop the oldest when full
    if (uxQueueSpacesAvailable(queue) <= 1) {
        DuplexEvent* oldest = nullptr;
        if (xQueueReceive(queue, &oldest, 0) == pdTRUE) {
            delete oldest;
            dropped++;
            ESP_LOGW(TAG, "Subscriber lagging, dropped oldest event");
        }
    }

    auto item = std::make_unique<DuplexEvent>(ev);
    DuplexEvent* raw = item.get();
    if (xQueueSend(queue, &raw, 0) != pdTRUE) {
        dropped++;
        return false;
    }
    item.release();  // queue owns it now
    return true;
}

bool EventStream::next(DuplexEvent& out, uint32_t timeout_ms)
{
    if (closed.load()) {
        return false;
    }

    DuplexEvent* item = nullptr;
    if (xQueueReceive(queue, &item, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
        return false;
    }

    // nullptr = close sentinel
    if (!item) {
        return false;
    }
    if (closed.load()) {
        delete item;
        return false;
    }

    out = std::move(*item);
    delete item;
    return true;
}

void EventStream::close()
{
    std::lock_guard<std::mutex> lk(push_mtx);
    if (closed.exchange(true) || !queue) {
        return;
    }

    drain();

    DuplexEvent* sentinel = nullptr;
    xQueueSend(queue, &sentinel, 0);
}

void EventStream::drain()
{
    DuplexEvent* item = nullptr;
    while (xQueueReceive(queue, &item, 0) == pdTRUE) {
        delete item;
    }
}
