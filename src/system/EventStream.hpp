#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#include "DuplexTypes.hpp"

/**
 * EventStream
 * ============================================================================
 * - Một subscriber = một EventStream (FIFO riêng, có giới hạn)
 * - Loop task push() KHÔNG bao giờ block: đầy thì bỏ event cũ nhất
 * - close() khi phiên dừng: bỏ event còn lại, next() trả false ngay
 *
 * Items are heap DuplexEvent*; the queue owns whatever it holds.
 */
class EventStream {
public:
    explicit EventStream(size_t depth);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// False if the underlying queue could not be allocated
    bool valid() const { return queue != nullptr; }

    /**
     * Wait for the next event.
     * @return true with `out` filled; false on timeout or once closed
     */
    bool next(duplex::DuplexEvent& out, uint32_t timeout_ms);

    bool isClosed() const { return closed.load(); }

    /// Events dropped because this subscriber fell behind
    uint32_t droppedCount() const { return dropped.load(); }

    // ---- Producer side (DuplexController) ----
    /// Returns false if closed
    bool push(const duplex::DuplexEvent& ev);

    /// Discard pending items and wake a blocked reader
    void close();

private:
    void drain();

    QueueHandle_t queue = nullptr;
    std::mutex push_mtx;            // producers are several loop tasks
    std::atomic<bool> closed{false};
    std::atomic<uint32_t> dropped{0};
};
