#pragma once

#include <treepatch/core/Error.hpp>
#include <treepatch/events/Trigger.hpp>
#include <treepatch/utils/PopFrontVector.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace TP::Events {

/**
 * Unbounded FIFO between native dispatch and the scheduler.
 *
 * Any number of producers may send from any thread; send never waits for the
 * consumer. receive() suspends the consumer until a trigger arrives or the
 * channel is closed, and has no internal timeout. Triggers are delivered in
 * send order without coalescing.
 */
class TriggerChannel {
public:
    TriggerChannel() = default;

    TriggerChannel(TriggerChannel const&)            = delete;
    TriggerChannel& operator=(TriggerChannel const&) = delete;

    auto send(EventTrigger trigger) -> Expected<void>;

    // Empty once the channel is closed and drained.
    [[nodiscard]] auto receive() -> std::optional<EventTrigger>;
    [[nodiscard]] auto tryReceive() -> std::optional<EventTrigger>;

    // Wakes every waiting receiver; triggers already queued stay receivable.
    auto close() -> void;

    [[nodiscard]] auto closed() const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex           mutex;
    std::condition_variable      cv;
    PopFrontVector<EventTrigger> queue;
    bool                         isClosed = false;
};

} // namespace TP::Events
