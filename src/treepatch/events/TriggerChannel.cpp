#include <treepatch/events/TriggerChannel.hpp>

#include "log/TaggedLogger.hpp"

#include <utility>

namespace TP::Events {

auto TriggerChannel::send(EventTrigger trigger) -> Expected<void> {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->isClosed) {
            tp_log("TriggerChannel::send refused: channel closed", "TriggerChannel", "WARN");
            return std::unexpected(Error{Error::Code::ChannelClosed, "trigger channel is closed"});
        }
        this->queue.push_back(std::move(trigger));
    }
    this->cv.notify_one();
    return {};
}

auto TriggerChannel::receive() -> std::optional<EventTrigger> {
    std::unique_lock<std::mutex> lock(this->mutex);
    this->cv.wait(lock, [this] { return !this->queue.isEmpty() || this->isClosed; });
    if (this->queue.isEmpty()) {
        return std::nullopt;
    }
    return this->queue.take_front();
}

auto TriggerChannel::tryReceive() -> std::optional<EventTrigger> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->queue.isEmpty()) {
        return std::nullopt;
    }
    return this->queue.take_front();
}

auto TriggerChannel::close() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->isClosed = true;
    }
    this->cv.notify_all();
}

auto TriggerChannel::closed() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->isClosed;
}

auto TriggerChannel::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->queue.size();
}

} // namespace TP::Events
