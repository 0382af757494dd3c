#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "TransferEvent.hpp"

// Ordered one-way stream from the engine's worker to whichever front end drains it
class EventChannel
{
public:
    EventChannel() = default;

    // Non-copyable
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Dropped silently once the channel is closed
    void Push(TransferEvent Event);

    // Blocks until an event arrives; std::nullopt once closed and drained
    std::optional<TransferEvent> WaitPop();
    std::optional<TransferEvent> TryPop();

    void Close();
    bool IsClosed();

private:
    std::queue<TransferEvent> Events;
    std::mutex ChannelMutex;
    std::condition_variable ChannelCV;
    bool Closed = false;
};
