#include "EventChannel.hpp"

TransferEvent TransferEvent::MakeProgress(size_t Done, size_t Total, const std::string& CurrentFile)
{
    TransferEvent Event;
    Event.Kind = EventKind::Progress;
    Event.Done = Done;
    Event.Total = Total;
    Event.CurrentFile = CurrentFile;
    return Event;
}

TransferEvent TransferEvent::MakeFinished(const TransferOutcome& Outcome)
{
    TransferEvent Event;
    Event.Kind = EventKind::Finished;
    Event.Outcome = Outcome;
    return Event;
}

TransferEvent TransferEvent::MakeCancelled(const TransferOutcome& Outcome)
{
    TransferEvent Event;
    Event.Kind = EventKind::Cancelled;
    Event.Outcome = Outcome;
    return Event;
}

TransferEvent TransferEvent::MakeFatalError(const std::string& Message)
{
    TransferEvent Event;
    Event.Kind = EventKind::FatalError;
    Event.Message = Message;
    return Event;
}

void EventChannel::Push(TransferEvent Event)
{
    {
        std::lock_guard<std::mutex> lock(ChannelMutex);
        if (Closed)
        {
            return;
        }
        Events.push(std::move(Event));
    }
    ChannelCV.notify_one();
}

std::optional<TransferEvent> EventChannel::WaitPop()
{
    std::unique_lock<std::mutex> lock(ChannelMutex);
    ChannelCV.wait(lock, [this]() { return !Events.empty() || Closed; });
    if (Events.empty())
    {
        return std::nullopt;
    }
    TransferEvent Event = std::move(Events.front());
    Events.pop();
    return Event;
}

std::optional<TransferEvent> EventChannel::TryPop()
{
    std::lock_guard<std::mutex> lock(ChannelMutex);
    if (Events.empty())
    {
        return std::nullopt;
    }
    TransferEvent Event = std::move(Events.front());
    Events.pop();
    return Event;
}

void EventChannel::Close()
{
    {
        std::lock_guard<std::mutex> lock(ChannelMutex);
        Closed = true;
    }
    ChannelCV.notify_all();
}

bool EventChannel::IsClosed()
{
    std::lock_guard<std::mutex> lock(ChannelMutex);
    return Closed;
}
