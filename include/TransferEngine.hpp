#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

#include "EventChannel.hpp"
#include "RemoteShell.hpp"
#include "TransferExecutor.hpp"
#include "TransferTypes.hpp"

// Runs one transfer on a dedicated worker thread. The caller drains events until a terminal one arrives.
class TransferEngine
{
public:
    // Without a shell, remote commands go through ssh/scp/rsync configured from ConfigGlobal
    explicit TransferEngine(std::shared_ptr<RemoteShell> Shell = nullptr);
    ~TransferEngine();

    // Non-copyable
    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // One run per engine. Throws std::logic_error if called twice.
    void Start(TransferConfig Config);

    // Blocks; std::nullopt after the terminal event has been consumed
    std::optional<TransferEvent> NextEvent();

    void Cancel();
    void Wait();

    // Start, drain, return the terminal event. OnProgress sees every progress event in order.
    TransferEvent RunToCompletion(TransferConfig Config, const std::function<void(const TransferEvent&)>& OnProgress = {});

    // Picks the topology; throws TransferFatalError for unusable source/destination combinations
    static std::unique_ptr<TransferExecutor> CreateExecutor(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell);

private:
    void WorkerLoop(TransferConfig Config);

    std::shared_ptr<RemoteShell> Shell;
    EventChannel Channel;
    std::thread Worker;
    std::shared_ptr<std::atomic<bool>> CancelFlag;
};
