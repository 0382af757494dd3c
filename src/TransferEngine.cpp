#include "TransferEngine.hpp"
#include "ConfigGlobal.hpp"
#include "LocalTransfer.hpp"
#include "LocalToRemoteTransfer.hpp"
#include "RemoteToLocalTransfer.hpp"
#include "RemoteToRemoteTransfer.hpp"
#include "PathUtils.hpp"
#include "SshRemoteShell.hpp"
#include "Logger.hpp"

#include <stdexcept>

TransferEngine::TransferEngine(std::shared_ptr<RemoteShell> Shell)
    : Shell(std::move(Shell))
{
    if (!this->Shell)
    {
        this->Shell = std::make_shared<SshRemoteShell>(ConfigGlobal::SSHControlPath, ConfigGlobal::SSHControlPersist);
    }
}

TransferEngine::~TransferEngine()
{
    if (Worker.joinable())
    {
        Cancel();
        Worker.join();
    }
}

void TransferEngine::Start(TransferConfig Config)
{
    if (Worker.joinable() || Channel.IsClosed())
    {
        throw std::logic_error("TransferEngine runs a single transfer");
    }

    if (!Config.CancelFlag)
    {
        Config.CancelFlag = std::make_shared<std::atomic<bool>>(false);
    }
    CancelFlag = Config.CancelFlag;

    Worker = std::thread(&TransferEngine::WorkerLoop, this, std::move(Config));
}

std::optional<TransferEvent> TransferEngine::NextEvent()
{
    return Channel.WaitPop();
}

void TransferEngine::Cancel()
{
    if (CancelFlag)
    {
        CancelFlag->store(true);
    }
}

void TransferEngine::Wait()
{
    if (Worker.joinable())
    {
        Worker.join();
    }
}

TransferEvent TransferEngine::RunToCompletion(TransferConfig Config, const std::function<void(const TransferEvent&)>& OnProgress)
{
    Start(std::move(Config));

    TransferEvent Terminal = TransferEvent::MakeFatalError("Transfer ended without a result");
    while (std::optional<TransferEvent> Event = NextEvent())
    {
        if (!Event->IsTerminal())
        {
            if (OnProgress)
            {
                OnProgress(*Event);
            }
            continue;
        }
        Terminal = std::move(*Event);
    }
    Wait();
    return Terminal;
}

std::unique_ptr<TransferExecutor> TransferEngine::CreateExecutor(const TransferConfig& Config, EventChannel& Channel, RemoteShell& Shell)
{
    if (Config.Source.Kind == SourceKind::None)
    {
        throw TransferFatalError("No source selected.");
    }
    if (Config.Destination.empty())
    {
        throw TransferFatalError("No destination specified.");
    }
    if (Config.Source.Kind == SourceKind::Remote && (Config.Source.Host.empty() || Config.Source.RemoteRoot.empty()))
    {
        throw TransferFatalError("Remote source must be given as host:path.");
    }

    std::optional<RemoteLocation> RemoteDestination = PathUtils::ParseLocation(Config.Destination);

    if (Config.Source.Kind == SourceKind::Remote)
    {
        if (RemoteDestination)
        {
            Log.Info(std::string("[Engine] Remote to remote: ") + Config.Source.Host + " -> " + RemoteDestination->Host);
            return std::make_unique<RemoteToRemoteTransfer>(Config, Channel, Shell, *RemoteDestination);
        }
        Log.Info(std::string("[Engine] Remote to local: ") + Config.Source.Host + " -> " + Config.Destination);
        return std::make_unique<RemoteToLocalTransfer>(Config, Channel, Shell);
    }

    if (RemoteDestination)
    {
        Log.Info(std::string("[Engine] Local to remote: ") + RemoteDestination->Host + ":" + RemoteDestination->Path);
        return std::make_unique<LocalToRemoteTransfer>(Config, Channel, Shell, *RemoteDestination);
    }
    Log.Info(std::string("[Engine] Local to local: ") + Config.Destination);
    return std::make_unique<LocalTransfer>(Config, Channel);
}

void TransferEngine::WorkerLoop(TransferConfig Config)
{
    try
    {
        std::unique_ptr<TransferExecutor> Executor = CreateExecutor(Config, Channel, *Shell);
        if (Executor->Run())
        {
            Channel.Push(TransferEvent::MakeFinished(Executor->GetOutcome()));
        }
        else
        {
            Channel.Push(TransferEvent::MakeCancelled(Executor->GetOutcome()));
        }
    }
    catch (const TransferFatalError& Ex)
    {
        Log.Error(std::string("[Engine] Fatal: ") + Ex.what());
        Channel.Push(TransferEvent::MakeFatalError(Ex.what()));
    }
    catch (const std::exception& Ex)
    {
        Log.Error(std::string("[Engine] Unexpected failure: ") + Ex.what());
        Channel.Push(TransferEvent::MakeFatalError(Ex.what()));
    }
    Channel.Close();
}
