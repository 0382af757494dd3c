#include <gtest/gtest.h>
#include "ConfigGlobal.hpp"
#include "TransferEngine.hpp"
#include "LoopbackShell.hpp"
#include "PathUtils.hpp"
#include "StagingArea.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <iterator>

// Hosts resolve to this machine through LoopbackShell, so "loopback:/x" is the local path /x
class RemoteTransferTest : public ::testing::Test {
protected:
    TempDir Dir;
    TempDir StagingDir;
    std::shared_ptr<LoopbackShell> Shell = std::make_shared<LoopbackShell>();

    void SetUp() override {
        ConfigGlobal::InitializeDefaults();
        ConfigGlobal::StagingRoot = StagingDir.Path();
    }

    void TearDown() override {
        ConfigGlobal::InitializeDefaults();
    }

    static std::string Remote(const std::string& Host, const fs::path& Path) {
        return Host + ":" + Path.string();
    }

    TransferEvent RunTransfer(TransferConfig Config, std::vector<TransferEvent>* Progress = nullptr) {
        TransferEngine Engine(Shell);
        return Engine.RunToCompletion(std::move(Config), [Progress](const TransferEvent& Event) {
            if (Progress) {
                Progress->push_back(Event);
            }
        });
    }

    TransferConfig Upload(const fs::path& Source, const fs::path& Destination) {
        TransferConfig Config;
        Config.Source = SourceDescriptor::FromDirectory(Source);
        Config.Destination = Remote("loopback", Destination);
        return Config;
    }

    TransferConfig Download(const fs::path& Source, const fs::path& Destination) {
        TransferConfig Config;
        Config.Source = SourceDescriptor::FromRemote("loopback", Source.string());
        Config.Destination = Destination.string();
        return Config;
    }

    bool StagingIsEmpty() const {
        return fs::is_empty(StagingDir.Path());
    }

    static long EntryCount(const fs::path& Directory) {
        return std::distance(fs::directory_iterator(Directory), fs::directory_iterator());
    }
};

TEST_F(RemoteTransferTest, LocalToRemoteKeepsStructure) {
    WriteFile(Dir / "docs/a.txt", "alpha");
    WriteFile(Dir / "docs/sub/b.txt", "beta");
    WriteFile(Dir / "docs/b.tmp", "temp");

    TransferConfig Config = Upload(Dir / "docs", Dir / "remote");
    Config.Mode = TransferMode::FoldersAndFiles;
    Config.Exclusions = { "~*.tmp" };
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Kind, EventKind::Finished) << Result.Message;
    EXPECT_EQ(Result.Outcome.Copied, 2u);
    EXPECT_EQ(Result.Outcome.ExcludedFiles, 1u);
    EXPECT_TRUE(Result.Outcome.Errors.empty());
    EXPECT_EQ(ReadFile(Dir / "remote/docs/a.txt"), "alpha");
    EXPECT_EQ(ReadFile(Dir / "remote/docs/sub/b.txt"), "beta");
    EXPECT_EQ(Shell->CopyCount, 2u);
    EXPECT_EQ(Shell->SyncCount, 0u);
}

TEST_F(RemoteTransferTest, RsyncMethodUsesSync) {
    WriteFile(Dir / "src/a.txt", "alpha");
    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Method = TransferMethod::Rsync;
    TransferEvent Result = RunTransfer(Config);

    EXPECT_EQ(Result.Outcome.Copied, 1u);
    EXPECT_EQ(Shell->SyncCount, 1u);
}

TEST_F(RemoteTransferTest, RemoteSkipAndRenamePolicies) {
    WriteFile(Dir / "src/a.txt", "new");
    WriteFile(Dir / "remote/a.txt", "old");

    TransferEvent Skipped = RunTransfer(Upload(Dir / "src", Dir / "remote"));
    std::vector<std::string> Expected = { (Dir / "src/a.txt").string() + ": already exists at destination" };
    EXPECT_EQ(Skipped.Outcome.Skipped, Expected);
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "old");

    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Conflict = ConflictPolicy::Rename;
    TransferEvent Renamed = RunTransfer(Config);
    EXPECT_EQ(Renamed.Outcome.Copied, 1u);
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "old");
    EXPECT_EQ(ReadFile(Dir / "remote/a (1).txt"), "new");
}

TEST_F(RemoteTransferTest, OverwriteSkipsRemoteListing) {
    WriteFile(Dir / "src/a.txt", "new");
    WriteFile(Dir / "remote/a.txt", "old");

    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Conflict = ConflictPolicy::Overwrite;
    TransferEvent Result = RunTransfer(Config);

    EXPECT_EQ(Result.Outcome.Copied, 1u);
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "new");
    EXPECT_TRUE(std::none_of(Shell->Commands.begin(), Shell->Commands.end(), [](const std::string& Command) {
        return Command.rfind("find ", 0) == 0;
    }));
}

TEST_F(RemoteTransferTest, CorruptUploadIsRemovedAndReported) {
    WriteFile(Dir / "src/a.txt", "alpha");
    Shell->CorruptUploads = true;

    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Move = true;
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Kind, EventKind::Finished);
    EXPECT_EQ(Result.Outcome.Copied, 0u);
    ASSERT_EQ(Result.Outcome.Errors.size(), 1u);
    EXPECT_NE(Result.Outcome.Errors[0].find("integrity check failed"), std::string::npos);
    EXPECT_FALSE(fs::exists(Dir / "remote/a.txt"));
    EXPECT_EQ(ReadFile(Dir / "src/a.txt"), "alpha");
}

TEST_F(RemoteTransferTest, UploadMoveDeletesLocalSource) {
    WriteFile(Dir / "src/a.txt", "alpha");
    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Move = true;
    TransferEvent Result = RunTransfer(Config);

    EXPECT_EQ(Result.Outcome.Copied, 1u);
    EXPECT_FALSE(fs::exists(Dir / "src/a.txt"));
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "alpha");
}

TEST_F(RemoteTransferTest, UnreachableHostIsFatal) {
    WriteFile(Dir / "src/a.txt", "alpha");
    Shell->UnreachableHosts.insert("loopback");

    TransferEvent Result = RunTransfer(Upload(Dir / "src", Dir / "remote"));
    EXPECT_EQ(Result.Kind, EventKind::FatalError);
    EXPECT_NE(Result.Message.find("SSH connection to 'loopback' failed"), std::string::npos);
    EXPECT_EQ(Shell->CopyCount, 0u);
}

TEST_F(RemoteTransferTest, MissingToolIsFatal) {
    WriteFile(Dir / "src/a.txt", "alpha");
    Shell->MissingTools.insert("scp");

    TransferEvent Result = RunTransfer(Upload(Dir / "src", Dir / "remote"));
    EXPECT_EQ(Result.Kind, EventKind::FatalError);
    EXPECT_EQ(Result.Message, "scp is not installed or not in PATH.");

    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Method = TransferMethod::Rsync;
    Shell->MissingTools = { "rsync" };
    EXPECT_EQ(RunTransfer(Config).Kind, EventKind::FatalError);
}

TEST_F(RemoteTransferTest, CancelStopsBetweenFiles) {
    for (const char* Name : { "a.txt", "b.txt", "c.txt", "d.txt", "e.txt" }) {
        WriteFile(Dir / "src" / Name, Name);
    }

    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.CancelFlag = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<std::atomic<bool>> Flag = Config.CancelFlag;
    Shell->OnCopy = [Flag](size_t Count) {
        if (Count == 2) {
            Flag->store(true);
        }
    };

    std::vector<TransferEvent> Progress;
    TransferEvent Result = RunTransfer(Config, &Progress);

    ASSERT_EQ(Result.Kind, EventKind::Cancelled);
    EXPECT_EQ(Result.Outcome.Copied, 2u);
    EXPECT_TRUE(Result.Outcome.Errors.empty());
    EXPECT_EQ(Shell->CopyCount, 2u);
    EXPECT_EQ(Progress.size(), 2u);
    EXPECT_TRUE(fs::exists(Dir / "remote/b.txt"));
    EXPECT_FALSE(fs::exists(Dir / "remote/c.txt"));
}

TEST_F(RemoteTransferTest, RemoteToLocalWithExcludedDirectory) {
    WriteFile(Dir / "remote/docs/a.txt", "alpha");
    WriteFile(Dir / "remote/docs/cache/x.txt", "cached");
    WriteFile(Dir / "remote/docs/cache/deep/y.txt", "cached");

    TransferConfig Config = Download(Dir / "remote/docs", Dir / "dst");
    Config.Mode = TransferMode::FoldersAndFiles;
    Config.Exclusions = { "/cache" };
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Kind, EventKind::Finished) << Result.Message;
    EXPECT_EQ(Result.Outcome.Copied, 1u);
    EXPECT_EQ(Result.Outcome.ExcludedDirs, 1u);
    EXPECT_EQ(Result.Outcome.ExcludedFiles, 0u);
    EXPECT_EQ(ReadFile(Dir / "dst/docs/a.txt"), "alpha");
    EXPECT_FALSE(fs::exists(Dir / "dst/docs/cache"));
}

TEST_F(RemoteTransferTest, RemoteToLocalIdenticalAndMove) {
    WriteFile(Dir / "remote/a.txt", "same");
    WriteFile(Dir / "remote/b.txt", "fresh");
    WriteFile(Dir / "dst/a.txt", "same");

    TransferEvent Copy = RunTransfer(Download(Dir / "remote", Dir / "dst"));
    ASSERT_EQ(Copy.Kind, EventKind::Finished) << Copy.Message;
    EXPECT_EQ(Copy.Outcome.Copied, 1u);
    std::vector<std::string> Expected = { (Dir / "remote/a.txt").string() + ": identical at destination" };
    EXPECT_EQ(Copy.Outcome.Skipped, Expected);
    EXPECT_EQ(ReadFile(Dir / "dst/b.txt"), "fresh");

    WriteFile(Dir / "remote/c.txt", "moved");
    TransferConfig Config = Download(Dir / "remote", Dir / "dst");
    Config.Move = true;
    TransferEvent Move = RunTransfer(Config);
    EXPECT_EQ(Move.Kind, EventKind::Finished);
    EXPECT_FALSE(fs::exists(Dir / "remote/c.txt"));
    EXPECT_EQ(ReadFile(Dir / "dst/c.txt"), "moved");
}

TEST_F(RemoteTransferTest, CorruptDownloadLeavesNoLocalCopy) {
    WriteFile(Dir / "remote/a.txt", "alpha");
    Shell->CorruptDownloads = true;

    TransferEvent Result = RunTransfer(Download(Dir / "remote", Dir / "dst"));
    EXPECT_EQ(Result.Outcome.Copied, 0u);
    ASSERT_EQ(Result.Outcome.Errors.size(), 1u);
    EXPECT_FALSE(fs::exists(Dir / "dst/a.txt"));
    EXPECT_TRUE(fs::exists(Dir / "remote/a.txt"));
}

TEST_F(RemoteTransferTest, RemoteToRemoteRelaysThroughStaging) {
    WriteFile(Dir / "one/docs/a.txt", "alpha");
    WriteFile(Dir / "one/docs/sub/b.txt", "beta");

    TransferConfig Config;
    Config.Source = SourceDescriptor::FromRemote("first", (Dir / "one/docs").string());
    Config.Destination = Remote("second", Dir / "two");
    Config.Mode = TransferMode::FoldersAndFiles;
    Config.Move = true;
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Kind, EventKind::Finished) << Result.Message;
    EXPECT_EQ(Result.Outcome.Copied, 2u);
    EXPECT_EQ(ReadFile(Dir / "two/docs/a.txt"), "alpha");
    EXPECT_EQ(ReadFile(Dir / "two/docs/sub/b.txt"), "beta");
    EXPECT_FALSE(fs::exists(Dir / "one/docs/a.txt"));
    EXPECT_FALSE(fs::exists(Dir / "one/docs/sub/b.txt"));
    EXPECT_EQ(Shell->CopyCount, 4u);
    EXPECT_TRUE(StagingIsEmpty());
}

TEST_F(RemoteTransferTest, RemoteToRemoteCorruptUploadRemovesDestinationCopy) {
    WriteFile(Dir / "one/a.txt", "alpha");
    Shell->CorruptUploads = true;

    TransferConfig Config;
    Config.Source = SourceDescriptor::FromRemote("first", (Dir / "one").string());
    Config.Destination = Remote("second", Dir / "two");
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Outcome.Errors.size(), 1u);
    EXPECT_FALSE(fs::exists(Dir / "two/a.txt"));
    EXPECT_TRUE(fs::exists(Dir / "one/a.txt"));
    EXPECT_TRUE(StagingIsEmpty());
}

TEST_F(RemoteTransferTest, SecondHostIsProbedSeparately) {
    WriteFile(Dir / "one/a.txt", "alpha");
    Shell->UnreachableHosts.insert("second");

    TransferConfig Config;
    Config.Source = SourceDescriptor::FromRemote("first", (Dir / "one").string());
    Config.Destination = Remote("second", Dir / "two");
    TransferEvent Result = RunTransfer(Config);

    EXPECT_EQ(Result.Kind, EventKind::FatalError);
    EXPECT_NE(Result.Message.find("'second'"), std::string::npos);
}

TEST_F(RemoteTransferTest, FailedDownloadKeepsExistingDestination) {
    WriteFile(Dir / "remote/a.txt", "new");
    WriteFile(Dir / "dst/a.txt", "USER DATA");
    Shell->FailDownloads = true;

    TransferConfig Config = Download(Dir / "remote", Dir / "dst");
    Config.Conflict = ConflictPolicy::Overwrite;
    Config.Move = true;
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Kind, EventKind::Finished) << Result.Message;
    EXPECT_EQ(Result.Outcome.Copied, 0u);
    ASSERT_EQ(Result.Outcome.Errors.size(), 1u);
    EXPECT_NE(Result.Outcome.Errors[0].find("download from source failed"), std::string::npos);
    EXPECT_EQ(ReadFile(Dir / "dst/a.txt"), "USER DATA");
    EXPECT_EQ(EntryCount(Dir / "dst"), 1);
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "new");
}

TEST_F(RemoteTransferTest, CorruptOverwriteKeepsExistingRemoteFile) {
    WriteFile(Dir / "src/a.txt", "new");
    WriteFile(Dir / "remote/a.txt", "old");
    Shell->CorruptUploads = true;

    TransferConfig Config = Upload(Dir / "src", Dir / "remote");
    Config.Conflict = ConflictPolicy::Overwrite;
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Outcome.Errors.size(), 1u);
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "old");
    EXPECT_EQ(EntryCount(Dir / "remote"), 1);
}

TEST_F(RemoteTransferTest, LostDestinationListingIsFatal) {
    WriteFile(Dir / "src/a.txt", "new");
    WriteFile(Dir / "remote/a.txt", "EXISTING REMOTE DATA");
    Shell->DropConnectionOnPrefix = "find ";

    TransferEvent Result = RunTransfer(Upload(Dir / "src", Dir / "remote"));

    EXPECT_EQ(Result.Kind, EventKind::FatalError);
    EXPECT_NE(Result.Message.find("Failed to list existing files on 'loopback'"), std::string::npos);
    EXPECT_EQ(Shell->CopyCount, 0u);
    EXPECT_EQ(ReadFile(Dir / "remote/a.txt"), "EXISTING REMOTE DATA");
}

TEST_F(RemoteTransferTest, RemoteToRemoteOntoItselfIsSkipped) {
    WriteFile(Dir / "one/a.txt", "only copy");

    TransferConfig Config;
    Config.Source = SourceDescriptor::FromRemote("loopback", (Dir / "one").string());
    Config.Destination = Remote("loopback", Dir / "one");
    Config.Conflict = ConflictPolicy::Overwrite;
    Config.Move = true;
    TransferEvent Result = RunTransfer(Config);

    ASSERT_EQ(Result.Kind, EventKind::Finished) << Result.Message;
    EXPECT_EQ(Result.Outcome.Copied, 0u);
    std::vector<std::string> Expected = { (Dir / "one/a.txt").string() + ": source and destination are the same file" };
    EXPECT_EQ(Result.Outcome.Skipped, Expected);
    EXPECT_EQ(ReadFile(Dir / "one/a.txt"), "only copy");
    EXPECT_EQ(Shell->CopyCount, 0u);
}

TEST(StagingAreaTest, InstancesDoNotShareDirectories) {
    TempDir Root;
    auto First = std::make_unique<StagingArea>(Root.Path());
    StagingArea Second(Root.Path());
    ASSERT_NE(First->GetDirectory(), Second.GetDirectory());

    WriteFile(Second.GetDirectory() / "staged", "x");
    First.reset();
    EXPECT_TRUE(fs::exists(Second.GetDirectory() / "staged"));
}

TEST(StagingAreaTest, LongRemoteNamesFitInOneComponent) {
    TempDir Root;
    StagingArea Area(Root.Path());
    fs::path Staged = Area.StagedPathFor("host", "/srv/" + std::string(300, 'n') + ".bin");

    EXPECT_LE(Staged.filename().string().size(), PathUtils::MAX_FILE_NAME_BYTES);
    EXPECT_EQ(Staged.extension(), ".bin");
    EXPECT_EQ(Staged.parent_path(), Area.GetDirectory());
}
