#include <gtest/gtest.h>
#include "ControlFlow.hpp"

#include <string>
#include <vector>

namespace {

bool Parse(std::vector<std::string> Args, CommandLineOptions& Options, std::string& Error) {
    Args.insert(Args.begin(), "shuttlecopy");
    std::vector<char*> Argv;
    for (auto& Arg : Args) {
        Argv.push_back(Arg.data());
    }
    Argv.push_back(nullptr);
    return ControlFlow::ParseArguments(static_cast<int>(Args.size()), Argv.data(), Options, Error);
}

}

TEST(ControlFlowArgumentsTest, FullFlagSet) {
    CommandLineOptions Options;
    std::string Error;
    ASSERT_TRUE(Parse({ "--src", "/data/docs", "--dst", "nas:/backup", "--move", "--conflict", "rename",
                        "--strip-spaces", "--mode", "folders", "--method", "rsync",
                        "--exclude", "~*.tmp", "--exclude", "/cache" }, Options, Error)) << Error;

    EXPECT_EQ(Options.Source, "/data/docs");
    EXPECT_EQ(Options.Destination, "nas:/backup");
    EXPECT_TRUE(Options.Move);
    EXPECT_TRUE(Options.StripSpaces);
    EXPECT_EQ(Options.Conflict, ConflictPolicy::Rename);
    EXPECT_EQ(Options.Mode, TransferMode::FoldersAndFiles);
    EXPECT_EQ(Options.Method, TransferMethod::Rsync);
    std::vector<std::string> Excludes = { "~*.tmp", "/cache" };
    EXPECT_EQ(Options.Excludes, Excludes);
}

TEST(ControlFlowArgumentsTest, SourceFilesSplitOnCommas) {
    CommandLineOptions Options;
    std::string Error;
    ASSERT_TRUE(Parse({ "--src-files", "/a/one.txt,/b/two.txt", "--dst", "/out" }, Options, Error)) << Error;
    std::vector<std::string> Files = { "/a/one.txt", "/b/two.txt" };
    EXPECT_EQ(Options.SourceFiles, Files);
}

TEST(ControlFlowArgumentsTest, Rejections) {
    CommandLineOptions Options;
    std::string Error;
    EXPECT_FALSE(Parse({ "--src", "/a", "--dst", "/b", "--conflict", "merge" }, Options, Error));
    EXPECT_FALSE(Parse({ "--src", "/a", "--dst", "/b", "--mode", "tree" }, Options, Error));
    EXPECT_FALSE(Parse({ "--src", "/a", "--dst", "/b", "--method", "ftp" }, Options, Error));
    EXPECT_FALSE(Parse({ "--src", "/a", "--dst", "/b", "--bogus" }, Options, Error));
    EXPECT_FALSE(Parse({ "--src", "/a" }, Options, Error));

    CommandLineOptions Both;
    EXPECT_FALSE(Parse({ "--src", "/a", "--src-files", "/x", "--dst", "/b" }, Both, Error));
    EXPECT_NE(Error.find("cannot be used together"), std::string::npos);
}

TEST(ControlFlowConfigTest, RemoteSourceAndMergedExcludes) {
    CommandLineOptions Options;
    Options.Source = "nas:/srv/photos";
    Options.Destination = "/backup";
    Options.Excludes = { "~*.raw" };

    TransferConfig Config = ControlFlow::BuildTransferConfig(Options, { "/.git" });
    EXPECT_EQ(Config.Source.Kind, SourceKind::Remote);
    EXPECT_EQ(Config.Source.Host, "nas");
    EXPECT_EQ(Config.Source.RemoteRoot, "/srv/photos");
    std::vector<std::string> Exclusions = { "/.git", "~*.raw" };
    EXPECT_EQ(Config.Exclusions, Exclusions);
}

TEST(ControlFlowConfigTest, LocalDirectorySource) {
    CommandLineOptions Options;
    Options.Source = "/data/docs";
    Options.Destination = "/backup";
    TransferConfig Config = ControlFlow::BuildTransferConfig(Options, {});
    EXPECT_EQ(Config.Source.Kind, SourceKind::Directory);
    EXPECT_EQ(Config.Source.Directory, std::filesystem::path("/data/docs"));
}

TEST(ControlFlowConfigTest, MalformedRemoteSourceIsFatal) {
    CommandLineOptions Options;
    Options.Source = "nas:";
    Options.Destination = "/backup";
    EXPECT_THROW(ControlFlow::BuildTransferConfig(Options, {}), TransferFatalError);
}

TEST(ControlFlowResultTest, FinishedJsonShape) {
    TransferOutcome Outcome;
    Outcome.Copied = 3;
    Outcome.Skipped = { "/d/a.txt: identical at destination" };
    Outcome.ExcludedFiles = 2;
    Outcome.ExcludedDirs = 1;

    nlohmann::json Result = ControlFlow::ResultToJson(TransferEvent::MakeFinished(Outcome));
    EXPECT_EQ(Result["status"], "finished");
    EXPECT_EQ(Result["copied"], 3);
    EXPECT_EQ(Result["skipped"].size(), 1u);
    EXPECT_EQ(Result["excluded_files"], 2);
    EXPECT_EQ(Result["excluded_dirs"], 1);
    EXPECT_TRUE(Result["errors"].empty());
    EXPECT_TRUE(Result["warnings"].empty());
    EXPECT_EQ(ControlFlow::ExitCodeFor(TransferEvent::MakeFinished(Outcome)), 0);
}

TEST(ControlFlowResultTest, ExitCodes) {
    TransferOutcome WithError;
    WithError.Errors = { "/d/a.txt: scp failed (exit code 1)" };
    EXPECT_EQ(ControlFlow::ExitCodeFor(TransferEvent::MakeFinished(WithError)), 2);

    TransferOutcome WithWarning;
    WithWarning.Copied = 1;
    WithWarning.Warnings = { "/d/a.txt: transferred and verified but failed to delete source" };
    EXPECT_EQ(ControlFlow::ExitCodeFor(TransferEvent::MakeFinished(WithWarning)), 2);

    EXPECT_EQ(ControlFlow::ExitCodeFor(TransferEvent::MakeCancelled(TransferOutcome{})), 0);
    EXPECT_EQ(ControlFlow::ExitCodeFor(TransferEvent::MakeFatalError("SSH connection failed")), 1);
}

TEST(ControlFlowResultTest, CancelledAndErrorJson) {
    EXPECT_EQ(ControlFlow::ResultToJson(TransferEvent::MakeCancelled(TransferOutcome{}))["status"], "cancelled");

    nlohmann::json Error = ControlFlow::ResultToJson(TransferEvent::MakeFatalError("No source selected."));
    EXPECT_EQ(Error["status"], "error");
    EXPECT_EQ(Error["message"], "No source selected.");
}
