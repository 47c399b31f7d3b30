#include "launcher.hpp"
#include "test_doubles.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using plx::ForeignHost;
using plx::LaunchMethod;
using plx::LaunchStatus;
using plx::Launcher;
using plx::NativeHost;
using plx::test::RecordingSpawner;
using plx::test::make_project;

namespace {

class ThrowingSpawner : public plx::IProcessSpawner {
public:
    plx::SpawnResult spawn(const plx::SpawnRequest&) override {
        throw std::runtime_error("out of memory");
    }
};

class LauncherTest : public ::testing::Test {
protected:
    RecordingSpawner spawner_;
    Launcher launcher_{&spawner_};
};

} // namespace

TEST_F(LauncherTest, ClassifiesDriveMountsAsForeign) {
    auto host = launcher_.classify_host("/mnt/c/Users/x/app");
    ASSERT_TRUE(std::holds_alternative<ForeignHost>(host));
    EXPECT_EQ(std::get<ForeignHost>(host).path, "C:\\Users\\x\\app");

    host = launcher_.classify_host("/mnt/d/data");
    ASSERT_TRUE(std::holds_alternative<ForeignHost>(host));
    EXPECT_EQ(std::get<ForeignHost>(host).path, "D:\\data");

    host = launcher_.classify_host("/mnt/c");
    ASSERT_TRUE(std::holds_alternative<ForeignHost>(host));
    EXPECT_EQ(std::get<ForeignHost>(host).path, "C:\\");
}

TEST_F(LauncherTest, OtherPathsStayNative) {
    for (const char* path : {"/home/x/api", "/mnt/code/app", "/mnt/", "/mnt", "relative/dir", "", "/mnt/1/x"}) {
        const auto host = launcher_.classify_host(path);
        ASSERT_TRUE(std::holds_alternative<NativeHost>(host)) << path;
        EXPECT_EQ(std::get<NativeHost>(host).path, path);
    }
}

TEST_F(LauncherTest, MountRootIsConfigurable) {
    plx::LauncherConfig config;
    config.mount_root = "/win/";
    Launcher launcher(&spawner_, config);

    const auto host = launcher.classify_host("/win/e/games");
    ASSERT_TRUE(std::holds_alternative<ForeignHost>(host));
    EXPECT_EQ(std::get<ForeignHost>(host).path, "E:\\games");
    EXPECT_TRUE(std::holds_alternative<NativeHost>(launcher.classify_host("/mnt/c/x")));
}

TEST_F(LauncherTest, ForeignExecutableUsesStartProcess) {
    const auto outcome = launcher_.launch(make_project("App", "/mnt/c/Users/x/app", "app.exe"));

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.method, LaunchMethod::ForeignStartProcess);
    EXPECT_EQ(outcome.message, "Launched App (Windows via PowerShell Start-Process)");

    ASSERT_EQ(spawner_.requests.size(), 1u);
    const auto& request = spawner_.requests[0];
    ASSERT_EQ(request.argv.size(), 3u);
    EXPECT_EQ(request.argv[0], "powershell.exe");
    EXPECT_EQ(request.argv[1], "-Command");
    EXPECT_EQ(request.argv[2], "Set-Location 'C:\\Users\\x\\app'; Start-Process 'app.exe'");
    EXPECT_TRUE(request.new_process_group);
}

TEST_F(LauncherTest, ForeignExecutableArgumentsGoToArgumentList) {
    const auto plan = launcher_.plan_launch(make_project("Tool", "/mnt/c/tools", "Tool.EXE --port 80 --name 'x'"));

    EXPECT_EQ(plan.method, LaunchMethod::ForeignStartProcess);
    EXPECT_EQ(plan.request.argv[2],
              "Set-Location 'C:\\tools'; Start-Process 'Tool.EXE' -ArgumentList '--port 80 --name ''x'''");
}

TEST_F(LauncherTest, ForeignScriptRunsInShell) {
    const auto outcome = launcher_.launch(make_project("Py", "/mnt/c/dev/py", "python main.py"));

    EXPECT_EQ(outcome.method, LaunchMethod::ForeignShell);
    EXPECT_EQ(outcome.message, "Launched Py (Windows via PowerShell)");
    ASSERT_EQ(spawner_.requests.size(), 1u);
    EXPECT_EQ(spawner_.requests[0].argv[2], "Set-Location 'C:\\dev\\py'; python main.py");
}

TEST_F(LauncherTest, NativeCommandChangesDirectoryInOwnGroup) {
    const auto outcome = launcher_.launch(make_project("API", "/home/x/api", "python main.py"));

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.method, LaunchMethod::NativeShell);
    EXPECT_EQ(outcome.message, "Launched API");

    ASSERT_EQ(spawner_.requests.size(), 1u);
    const auto& request = spawner_.requests[0];
    ASSERT_EQ(request.argv.size(), 3u);
    EXPECT_EQ(request.argv[0], "bash");
    EXPECT_EQ(request.argv[1], "-c");
    EXPECT_EQ(request.argv[2], "cd '/home/x/api' && python main.py");
    EXPECT_EQ(request.working_dir, "/home/x/api");
    EXPECT_TRUE(request.new_process_group);
}

TEST_F(LauncherTest, NativePathWithQuoteIsEscaped) {
    const auto plan = launcher_.plan_launch(make_project("Q", "/home/x/it's here", "make"));
    EXPECT_EQ(plan.request.argv[2], "cd '/home/x/it'\\''s here' && make");
}

TEST_F(LauncherTest, ExeCheckLooksAtFirstWordOnly) {
    EXPECT_TRUE(Launcher::is_foreign_executable("app.exe"));
    EXPECT_TRUE(Launcher::is_foreign_executable("  App.ExE -v"));
    EXPECT_FALSE(Launcher::is_foreign_executable("python build.exe"));
    EXPECT_FALSE(Launcher::is_foreign_executable(".exe"));
    EXPECT_FALSE(Launcher::is_foreign_executable(""));
}

TEST_F(LauncherTest, SpawnFailureIsReported) {
    spawner_.fail_with = "bash: command not found";
    const auto outcome = launcher_.launch(make_project("API", "/home/x/api", "run"));

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.status, LaunchStatus::Failed);
    EXPECT_EQ(outcome.message, "Failed to launch API: bash: command not found");
}

TEST_F(LauncherTest, ThrowingSpawnerBecomesFailure) {
    ThrowingSpawner throwing;
    Launcher launcher(&throwing);

    const auto outcome = launcher.launch(make_project("API", "/home/x/api", "run"));
    EXPECT_EQ(outcome.status, LaunchStatus::Failed);
    EXPECT_EQ(outcome.message, "Failed to launch API: out of memory");

    const auto link = launcher.open_link(make_project("API", "/home/x/api", "run", "", "http://x"));
    EXPECT_EQ(link.status, LaunchStatus::Failed);
    EXPECT_EQ(link.message, "Failed to open link: out of memory");
}

TEST_F(LauncherTest, EmptyLinkSpawnsNothing) {
    const auto outcome = launcher_.open_link(make_project("API", "/home/x/api", "run"));

    EXPECT_EQ(outcome.status, LaunchStatus::NoLink);
    EXPECT_EQ(outcome.method, LaunchMethod::None);
    EXPECT_EQ(outcome.message, "No link associated");
    EXPECT_TRUE(spawner_.requests.empty());
}

TEST_F(LauncherTest, LinkOpensThroughWindowsHandler) {
    const auto outcome = launcher_.open_link(make_project("Docs", "/home/x/docs", "mkdocs serve", "", "http://localhost:8000"));

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.method, LaunchMethod::LinkHandler);
    EXPECT_EQ(outcome.message, "Opened Docs link in browser");
    ASSERT_EQ(spawner_.requests.size(), 1u);
    EXPECT_EQ(spawner_.requests[0].argv,
              (std::vector<std::string>{"cmd.exe", "/c", "start", "http://localhost:8000"}));
}

TEST_F(LauncherTest, LinkQueryAmpersandStaysInOneArgument) {
    const auto outcome = launcher_.open_link(make_project("Api", "/home/x/api", "run", "", "https://x/?a=1&b=2"));

    EXPECT_TRUE(outcome.ok());
    ASSERT_EQ(spawner_.requests.size(), 1u);
    EXPECT_EQ(spawner_.requests[0].argv,
              (std::vector<std::string>{"cmd.exe", "/c", "start", "https://x/?a=1^&b=2"}));
}

TEST(LauncherQuotingTest, CmdEscapesMetacharacters) {
    EXPECT_EQ(Launcher::escape_cmd("a&b|c<d>e^f"), "a^&b^|c^<d^>e^^f");
    EXPECT_EQ(Launcher::escape_cmd("http://localhost:8000"), "http://localhost:8000");
}

TEST(LauncherQuotingTest, PowerShellDoublesQuotes) {
    EXPECT_EQ(Launcher::quote_powershell("it's"), "'it''s'");
    EXPECT_EQ(Launcher::quote_powershell(""), "''");
}

TEST(LauncherQuotingTest, PosixClosesAndReopensQuotes) {
    EXPECT_EQ(Launcher::quote_posix("a b"), "'a b'");
    EXPECT_EQ(Launcher::quote_posix("it's"), "'it'\\''s'");
}
