#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "unitfleet/Platform.hpp"
#include "unitfleet/Process.hpp"

#include <sstream>

using namespace unitfleet;
using namespace unitfleet::test;

namespace {

    //---Скрипт-заглушка: пишет аргументы в calls.log, код возврата берёт из exit_code
    fs::path writeFakeTool(const fs::path& dir, const std::string& name)
    {
        const fs::path script = dir / name;
        writeFile(script,
            "#!/bin/sh\n"
            "printf '%s\\n' \"$*\" >> '" + (dir / "calls.log").string() + "'\n"
            "if [ -f '" + (dir / "exit_code").string() + "' ]; then\n"
            "  exit \"$(cat '" + (dir / "exit_code").string() + "')\"\n"
            "fi\n"
            "exit 0\n");
        fs::permissions(script, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
            fs::perm_options::replace);
        return script;
    }

    std::vector<std::string> readLines(const fs::path& file)
    {
        std::istringstream in(readFile(file));
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

} // namespace

class SystemctlControllerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        paths.systemctl = writeFakeTool(tmp.path(), "systemctl");
        paths.journalctl = writeFakeTool(tmp.path(), "journalctl");
        controller = makeController(paths);
        ASSERT_NE(controller, nullptr);
    }

    void setExitCode(int code) { writeFile(tmp.path() / "exit_code", std::to_string(code) + "\n"); }
    std::vector<std::string> calls() const { return readLines(tmp.path() / "calls.log"); }

    TempDir tmp;
    ToolPaths paths;
    std::unique_ptr<IServiceController> controller;
};

TEST_F(SystemctlControllerTest, QueriesMapExitCodeToBool) {
    EXPECT_TRUE(controller->isActive("webapp.service", false));
    EXPECT_TRUE(controller->isEnabled("webapp.service", true));

    setExitCode(3);
    EXPECT_FALSE(controller->isActive("webapp.service", false));
    EXPECT_FALSE(controller->isEnabled("webapp.service", false));

    const std::vector<std::string> expected = {
        "is-active --quiet webapp.service",
        "--user is-enabled --quiet webapp.service",
        "is-active --quiet webapp.service",
        "is-enabled --quiet webapp.service",
    };
    EXPECT_EQ(calls(), expected);
}

TEST_F(SystemctlControllerTest, QueriesAreFalseWhenToolIsMissing) {
    ToolPaths missing;
    missing.systemctl = tmp.path() / "no-such-systemctl";
    auto ctl = makeController(missing);

    EXPECT_FALSE(ctl->isActive("webapp.service", false));
    EXPECT_FALSE(ctl->isEnabled("webapp.service", false));

    Error err;
    EXPECT_FALSE(ctl->start("webapp.service", false, &err));
    EXPECT_EQ(err.kind, ErrorKind::ServiceCommand);
}

TEST_F(SystemctlControllerTest, MutationsPassScopeFirst) {
    Error err;
    ASSERT_TRUE(controller->reload(true, &err)) << err.message;
    ASSERT_TRUE(controller->start("webapp.service", true, &err)) << err.message;
    ASSERT_TRUE(controller->stop("webapp.service", false, &err)) << err.message;

    const std::vector<std::string> expected = {
        "--user daemon-reload",
        "--user start webapp.service",
        "stop webapp.service",
    };
    EXPECT_EQ(calls(), expected);
}

TEST_F(SystemctlControllerTest, MutationFailuresArePropagated) {
    setExitCode(5);

    Error err;
    EXPECT_FALSE(controller->start("webapp.service", false, &err));
    EXPECT_EQ(err.kind, ErrorKind::ServiceCommand);
    EXPECT_NE(err.message.find("exitCode=5"), std::string::npos) << err.message;

    err = {};
    EXPECT_FALSE(controller->stop("webapp.service", false, &err));
    EXPECT_EQ(err.kind, ErrorKind::ServiceCommand);

    err = {};
    EXPECT_FALSE(controller->reload(false, &err));
    EXPECT_EQ(err.kind, ErrorKind::ServiceCommand);
}

TEST_F(SystemctlControllerTest, InvalidUnitNamesNeverReachSystemctl) {
    Error err;
    EXPECT_FALSE(controller->isActive("bad name.service", false));
    EXPECT_FALSE(controller->start("bad;rm -rf.service", false, &err));
    EXPECT_EQ(err.kind, ErrorKind::ServiceCommand);
    EXPECT_FALSE(controller->followLogs("", false, &err));
    EXPECT_FALSE(fs::exists(tmp.path() / "calls.log"));
}

TEST_F(SystemctlControllerTest, FollowLogsUsesJournalctl) {
    Error err;
    ASSERT_TRUE(controller->followLogs("webapp.service", false, &err)) << err.message;
    ASSERT_TRUE(controller->followLogs("webapp.service", true, &err)) << err.message;

    const std::vector<std::string> expected = {
        "-u webapp.service -f",
        "--user -u webapp.service -f",
    };
    EXPECT_EQ(calls(), expected);

    setExitCode(1);
    EXPECT_FALSE(controller->followLogs("webapp.service", false, &err));
    EXPECT_EQ(err.kind, ErrorKind::ServiceCommand);
    EXPECT_EQ(err.message, "Failed to show logs for 'webapp.service'");
}

TEST(ProcessRun, ReportsExitCode) {
    process::RunResult rr;
    ASSERT_TRUE(process::run("/bin/sh", { "-c", "exit 7" }, rr));
    EXPECT_TRUE(rr.started);
    EXPECT_EQ(rr.exitCode, 7);

    process::RunOptions quiet;
    quiet.silenceOutput = true;
    ASSERT_TRUE(process::run("/bin/sh", { "-c", "echo noise; echo noise >&2" }, rr, quiet));
    EXPECT_EQ(rr.exitCode, 0);
}

TEST(ProcessRun, MissingExecutableExitsWith127) {
    process::RunResult rr;
    ASSERT_TRUE(process::run("/nonexistent/unitfleet-tool", {}, rr));
    EXPECT_EQ(rr.exitCode, 127);
}
