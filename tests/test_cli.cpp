#include <gtest/gtest.h>
#include "unitfleet/Cli.hpp"
#include "unitfleet/Paths.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace unitfleet;

namespace {

    CliOptions parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "unitfleet");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);
        return parseCli(static_cast<int>(args.size()), argv.data());
    }

} // namespace

TEST(Cli, NoArgumentsShowsHelp) {
    EXPECT_EQ(parse({}).cmd, Command::Help);
    EXPECT_EQ(parse({ "help" }).cmd, Command::Help);
    EXPECT_EQ(parse({ "install", "--help" }).cmd, Command::Help);
    EXPECT_EQ(parse({ "-h" }).cmd, Command::Help);
}

TEST(Cli, CommandsWithOptionalName) {
    CliOptions o = parse({ "status" });
    EXPECT_EQ(o.cmd, Command::Status);
    EXPECT_TRUE(o.name.empty());

    o = parse({ "install", "webapp" });
    EXPECT_EQ(o.cmd, Command::Install);
    EXPECT_EQ(o.name, "webapp");
    EXPECT_FALSE(o.force);
    EXPECT_FALSE(o.dryRun);

    o = parse({ "uninstall" });
    EXPECT_EQ(o.cmd, Command::Uninstall);
    EXPECT_TRUE(o.name.empty());

    o = parse({ "logs", "webapp" });
    EXPECT_EQ(o.cmd, Command::Logs);
    EXPECT_EQ(o.name, "webapp");
}

TEST(Cli, GlobalFlagsAnywhere) {
    CliOptions o = parse({ "--force", "uninstall", "webapp", "--dry-run", "--root=\"/srv/apps\"", "--log-dir=/var/log/uf" });
    EXPECT_EQ(o.cmd, Command::Uninstall);
    EXPECT_EQ(o.name, "webapp");
    EXPECT_TRUE(o.force);
    EXPECT_TRUE(o.dryRun);
    EXPECT_EQ(o.root, "/srv/apps");
    EXPECT_EQ(o.logDir, "/var/log/uf");
}

TEST(Cli, InvalidInvocations) {
    EXPECT_EQ(parse({ "logs" }).cmd, Command::Invalid);
    EXPECT_EQ(parse({ "deploy" }).cmd, Command::Invalid);
    EXPECT_EQ(parse({ "install", "a", "b" }).cmd, Command::Invalid);
    EXPECT_EQ(parse({ "status", "--verbose" }).cmd, Command::Invalid);
    EXPECT_EQ(parse({ "status", "--rootless" }).cmd, Command::Invalid);
    EXPECT_EQ(parse({ "help", "install" }).cmd, Command::Invalid);
}

TEST(Cli, HelpMentionsCommandsAndFlags) {
    std::ostringstream os;
    printHelp(os);
    const std::string text = os.str();
    for (const char* word : { "status", "install", "uninstall", "logs", "--force", "--dry-run", "--root=" })
    {
        EXPECT_NE(text.find(word), std::string::npos) << word;
    }
}

TEST(Paths, FleetRootResolution) {
    EXPECT_EQ(resolveFleetRoot("/srv/apps").string(), "/srv/apps");
    EXPECT_EQ(resolveFleetRoot("apps").string(), (fs::current_path() / "apps").lexically_normal().string());
    EXPECT_EQ(resolveFleetRoot("").string(), selfDir().string());
    EXPECT_FALSE(selfDir().empty());
}
