#include <gtest/gtest.h>

#include "RunConfig.h"
#include "help.h"
#include "helpers.h"


// argv as cxxopts wants it, with the program name in front
class ArgList {
    vector<string> strings;
    vector<char*> pointers;

public:
    int argc;
    char **argv;

    ArgList(vector<string> args) : strings(args) {
        strings.insert(strings.begin(), "aggregatebackups");

        for (auto &arg: strings)
            pointers.push_back(&arg[0]);
        pointers.push_back(NULL);

        argc = (int)strings.size();
        argv = pointers.data();
    }
};


class RunConfigTest : public ::testing::Test {
protected:
    TempDir tmp;
    RunConfig config;
    cxxopts::Options options { "aggregatebackups", "test" };

    void SetUp() {
        defineOptions(options);
    }

    string applyArgs(vector<string> args) {
        ArgList list(args);
        auto cli = options.parse(list.argc, list.argv);
        return config.applyCli(cli);
    }
};


TEST_F(RunConfigTest, Defaults) {
    EXPECT_EQ(config.source(), "/data/backups/");
    EXPECT_EQ(config.pattern(), "*_backup*");
    EXPECT_EQ(config.destination(), "/data/backups/");
    EXPECT_EQ(config.days(), 7);
    EXPECT_EQ(config.account(), "splunk");
    EXPECT_EQ(config.hostsFile(), "/etc/hosts");
    EXPECT_EQ(config.port(), 22);
    EXPECT_EQ(config.timeout(), 10);
    EXPECT_EQ(config.deadline(), 1800);
    EXPECT_EQ(config.workers(), 1);
    EXPECT_EQ(config.syncTarget(), "");
    EXPECT_EQ(config.manifest(), "/tmp/aggregatebackups_sync_files.txt");
    EXPECT_FALSE(config.dryRun);
    EXPECT_EQ(config.validate(), "");
}


TEST_F(RunConfigTest, ConfigFile) {
    makeFile(tmp.file("aggregatebackups.conf"),
        "# nightly pull\n"
        "\n"
        "source: /srv/backups/\n"
        "pattern = *.tgz\n"
        "dest:   /srv/aggregate/    # local copy\n"
        "retention_days: 14\n"
        "workers: 4\n"
        "notify: \"ops@example.com\"\n"
        "sync_target: backup2\n");

    EXPECT_EQ(config.loadConfig(tmp.file("aggregatebackups.conf")), "");
    EXPECT_EQ(config.source(), "/srv/backups/");
    EXPECT_EQ(config.pattern(), "*.tgz");
    EXPECT_EQ(config.destination(), "/srv/aggregate/");
    EXPECT_EQ(config.days(), 14);
    EXPECT_EQ(config.workers(), 4);
    EXPECT_EQ(config.notify(), "ops@example.com");
    EXPECT_EQ(config.syncTarget(), "backup2");
    EXPECT_EQ(config.account(), "splunk");
}


TEST_F(RunConfigTest, ConfigFileErrors) {
    makeFile(tmp.file("bad.conf"), "source: /srv/\nbogus: 1\n");
    EXPECT_TRUE(contains(config.loadConfig(tmp.file("bad.conf")), "unrecognized setting on line 2"));

    makeFile(tmp.file("nan.conf"), "days: lots\n");
    EXPECT_TRUE(contains(config.loadConfig(tmp.file("nan.conf")), "numeric value"));

    makeFile(tmp.file("suffix.conf"), "source: /srv/\ndays: 7x\n");
    EXPECT_TRUE(contains(config.loadConfig(tmp.file("suffix.conf")), "numeric value for the directive on line 2"));
    EXPECT_EQ(config.days(), 7);

    EXPECT_EQ(config.loadConfig(tmp.file("absent.conf")), "");
    EXPECT_NE(config.loadConfig(tmp.file("absent.conf"), true), "");
}


TEST_F(RunConfigTest, CommandLineBeatsConfigFile) {
    makeFile(tmp.file("aggregatebackups.conf"), "days: 14\naccount: backup\n");
    ASSERT_EQ(config.loadConfig(tmp.file("aggregatebackups.conf")), "");

    EXPECT_EQ(applyArgs({ "--days", "3", "-n", "-s", "backup2", "--workers", "2" }), "");
    EXPECT_EQ(config.days(), 3);
    EXPECT_EQ(config.account(), "backup");
    EXPECT_EQ(config.syncTarget(), "backup2");
    EXPECT_EQ(config.workers(), 2);
    EXPECT_TRUE(config.dryRun);
}


TEST_F(RunConfigTest, PositionalAllFour) {
    EXPECT_EQ(applyArgs({ "/srv/src/", "*.tgz", "/srv/dest/", "5" }), "");
    EXPECT_EQ(config.source(), "/srv/src/");
    EXPECT_EQ(config.pattern(), "*.tgz");
    EXPECT_EQ(config.destination(), "/srv/dest/");
    EXPECT_EQ(config.days(), 5);
}


TEST_F(RunConfigTest, PositionalAllOrNothing) {
    EXPECT_TRUE(contains(applyArgs({ "/srv/src/", "*.tgz", "/srv/dest/" }), "got 3 arguments"));
}


TEST_F(RunConfigTest, PositionalDaysMustBeNumeric) {
    EXPECT_TRUE(contains(applyArgs({ "/srv/src/", "*.tgz", "/srv/dest/", "week" }), "invalid numeric value"));
}


TEST_F(RunConfigTest, Validation) {
    ASSERT_EQ(config.applyOverride(CLI_DAYS, "-1"), "");
    EXPECT_TRUE(contains(config.validate(), "days"));

    RunConfig workers;
    ASSERT_EQ(workers.applyOverride(CLI_WORKERS, "0"), "");
    EXPECT_TRUE(contains(workers.validate(), "workers"));

    RunConfig account;
    ASSERT_EQ(account.applyOverride(CLI_ACCOUNT, "bad user"), "");
    EXPECT_TRUE(contains(account.validate(), "account"));

    RunConfig quoted;
    ASSERT_EQ(quoted.applyOverride(CLI_SOURCE, "/data/it's/"), "");
    EXPECT_TRUE(contains(quoted.validate(), "source"));

    RunConfig blank;
    ASSERT_EQ(blank.applyOverride(CLI_PATTERN, ""), "");
    EXPECT_NE(blank.validate(), "");

    EXPECT_NE(config.applyOverride("colour", "blue"), "");
}


TEST(Usage, ShowsTheSynopsis) {
    stringstream out;
    showUsage(out);

    EXPECT_TRUE(contains(out.str(), "usage: aggregatebackups [options] [source pattern destination days]"));
    EXPECT_TRUE(contains(out.str(), "all together or not at all"));
    EXPECT_TRUE(contains(out.str(), "--help"));
}
