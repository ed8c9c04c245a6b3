#include <gtest/gtest.h>

#include "BatchCoordinator.h"
#include "helpers.h"


class CoordinatorTest : public ::testing::Test {
protected:
    TempDir tmp;
    RunConfig config;
    FakeRunner runner;
    FakeProber prober;

    Host hostA { "10.0.0.1", "abcdspkxyz001" };
    Host hostB { "10.0.0.2", "abcdspkxyz002" };

    void SetUp() {
        ASSERT_EQ(config.applyOverride(CLI_DEST, tmp.file("aggregate/")), "");
        ASSERT_EQ(config.applyOverride(CLI_MANIFEST, tmp.file("manifest.txt")), "");

        runner.respond = threeBackups;
    }

    // every reachable host has the same three recent backups
    static cmdResult threeBackups(const string &command) {
        if (contains(command, "rsync ") && contains(command, "@backup2:"))
            return succeeded(">f+++++++++ abcdspkxyz001/a_backup1\n");

        if (contains(command, "rsync "))
            return succeeded(">f+++++++++ a_backup1\n>f+++++++++ a_backup2\n>f+++++++++ a_backup3\n");

        if (contains(command, "find ."))
            return succeeded("./a_backup1\n./a_backup2\n./a_backup3\n");

        return succeeded();
    }
};


TEST_F(CoordinatorTest, OneReachableOneNot) {
    prober.answers[hostA.address] = Reachable;

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA, hostB });

    ASSERT_EQ(outcome.perHost.size(), 2u);
    EXPECT_EQ(outcome.perHost.at(hostA.address).state, hsSynced);
    EXPECT_EQ(outcome.perHost.at(hostA.address).result.transferredFiles.size(), 3u);
    EXPECT_EQ(outcome.perHost.at(hostB.address).state, hsProbeFailed);

    vector<string> expected { "abcdspkxyz001/a_backup1", "abcdspkxyz001/a_backup2", "abcdspkxyz001/a_backup3" };
    EXPECT_EQ(outcome.allTransferredFiles, expected);

    ASSERT_EQ(outcome.errorMessages.size(), 1u);
    EXPECT_TRUE(contains(outcome.errorMessages[0], "CRITICAL: abcdspkxyz002 backup transfer skipped"));
    EXPECT_FALSE(contains(outcome.errorMessages[0], "abcdspkxyz001"));

    EXPECT_TRUE(isDirectory(tmp.file("aggregate/abcdspkxyz001")));
}


TEST_F(CoordinatorTest, UnreachableHostIsNeverTouched) {
    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostB });

    EXPECT_EQ(outcome.perHost.at(hostB.address).state, hsProbeFailed);
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_FALSE(exists(tmp.file("aggregate/abcdspkxyz002")));
}


TEST_F(CoordinatorTest, ProbeErrorCountsAsUnreachable) {
    prober.broken.insert(hostA.address);

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_EQ(outcome.perHost.at(hostA.address).state, hsProbeFailed);
    EXPECT_TRUE(runner.commands.empty());
    EXPECT_TRUE(outcome.anyError());
}


TEST_F(CoordinatorTest, OldBackupsPrunedBeforeThePull) {
    makeFile(tmp.file("aggregate/abcdspkxyz001/stale_backup.tgz"), "stale", 10);
    makeFile(tmp.file("aggregate/abcdspkxyz001/fresh_backup.tgz"), "fresh", 2);
    prober.answers[hostA.address] = Reachable;

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_EQ(outcome.perHost.at(hostA.address).state, hsSynced);
    EXPECT_FALSE(exists(tmp.file("aggregate/abcdspkxyz001/stale_backup.tgz")));
    EXPECT_TRUE(exists(tmp.file("aggregate/abcdspkxyz001/fresh_backup.tgz")));
}


TEST_F(CoordinatorTest, FailureOnOneHostDoesntStopTheOthers) {
    prober.answers[hostA.address] = Reachable;
    prober.answers[hostB.address] = Reachable;

    runner.respond = [](const string &command) {
        if (contains(command, "abcdspkxyz002") && contains(command, "find ."))
            return failed(255, "connection closed");
        return threeBackups(command);
    };

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostB, hostA });

    EXPECT_EQ(outcome.perHost.at(hostB.address).state, hsSyncFailed);
    EXPECT_EQ(outcome.perHost.at(hostB.address).result.statusCode, 255);
    EXPECT_EQ(outcome.perHost.at(hostA.address).state, hsSynced);
    EXPECT_EQ(outcome.allTransferredFiles.size(), 3u);

    bool critical = false;
    for (auto &message: outcome.errorMessages)
        critical |= contains(message, "CRITICAL: Failure attempting to copy backups from abcdspkxyz002");
    EXPECT_TRUE(critical);
}


TEST_F(CoordinatorTest, MissingSourceDirectory) {
    prober.answers[hostA.address] = Reachable;
    runner.respond = [](const string &command) {
        return (contains(command, "test -d") ? failed(1) : threeBackups(command));
    };

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_EQ(outcome.perHost.at(hostA.address).result.statusCode, SYNC_SOURCE_MISSING);
    ASSERT_GE(outcome.errorMessages.size(), 2u);
    EXPECT_TRUE(contains(outcome.errorMessages[0], "ERROR: Source directory (/data/backups/) doesn't exist on abcdspkxyz001"));
    EXPECT_EQ(runner.count("rsync "), 0u);
}


TEST_F(CoordinatorTest, DryRunChangesNothing) {
    config.dryRun = true;
    makeFile(tmp.file("aggregate/abcdspkxyz002/stale_backup.tgz"), "stale", 10);
    prober.answers[hostA.address] = Reachable;
    prober.answers[hostB.address] = Reachable;

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA, hostB });

    EXPECT_EQ(outcome.perHost.at(hostA.address).state, hsSynced);
    EXPECT_FALSE(exists(tmp.file("aggregate/abcdspkxyz001")));
    EXPECT_TRUE(exists(tmp.file("aggregate/abcdspkxyz002/stale_backup.tgz")));
    EXPECT_EQ(runner.count("rsync "), 2u);
    EXPECT_EQ(runner.count(" -n "), 2u);
}


TEST_F(CoordinatorTest, WorkerPoolVisitsEachHostOnce) {
    ASSERT_EQ(config.applyOverride(CLI_WORKERS, "3"), "");

    vector<Host> hosts;
    for (int i = 1; i <= 7; ++i) {
        Host host { "10.0.1." + to_string(i), "abcdspkxyz10" + to_string(i) };
        prober.answers[host.address] = Reachable;
        hosts.push_back(host);
    }

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run(hosts);

    EXPECT_EQ(outcome.perHost.size(), 7u);
    EXPECT_EQ(prober.probed.size(), 7u);
    EXPECT_EQ(runner.count("find ."), 7u);
    EXPECT_EQ(runner.count("rsync "), 7u);
    EXPECT_EQ(outcome.allTransferredFiles.size(), 21u);
    EXPECT_FALSE(outcome.anyError());
}


TEST_F(CoordinatorTest, UnreachableSecondaryMeansNoForward) {
    ASSERT_EQ(config.applyOverride(CLI_SYNC, "backup2"), "");
    prober.answers[hostA.address] = Reachable;

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_FALSE(outcome.secondaryReachable);
    EXPECT_FALSE(outcome.forwardAttempted);
    EXPECT_FALSE(exists(config.manifest()));
    EXPECT_EQ(runner.count("@backup2"), 0u);
    EXPECT_EQ(outcome.allTransferredFiles.size(), 3u);
}


TEST_F(CoordinatorTest, ForwardToSecondary) {
    ASSERT_EQ(config.applyOverride(CLI_SYNC, "backup2"), "");
    prober.answers[hostA.address] = Reachable;
    prober.answers["backup2"] = Reachable;

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_TRUE(outcome.forwardAttempted);
    EXPECT_TRUE(outcome.forwardResult.success());
    EXPECT_EQ(runner.count("rsync "), 2u);
    EXPECT_EQ(runner.count("--files-from=" + config.manifest()), 1u);
    EXPECT_EQ(runner.count("'splunk@backup2:" + config.destination() + "'"), 1u);
    EXPECT_FALSE(exists(config.manifest()));
    EXPECT_FALSE(outcome.anyError());
}


TEST_F(CoordinatorTest, FailedForwardKeepsTheManifest) {
    ASSERT_EQ(config.applyOverride(CLI_SYNC, "backup2"), "");
    prober.answers[hostA.address] = Reachable;
    prober.answers["backup2"] = Reachable;

    runner.respond = [](const string &command) {
        if (contains(command, "rsync ") && contains(command, "@backup2:"))
            return failed(12, "protocol data stream error");
        return threeBackups(command);
    };

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_TRUE(outcome.forwardAttempted);
    EXPECT_EQ(outcome.forwardResult.statusCode, 12);
    ASSERT_TRUE(exists(config.manifest()));
    EXPECT_EQ(readFile(config.manifest()), "abcdspkxyz001/a_backup1\nabcdspkxyz001/a_backup2\nabcdspkxyz001/a_backup3\n");

    ASSERT_EQ(outcome.errorMessages.size(), 1u);
    EXPECT_TRUE(contains(outcome.errorMessages[0], "sync to backup2"));
}


TEST_F(CoordinatorTest, NothingNewMeansNoForward) {
    ASSERT_EQ(config.applyOverride(CLI_SYNC, "backup2"), "");
    prober.answers["backup2"] = Reachable;

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostB });

    EXPECT_TRUE(outcome.secondaryReachable);
    EXPECT_FALSE(outcome.forwardAttempted);
    EXPECT_FALSE(exists(config.manifest()));
}


TEST_F(CoordinatorTest, DryRunDoesntForward) {
    config.dryRun = true;
    ASSERT_EQ(config.applyOverride(CLI_SYNC, "backup2"), "");
    prober.answers[hostA.address] = Reachable;
    prober.answers["backup2"] = Reachable;

    // nothing was really pulled, so a real push would find no files to send
    runner.respond = [](const string &command) {
        if (contains(command, "rsync ") && contains(command, "@backup2:"))
            return failed(23, "link_stat abcdspkxyz001/a_backup1 failed");
        return threeBackups(command);
    };

    BatchCoordinator coordinator(config, runner, prober);
    auto &outcome = coordinator.run({ hostA });

    EXPECT_EQ(outcome.allTransferredFiles.size(), 3u);
    EXPECT_TRUE(outcome.secondaryReachable);
    EXPECT_FALSE(outcome.forwardAttempted);
    EXPECT_FALSE(outcome.anyError());
    EXPECT_FALSE(exists(config.manifest()));
    EXPECT_EQ(runner.count("@backup2:"), 0u);

    string logText = readFile(slashConcat(GLOBALS.logDir, LOG_FILE));
    EXPECT_TRUE(contains(logText, "dry run: would forward"));
}
