#include <gtest/gtest.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <string.h>

#include "helpers.h"


// a loopback socket on a kernel-chosen port; listening or not
class LoopbackPort {
public:
    int fd;
    int port;

    LoopbackPort(bool listening) : fd(-1), port(0) {
        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0 || bind(fd, (struct sockaddr*)&addr, sizeof(addr)))
            return;

        socklen_t len = sizeof(addr);
        if (getsockname(fd, (struct sockaddr*)&addr, &len))
            return;

        port = ntohs(addr.sin_port);

        if (listening)
            listen(fd, 4);
        else {
            // nothing listens there now, so a connect is refused
            close(fd);
            fd = -1;
        }
    }

    ~LoopbackPort() {
        if (fd >= 0)
            close(fd);
    }
};


TEST(TcpProbe, ListeningPortIsReachable) {
    LoopbackPort server(true);
    ASSERT_GT(server.port, 0);

    TCP_Prober prober;
    EXPECT_EQ(prober.probe("127.0.0.1", server.port, 2), Reachable);
}


TEST(TcpProbe, ClosedPortIsUnreachable) {
    LoopbackPort closed(false);
    ASSERT_GT(closed.port, 0);

    TCP_Prober prober;
    time_t start = time(NULL);

    EXPECT_EQ(prober.probe("127.0.0.1", closed.port, 2), Unreachable);
    EXPECT_LE(time(NULL) - start, 3);
}


TEST(RunCommand, CollectsOutputAndStatus) {
    PipeRunner runner;
    auto result = runner.run("printf '%s|' 'a b' c", "printf", time(NULL) + 30);

    EXPECT_EQ(result.status, 0);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.output, "a b|c|");
}


TEST(RunCommand, CapturesStandardError) {
    PipeRunner runner;
    auto result = runner.run("ls /nonexistent/aggregatebackups_missing_dir", "ls", time(NULL) + 30);

    EXPECT_NE(result.status, 0);
    EXPECT_FALSE(result.timedOut);
    EXPECT_TRUE(contains(result.errors, "aggregatebackups_missing_dir"));
    EXPECT_FALSE(exists(slashConcat(TMP_OUTPUT_DIR, to_string(getpid()), "ls")));
}


TEST(RunCommand, MissingBinaryIs127) {
    PipeRunner runner;
    auto result = runner.run("/nonexistent/aggregatebackups_no_such_tool --flag", "missing", time(NULL) + 30);

    EXPECT_EQ(result.status, 127);
    EXPECT_FALSE(result.timedOut);
}


TEST(RunCommand, KilledAtTheDeadline) {
    PipeRunner runner;
    time_t start = time(NULL);
    auto result = runner.run("sleep 30", "sleep", start + 1);

    EXPECT_TRUE(result.timedOut);
    EXPECT_NE(result.status, 0);
    EXPECT_LT(time(NULL) - start, 5);
}
