
#include <iostream>
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <time.h>
#include <unistd.h>
#include <sys/socket.h>

#include "network.h"
#include "util_generic.h"
#include "exception.h"
#include "debug.h"
#include "globals.h"


using namespace std;


/*******************************************************************************
 * connectOne(addr, deadline)
 *
 * Non-blocking connect to a single resolved address.  Returns true once the
 * handshake completes, false on refusal, error or the deadline passing.
 * Throws ABException if a socket can't even be created.
 *******************************************************************************/
static bool connectOne(struct addrinfo *addr, time_t deadline) {
    int fd = socket(addr->ai_family, addr->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, addr->ai_protocol);

    if (fd < 0)
        throw ABException("socket(probe): " + string(strerror(errno)));

    bool connected = false;

    if (!connect(fd, addr->ai_addr, addr->ai_addrlen))
        connected = true;
    else
        if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;

            int result;
            do {
                time_t remaining = deadline - time(NULL);
                if (remaining <= 0) {
                    result = 0;
                    break;
                }

                pfd.revents = 0;
                result = poll(&pfd, 1, (int)remaining * 1000);
            } while (result == -1 && errno == EINTR);

            if (result > 0) {
                int soError = 0;
                socklen_t len = sizeof(soError);

                if (!getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) && !soError)
                    connected = true;
                else
                    DEBUG(D_probe) DFMT("connect failed: " << strerror(soError));
            }
            else
                DEBUG(D_probe) DFMT((result ? "poll error" + errtext() : "timed out"));
        }
        else
            DEBUG(D_probe) DFMT("connect failed" << errtext());

    close(fd);
    return connected;
}


/*******************************************************************************
 * probe(address, port, timeoutSecs)
 *
 * TCP reachability check: a connect bounded by timeoutSecs, closed as soon as
 * it succeeds with no data sent.  Accepts IP literals or resolvable names.
 *******************************************************************************/
probeResult TCP_Prober::probe(string address, int port, unsigned int timeoutSecs) {
    struct addrinfo hints;
    struct addrinfo *addrs = NULL;

    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    int rc = getaddrinfo(address.c_str(), to_string(port).c_str(), &hints, &addrs);
    if (rc) {
        DEBUG(D_probe) DFMT(address << ": unable to resolve (" << gai_strerror(rc) << ")");
        return Unreachable;
    }

    time_t deadline = time(NULL) + (timeoutSecs ? timeoutSecs : 1);
    bool reachable = false;

    try {
        for (auto addr = addrs; addr != NULL && !reachable; addr = addr->ai_next)
            reachable = connectOne(addr, deadline);
    }
    catch (ABException&) {
        freeaddrinfo(addrs);
        throw;
    }

    freeaddrinfo(addrs);

    DEBUG(D_probe) DFMT(address << ":" << port << (reachable ? " reachable" : " unreachable"));
    return (reachable ? Reachable : Unreachable);
}
