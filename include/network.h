#ifndef NETWORK_H
#define NETWORK_H

#include <string>

using std::string;

#define SSH_PORT    22


enum probeResult { Unreachable, Reachable };


/********************************************************************
 * Prober
 * Answers one question: does this host accept TCP connections on
 * the port right now?  TCP_Prober really connects; tests hand the
 * coordinator a prober with canned answers.
 *******************************************************************/
class Prober {
public:
    virtual ~Prober() {}
    virtual probeResult probe(string address, int port = SSH_PORT, unsigned int timeoutSecs = 10) = 0;
};


class TCP_Prober : public Prober {
public:
    probeResult probe(string address, int port = SSH_PORT, unsigned int timeoutSecs = 10);
};


#endif
