#ifndef HOSTDIRECTORY_H
#define HOSTDIRECTORY_H

#include <string>
#include <vector>


using namespace std;


struct Host {
    string address;
    string shortName;
};


/********************************************************************
 * HostDirectory
 * Works out which environment (d, q or p) this machine belongs to
 * and which backup hosts in the hosts table share it.
 *******************************************************************/
class HostDirectory {
    string hostsFile;

public:
    HostDirectory(string filename = "/etc/hosts") : hostsFile(filename) {}

    // throws ABException when the hosts table can't be read
    vector<Host> listHosts(char tag) const;
};


// the environment tag from a host name, or 0 when it can't be determined
char resolveEnvironment(string hostname);

#endif
