
#include <ctype.h>
#include <fstream>
#include <set>
#include <sstream>
#include <pcre++.h>

#include "HostDirectory.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"

using namespace pcrepp;


char resolveEnvironment(string hostname) {
    if (hostname.length() < 4)
        return 0;

    char tag = (char)tolower((unsigned char)hostname[3]);
    return (tag == 'd' || tag == 'q' || tag == 'p' ? tag : 0);
}


/*******************************************************************************
 * listHosts(tag)
 *
 * Scan the hosts table for backup hosts in the given environment.  A line
 * qualifies when it starts with an address and names a host of the form
 * xxx<tag>spkxxx000.  Order follows the file and no address is listed twice.
 *******************************************************************************/
vector<Host> HostDirectory::listHosts(char tag) const {
    ifstream hosts;
    vector<Host> result;
    set<string> seen;

    hosts.open(hostsFile);
    if (!hosts.is_open())
        throw ABException("unable to read hosts file " + hostsFile + errtext());

    string shortNamePattern = string("[a-z]{3}") + tag + "spk[a-z]{3}[0-9]{3}";
    Pcre lineRE("^[0-9]{1,3}.*" + shortNamePattern);
    Pcre exactRE("^" + shortNamePattern + "$");
    Pcre fqdnRE("^(" + shortNamePattern + ")\\.");

    string dataLine;
    while (getline(hosts, dataLine)) {
        auto comment = dataLine.find("#");
        if (comment != string::npos)
            dataLine.erase(comment);

        if (!lineRE.search(dataLine))
            continue;

        vector<string> fields;
        stringstream tokenizer(dataLine);
        string field;

        while (tokenizer >> field)
            fields.push_back(field);

        if (fields.size() < 2)
            continue;

        Host host;
        host.address = fields[0];

        for (auto name = fields.begin() + 1; name != fields.end() && !host.shortName.length(); ++name) {
            if (exactRE.search(*name))
                host.shortName = *name;
            else
                if (fqdnRE.search(*name) && fqdnRE.matches())
                    host.shortName = fqdnRE.get_match(0);
        }

        if (!host.shortName.length()) {
            DEBUG(D_hosts) DFMT("no usable host name on line: " << dataLine);
            continue;
        }

        if (!seen.insert(host.address).second) {
            DEBUG(D_hosts) DFMT("skipping duplicate address " << host.address);
            continue;
        }

        DEBUG(D_hosts) DFMT("found " << host.shortName << " at " << host.address);
        result.push_back(host);
    }

    hosts.close();
    logDebug("found " + plural(result.size(), "host") + " in " + hostsFile + " for environment '" + string(1, tag) + "'");

    return result;
}
