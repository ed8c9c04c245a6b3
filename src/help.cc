#include <iostream>
#include <string>
#include "help.h"
#include "RunConfig.h"
#include "globals.h"
#include "util_generic.h"


using namespace std;

#define SYNOPSIS "aggregatebackups [options] [source pattern destination days]"


void showUsage(ostream &out) {
    out << "usage: " << SYNOPSIS << "\n"
        << "       source, pattern, destination and days are given all together or not at all\n"
        << "       -c [file] reads settings from file, -n is a dry run, -s [host] forwards to host\n"
        << "Use --help for a list of options." << endl;
}


void showHelp(enum helpType kind) {
    switch (kind) {
        case hDefaults: {
            RunConfig config;
            cout << "Configuration defaults:" << endl;

            char buffer[200];
            for (auto &cfg: config.settings) {
                snprintf(buffer, sizeof(buffer), "   %-15s %s", cfg.display_name.c_str(), cfg.value.length() ? cfg.value.c_str() : "(none)");
                cout << buffer << endl;
            }
            break;
        }

        case hOptions: {
            string helpText = string(SYNOPSIS) + "\n\n"
            + string(BOLDBLUE) + "WHAT TO PULL" + string(RESET) + "\n"
            + "   source pattern destination days\n"
            + "                       Optional, but all four or none. Directories are plain paths with a trailing '/',\n"
            + "                       never user@host:path; each host's backups are read from <source>/<host>/ and\n"
            + "                       written to <destination>/<host>/.\n"
            + "   --source [dir]      Directory on each remote host holding the per-host backup directories\n"
            + "   --pattern [glob]    Shell glob matched against backup filenames (default *_backup*)\n"
            + "   --destination [dir] Local directory to aggregate backups into\n"
            + "   --days [x]          Pull files up to x days old and prune local copies older than x days (default 7)\n"
            + "\n" + string(BOLDBLUE) + "HOSTS\n" + RESET
            + "   --hosts [file]      Hosts table to read backup hosts from (default /etc/hosts)\n"
            + "   --account [name]    Account to ssh and rsync as (default splunk)\n"
            + "   --port [port]       Port that must accept connections before a host is contacted (default 22)\n"
            + "   --timeout [secs]    Connection timeout for the probe, ssh and rsync (default 10)\n"
            + "   --deadline [secs]   Give up on a host that's still running after secs (default 1800)\n"
            + "   --workers [x]       Process x hosts at a time (default 1)\n"
            + "\n" + string(BOLDBLUE) + "FORWARDING\n" + RESET
            + "   -s, --sync [host]   After pulling, push the newly copied files on to host:<destination>\n"
            + "   --manifest [file]   List of files to forward, removed once the forward succeeds\n"
            + "                       (default /tmp/aggregatebackups_sync_files.txt)\n"
            + "\n" + string(BOLDBLUE) + "ALERTS\n" + RESET
            + "   --notify [contact]  Where to send the failure alert; email addresses and/or script names, comma separated\n"
            + "   --from [addr]       Use addr as the sending/from address for alert emails\n"
            + "\n" + string(BOLDBLUE) + "GENERAL\n" + RESET
            + "   -c, --config [file] Read settings from file (default /etc/aggregatebackups/aggregatebackups.conf)\n"
            + "   --logdir [dir]      Use dir for the log directory (default /var/log)\n"
            + "   -n, --dryrun        Report what would be copied without changing anything; no pruning, no alert\n"
            + "   -d, --debug         Write debug messages to the log\n"
            + "   -v[options]         Verbose debugging output to the screen: -v, --vv or -v+probe-prune style selectors\n"
            + "   --defaults          Display the default settings\n"
            + "   --nocolor           Disable color output\n"
            + "   -V, --version       Show the version\n"
            + "   -h, --help          This help\n";

            cout << helpText;
        }

        break;

        case hSyntax:
        default:
            cout << R"END(aggregatebackups pulls recent backup files from every backup host in this machine's
environment (per the hosts table) into a local directory, prunes copies past the
retention window, and optionally forwards what it pulled to another server.

    • Use "aggregatebackups --help" for options.)END" << endl;
        break;
    }
}
