/*
 * Copyright (C) 2023 Rick Ennis
 * This file is part of aggregatebackups.
 *
 * aggregatebackups is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * aggregatebackups is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with aggregatebackups.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  aggregatebackups
 *
 *  aggregatebackups collects the nightly backups of a fleet of hosts onto one
 *  server:
 *
 *  1. Host discovery
 *
 *     The environment (d, q or p) comes from the 4th character of this
 *     machine's name.  The backup hosts of that environment are read from
 *     the hosts table.
 *
 *  2. Pull
 *
 *     Each host that accepts a connection on its ssh port has the files
 *     matching the pattern, and no older than the retention window, copied
 *     from <source>/<host>/ to <destination>/<host>/ with rsync.  Before the
 *     pull, local copies older than the window are pruned.
 *
 *  3. Forward
 *
 *     Optionally (-s), everything pulled this run is pushed on to a secondary
 *     server.
 *
 *  Any failure along the way is logged and folded into one alert at the end
 *  of the run.
 */

#include <iostream>
#include <signal.h>
#include <syslog.h>
#include <unistd.h>
#include <string>
#include <vector>

#include "cxxopts.hpp"
#include "globals.h"
#include "debug.h"
#include "exception.h"
#include "help.h"
#include "util_generic.h"
#include "RunConfig.h"
#include "HostDirectory.h"
#include "BatchCoordinator.h"
#include "ReportSink.h"
#include "network.h"
#include "ipc.h"


using namespace std;


void cleanupScratch() {
    string scratchDir = slashConcat(TMP_OUTPUT_DIR, to_string(GLOBALS.pid));

    if (exists(scratchDir) && !rmrf(scratchDir))
        log("unable to remove scratch directory " + scratchDir, lWarning);
}


/*******************************************************************************
 * sigTermHandler(sig)
 *
 * Catch the configured signals, note the abort and clean up scratch files.
 *******************************************************************************/
void sigTermHandler(int sig) {
    log("operation aborted on interrupt (signal " + to_string(sig) + ")", lError);
    cleanupScratch();

    cerr << "\naggregatebackups: aborted" << endl;
    exit(1);
}


[[noreturn]] void usageError(string message) {
    log("Empty or invalid parameters supplied to script: " + message, lError);
    SCREENERR("error: " << message);
    showUsage(cerr);
    exit(1);
}


// stop before any host is touched, after sending the alert
[[noreturn]] void fatalSetup(const RunConfig &config, string message) {
    RunOutcome outcome;
    outcome.addError(lError, message);

    ReportSink sink(config);
    sink.report(outcome);

    log("aggregatebackups ended with a setup failure---------------------", lError);
    cleanupScratch();
    exit(1);
}


/*******************************************************************************
 * decodeDebugArgs(argc, argv)
 *
 * Enable selective debugging (modeled on the Exim MTA - Philip Hazel).
 * -v turns on the defaults, --vv everything, and -v+probe-prune style
 * arguments adjust the defaults.  Everything that isn't a debug selector is
 * returned for cxxopts to parse.
 *******************************************************************************/
vector<char*> decodeDebugArgs(int argc, char *argv[]) {
    vector<char*> remaining;
    GLOBALS.debugSelector = 0;

    for (int i = 0; i < argc; ++i) {
        string uarg = argv[i];

        if (i && uarg == "--vv") {
            GLOBALS.debugSelector = D_all;
            continue;
        }

        if (i && uarg == "-v") {
            GLOBALS.debugSelector = D_default;
            continue;
        }

        if (i && uarg.length() > 2 && uarg.substr(0, 2) == "-v") {
            string op = uarg.substr(2, 1);

            if (op == "=" || op == "-" || op == "+") {
                unsigned int selector = D_default;
                string error = decode_bits(&selector, uarg.substr(2, string::npos));

                if (error.length())
                    usageError(error);

                GLOBALS.debugSelector = selector;
                continue;
            }
        }

        remaining.push_back(argv[i]);
    }

    return remaining;
}


int main(int argc, char *argv[]) {
    timer AppTimer;
    AppTimer.start();

    signal(SIGTERM, sigTermHandler);
    signal(SIGINT, sigTermHandler);
    signal(SIGPIPE, SIG_IGN);    // a mail or script that exits early is a write error, not our exit

    GLOBALS.pid = getpid();
    GLOBALS.debugLog = false;
    GLOBALS.color = isatty(STDERR_FILENO);

    // default directories
    GLOBALS.confDir = CONF_DIR;
    GLOBALS.logDir = LOG_DIR;

    // overwrite with env vars (if any)
    string temp;
    temp = cppgetenv("AB_CONFDIR");
    if (temp.length()) GLOBALS.confDir = temp;

    temp = cppgetenv("AB_LOGDIR");
    if (temp.length()) GLOBALS.logDir = temp;

    openlog("aggregatebackups", LOG_PID | LOG_NDELAY, LOG_LOCAL1);

    auto args = decodeDebugArgs(argc, argv);
    int argCount = (int)args.size();
    args.push_back(NULL);
    char **argValues = args.data();

    cxxopts::Options options("aggregatebackups", "Aggregate backups from remote hosts");
    defineOptions(options);

    RunConfig config;
    string error;

    try {
        auto cli = options.parse(argCount, argValues);
        GLOBALS.color = GLOBALS.color && !cli[CLI_NOCOLOR].as<bool>();

        if (cli[CLI_HELP].as<bool>()) {
            showHelp(hOptions);
            exit(0);
        }

        if (cli[CLI_VERSION].as<bool>()) {
            cout << "aggregatebackups v" << VERSION << endl;
            exit(0);
        }

        if (cli[CLI_DEFAULTS].as<bool>()) {
            showHelp(hDefaults);
            exit(0);
        }

        GLOBALS.debugLog = cli[CLI_DEBUG].as<bool>();

        bool explicitConfig = cli.count(CLI_CONFIG) > 0;
        string confFile = explicitConfig ? cli[CLI_CONFIG].as<string>() : slashConcat(GLOBALS.confDir, CONF_FILE);

        if ((error = config.loadConfig(confFile, explicitConfig)).length() ||
            (error = config.applyCli(cli)).length() ||
            (error = config.validate()).length())
            usageError(error);
    }
    catch (const std::exception &e) {
        usageError(e.what());
    }

    if (config.settings[sLogDir].value.length())
        GLOBALS.logDir = config.settings[sLogDir].value;

    log("aggregatebackups started-------------------");

    if (GLOBALS.debugLog)
        log("Running script in debug mode.");

    if (config.dryRun)
        log("Running script in no-change mode.");

    DEBUG(D_config) config.fullDump();

    char tag = resolveEnvironment(hostname());
    if (!tag)
        fatalSetup(config, "Environment unable to be determined for script to run in (" + hostname() + "). Canceling script...");

    logDebug("Script running in the '" + string(1, tag) + "' environment");

    vector<Host> hosts;
    try {
        HostDirectory directory(config.hostsFile());
        hosts = directory.listHosts(tag);
    }
    catch (ABException &e) {
        fatalSetup(config, "Script failed while attempting to retrieve servernames from the hosts file: " + e.detail());
    }

    if (!hosts.size())
        log("no backup hosts found in " + config.hostsFile() + " for the '" + string(1, tag) + "' environment", lWarning);

    TCP_Prober prober;
    PipeRunner runner;
    BatchCoordinator coordinator(config, runner, prober);
    coordinator.run(hosts);

    ReportSink sink(config);
    sink.report(coordinator.getOutcome());

    cleanupScratch();

    AppTimer.stop();
    log("aggregatebackups ended (" + AppTimer.elapsed() + ")---------------------");

    return 0;
}
