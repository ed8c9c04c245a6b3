#ifndef BATCHCOORDINATOR_H
#define BATCHCOORDINATOR_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "HostDirectory.h"
#include "FileSync.h"
#include "RunConfig.h"
#include "network.h"
#include "util_generic.h"


using namespace std;


enum HostState { hsPending, hsProbeFailed, hsProbed, hsPruned, hsSynced, hsSyncFailed };

string hostStateName(HostState state);


struct HostReport {
    Host host;
    HostState state;
    SyncResult result;

    HostReport() : state(hsPending) {}
};


/********************************************************************
 * RunOutcome
 * Everything the run found out, per host and overall.  Only hosts
 * that synced successfully contribute to allTransferredFiles, as
 * <shortName>/<file>.
 *******************************************************************/
struct RunOutcome {
    map<string, HostReport> perHost;    // by address
    vector<string> errorMessages;       // "SEVERITY: text", in the order they happened
    vector<string> allTransferredFiles;

    bool secondaryReachable;
    bool forwardAttempted;
    SyncResult forwardResult;

    RunOutcome() : secondaryReachable(false), forwardAttempted(false) {}

    bool anyError() const { return errorMessages.size() > 0; }
    void addError(logSeverity severity, string message);
};


/********************************************************************
 * BatchCoordinator
 * Drives every host through probe, prune and sync, isolating each
 * host's failures, then forwards the aggregate to the secondary
 * target when there is one.
 *******************************************************************/
class BatchCoordinator {
    const RunConfig &config;
    CommandRunner &runner;
    Prober &prober;
    RunOutcome outcome;
    mutex outcomeLock;

    void record(const HostReport &report, vector<pair<logSeverity, string>> &messages);

public:
    BatchCoordinator(const RunConfig &runConfig, CommandRunner &cmdRunner, Prober &hostProber) :
        config(runConfig), runner(cmdRunner), prober(hostProber) {}

    bool probeSecondary();
    HostReport processHost(const Host &host);
    void processAll(const vector<Host> &hosts);
    void forward();

    const RunOutcome &run(const vector<Host> &hosts);
    RunOutcome &getOutcome() { return outcome; }
};

#endif
