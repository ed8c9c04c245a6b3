
#include <atomic>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "BatchCoordinator.h"
#include "RetentionPruner.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"


string hostStateName(HostState state) {
    switch (state) {
        case hsPending: return "pending";
        case hsProbeFailed: return "probe failed";
        case hsProbed: return "probed";
        case hsPruned: return "pruned";
        case hsSynced: return "synced";
        case hsSyncFailed: return "sync failed";
    }

    return "unknown";
}


void RunOutcome::addError(logSeverity severity, string message) {
    errorMessages.push_back(severityName(severity) + ": " + message);
    log(message, severity);
}


void BatchCoordinator::record(const HostReport &report, vector<pair<logSeverity, string>> &messages) {
    lock_guard<mutex> lock(outcomeLock);

    outcome.perHost[report.host.address] = report;

    for (auto &message: messages)
        if (message.first >= lError)
            outcome.addError(message.first, message.second);
        else
            log(message.second, message.first);

    if (report.state == hsSynced)
        for (auto &file: report.result.transferredFiles)
            outcome.allTransferredFiles.push_back(slashConcat(report.host.shortName, file));
}


bool BatchCoordinator::probeSecondary() {
    string target = config.syncTarget();

    if (!target.length())
        return false;

    try {
        outcome.secondaryReachable = prober.probe(target, config.port(), config.timeout()) == Reachable;
    }
    catch (ABException &e) {
        log("unable to probe " + target + ": " + e.detail(), lWarning);
        outcome.secondaryReachable = false;
    }

    if (!outcome.secondaryReachable)
        log("Specified sync server (" + target + ") is unreachable or unavailable. Nothing will be forwarded.", lError);
    else
        logDebug("sync server " + target + " is reachable");

    return outcome.secondaryReachable;
}


/*******************************************************************************
 * processHost(host)
 *
 * One host from start to finish: probe, prune, sync.  A host that doesn't
 * answer the probe is never pruned or synced.  Every outcome, good or bad,
 * is recorded; nothing is thrown.
 *******************************************************************************/
HostReport BatchCoordinator::processHost(const Host &host) {
    HostReport report;
    report.host = host;
    vector<pair<logSeverity, string>> messages;

    string shortName = host.shortName;
    time_t deadline = time(NULL) + config.deadline();

    DEBUG(D_coord) DFMT(shortName << " (" << host.address << "): starting");

    probeResult reachable = Unreachable;
    try {
        reachable = prober.probe(host.address, config.port(), config.timeout());
    }
    catch (ABException &e) {
        messages.push_back({lWarning, "[" + shortName + "] unable to probe " + host.address + ": " + e.detail()});
    }

    if (reachable != Reachable) {
        report.state = hsProbeFailed;
        messages.push_back({lCritical, shortName + " backup transfer skipped. reason: connection check failed / server unreachable."});
        record(report, messages);
        return report;
    }

    report.state = hsProbed;
    logDebug("Communication attempt to " + shortName + " successful.");

    Location source = Location::remoteAt(config.account(), shortName, addSlash(slashConcat(config.source(), shortName)));
    Location destination = Location::parse(addSlash(slashConcat(config.destination(), shortName)));

    RetentionPruner pruner(runner, config.timeout(), shortName, deadline);
    string pruneError = pruner.prune(destination, config.pattern(), config.days(), config.dryRun);

    if (pruneError.length())
        messages.push_back({lWarning, "[" + shortName + "] unable to prune " + destination.str() + ": " + pruneError});
    else
        if (!config.dryRun)
            report.state = hsPruned;

    SyncJob job;
    job.source = source;
    job.filePattern = config.pattern();
    job.destination = destination;
    job.retentionDays = config.days();
    job.dryRun = config.dryRun;

    logDebug("Attempting to copy files from " + shortName + "...");
    FileSync fileSync(runner, config.timeout(), shortName, deadline);
    report.result = fileSync.sync(job);

    if (!report.result.success()) {
        report.state = hsSyncFailed;

        switch (report.result.statusCode) {
            case SYNC_SOURCE_MISSING:
                messages.push_back({lError, "Source directory (" + config.source() + ") doesn't exist on " + shortName + ". Backup transfer skipped."});
                break;

            case SYNC_DEST_MISSING:
                messages.push_back({lError, "Destination directory (" + destination.str() + ") doesn't exist and couldn't be created. Backup transfer skipped."});
                break;

            case SYNC_TIMEOUT:
                messages.push_back({lError, shortName + " ran past its " + to_string(config.deadline()) + " second deadline and was stopped."});
                break;

            default:
                messages.push_back({lError, shortName + ": " + syncStatusText(report.result.statusCode) + "."});
        }

        if (report.result.detail.length())
            messages.push_back({lInfo, "[" + shortName + "] " + report.result.detail});

        messages.push_back({lCritical, "Failure attempting to copy backups from " + shortName + " to " + config.destination() + "."});
    }
    else {
        report.state = hsSynced;

        string fileMsg = report.result.transferredFiles.size() ? perlJoin(",", report.result.transferredFiles) : "No files copied...";
        messages.push_back({lInfo, string(config.dryRun ? "Files that would be copied: " : "Files copied: ") + fileMsg});
        messages.push_back({lInfo, "Backup file(s) transfer completed from " + shortName + ":" + source.path + config.pattern() + " to " + destination.str()});
    }

    DEBUG(D_coord) DFMT(shortName << ": " << hostStateName(report.state));
    record(report, messages);
    return report;
}


/*******************************************************************************
 * processAll(hosts)
 *
 * Each host exactly once.  With a single worker that's a plain loop in
 * hosts-file order; otherwise a fixed set of threads pull the next host
 * until none are left.
 *******************************************************************************/
void BatchCoordinator::processAll(const vector<Host> &hosts) {
    size_t workers = (size_t)config.workers();

    if (workers <= 1 || hosts.size() <= 1) {
        for (auto &host: hosts)
            processHost(host);
        return;
    }

    atomic<size_t> nextHost(0);
    vector<thread> pool;

    for (size_t i = 0; i < workers && i < hosts.size(); ++i)
        pool.push_back(thread([this, &hosts, &nextHost]() {
            size_t index;
            while ((index = nextHost++) < hosts.size())
                processHost(hosts[index]);
        }));

    for (auto &worker: pool)
        worker.join();
}


/*******************************************************************************
 * forward()
 *
 * Push everything pulled this run on to the secondary target.  Only happens
 * when the target answered at startup and at least one host contributed
 * files.  The manifest is left behind when the push fails.  A dry run only
 * logs what it would have forwarded.
 *******************************************************************************/
void BatchCoordinator::forward() {
    string target = config.syncTarget();

    if (!target.length() || !outcome.secondaryReachable)
        return;

    if (!outcome.allTransferredFiles.size()) {
        logDebug("no new files to sync to " + target);
        return;
    }

    // dry-run pulls only listed what they would copy, so there's nothing local to push
    if (config.dryRun) {
        log("dry run: would forward " + plural(outcome.allTransferredFiles.size(), "file") + " to " + target);
        return;
    }

    outcome.forwardAttempted = true;
    string manifest = config.manifest();

    ofstream manifestFile;
    manifestFile.open(manifest, ios::trunc);

    if (!manifestFile.is_open()) {
        outcome.forwardResult.statusCode = SYNC_USAGE_ERROR;
        outcome.addError(lError, "unable to write sync manifest " + manifest + errtext());
        return;
    }

    for (auto &file: outcome.allTransferredFiles)
        manifestFile << file << "\n";
    manifestFile.close();

    SyncJob job;
    job.source = Location::local(addSlash(config.destination()));
    job.destination = Location::remoteAt(config.account(), target, config.destination());
    job.manifest = manifest;

    FileSync fileSync(runner, config.timeout(), "forward", time(NULL) + config.deadline());
    outcome.forwardResult = fileSync.sync(job);

    switch (outcome.forwardResult.statusCode) {
        case SYNC_SUCCESS:
            unlink(manifest.c_str());
            log("Files synced to " + target + ": " + perlJoin(",", outcome.forwardResult.transferredFiles));
            break;

        case SYNC_SOURCE_MISSING:
            outcome.addError(lError, "Sync source directory (" + config.destination() + ") doesn't exist");
            break;

        case SYNC_DEST_MISSING:
            outcome.addError(lError, "Sync destination directory (" + config.destination() + ") doesn't exist on " + target);
            break;

        default:
            outcome.addError(lError, "error while attempting to sync to " + target + ": " + syncStatusText(outcome.forwardResult.statusCode) +
                (outcome.forwardResult.detail.length() ? " (" + outcome.forwardResult.detail + ")" : ""));
    }
}


const RunOutcome &BatchCoordinator::run(const vector<Host> &hosts) {
    probeSecondary();
    processAll(hosts);
    forward();

    return outcome;
}
