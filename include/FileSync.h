#ifndef FILESYNC_H
#define FILESYNC_H

#include <string>
#include <vector>
#include <time.h>

#include "ipc.h"


using namespace std;


// status codes; anything else is the transfer tool's own exit status
#define SYNC_SUCCESS            0
#define SYNC_USAGE_ERROR        1
#define SYNC_SOURCE_MISSING     100
#define SYNC_DEST_MISSING       101
#define SYNC_TIMEOUT            124


/********************************************************************
 * Location
 * A directory either on this machine or reachable over ssh, written
 * as account@host:path in the remote case.
 *******************************************************************/
struct Location {
    bool remote;
    string account;
    string host;
    string path;

    Location() : remote(false) {}
    static Location local(string path);
    static Location remoteAt(string account, string host, string path);
    static Location parse(string text);

    string upn() const { return account + "@" + host; }
    string str() const { return (remote ? upn() + ":" + path : path); }
};


struct SyncJob {
    Location source;
    string filePattern;         // blank means use the manifest
    Location destination;
    int retentionDays;
    bool dryRun;
    string manifest;            // file of names relative to source, one per line

    SyncJob() : retentionDays(0), dryRun(false) {}
};


struct SyncResult {
    int statusCode;
    vector<string> transferredFiles;
    string detail;

    SyncResult() : statusCode(SYNC_SUCCESS) {}
    bool success() const { return statusCode == SYNC_SUCCESS; }
};


/********************************************************************
 * FileSync
 * Pulls (or pushes) a filtered set of files between two Locations
 * with rsync, of which at most one may be remote.  Every external
 * command goes through the CommandRunner and is bounded by the
 * deadline.
 *******************************************************************/
class FileSync {
    CommandRunner &runner;
    int connectTimeout;
    string label;
    time_t deadline;

    SyncResult fail(int statusCode, string detail);
    int checkDirectory(const Location &location, string &detail);
    int createDirectory(const Location &location, string &detail);
    vector<string> remoteCandidates(const SyncJob &job, SyncResult &result);

public:
    FileSync(CommandRunner &cmdRunner, int timeout = 10, string procLabel = "sync", time_t deadlineTime = 0) :
        runner(cmdRunner), connectTimeout(timeout), label(procLabel), deadline(deadlineTime) {}

    SyncResult sync(const SyncJob &job);
    vector<string> listCandidates(const SyncJob &job, SyncResult &result);
};


vector<string> parseTransferLog(string raw);

vector<string> localCandidates(string directory, string pattern, int maxAgeDays);

string sshCommand(int timeout, bool noStdin = true);

// run command on location's host; command's own quoting must be single quotes
string remoteCommand(const Location &location, string command, int timeout);

string syncStatusText(int statusCode);

#endif
