
#include <algorithm>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <pcre++.h>

#include "FileSync.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"

using namespace pcrepp;


Location Location::local(string path) {
    Location location;
    location.path = path;
    return location;
}


Location Location::remoteAt(string account, string host, string path) {
    Location location;
    location.remote = true;
    location.account = account;
    location.host = host;
    location.path = path;
    return location;
}


Location Location::parse(string text) {
    Pcre upnRE("^([\\w.-]+)@([a-zA-Z0-9_.-]+):(\\S+)$");

    if (upnRE.search(text) && upnRE.matches() > 2)
        return remoteAt(upnRE.get_match(0), upnRE.get_match(1), upnRE.get_match(2));

    return local(text);
}


/*******************************************************************************
 * parseTransferLog(raw)
 *
 * Pick the transferred filenames out of rsync's itemized output (-i).  Only
 * regular files that were actually sent or received count: the line starts
 * with '<' or '>' followed by 'f'.  Everything else (directories, attribute
 * only changes, deletions, warnings) is ignored.
 *******************************************************************************/
vector<string> parseTransferLog(string raw) {
    vector<string> files;
    stringstream tokenizer(raw);
    string line;

    while (getline(tokenizer, line)) {
        if (line.length() && line.back() == '\r')
            line.pop_back();

        if (line.length() < 2 || (line[0] != '>' && line[0] != '<') || line[1] != 'f')
            continue;

        // the change summary is one word, the name is everything after it
        auto space = line.find(' ');
        if (space == string::npos)
            continue;

        string filename = line.substr(space + 1);
        while (filename.length() && filename[0] == ' ')
            filename.erase(0, 1);

        if (filename.substr(0, 2) == "./")
            filename.erase(0, 2);

        if (filename.length()) {
            DEBUG(D_transfer) DFMT("transferred: " << filename);
            files.push_back(filename);
        }
    }

    return files;
}


string sshCommand(int timeout, bool noStdin) {
    return string("ssh -") + (noStdin ? "n" : "") + "q -o BatchMode=yes -o ConnectTimeout=" + to_string(timeout);
}


string remoteCommand(const Location &location, string command, int timeout) {
    return sshCommand(timeout) + " " + location.upn() + " \"" + command + "\"";
}


string syncStatusText(int statusCode) {
    switch (statusCode) {
        case SYNC_SUCCESS: return "success";
        case SYNC_USAGE_ERROR: return "usage error";
        case SYNC_SOURCE_MISSING: return "source directory missing";
        case SYNC_DEST_MISSING: return "destination directory missing";
        case SYNC_TIMEOUT: return "deadline exceeded";
        case 127: return "unable to execute the transfer";
        default: return "transfer failed with status " + to_string(statusCode);
    }
}


struct candidateData {
    string root;
    string pattern;
    time_t maxAge;
    time_t now;
    vector<string> files;
};


bool candidateCallback(pdCallbackData &file) {
    auto data = (candidateData*)file.dataPtr;

    if (S_ISREG(file.statData.st_mode) && globMatch(data->pattern, file.filename) &&
        data->now - file.statData.st_mtime <= data->maxAge)
        data->files.push_back(file.filename.substr(data->root.length()));

    return true;
}


// regular files under directory whose basename matches the glob and that are no older than maxAgeDays
vector<string> localCandidates(string directory, string pattern, int maxAgeDays) {
    candidateData data;
    data.root = addSlash(directory);
    data.pattern = pattern;
    data.maxAge = (time_t)maxAgeDays * SECS_PER_DAY;
    data.now = time(NULL);

    if (isDirectory(directory))
        processDirectory(data.root, candidateCallback, &data);

    sort(data.files.begin(), data.files.end());
    return data.files;
}


SyncResult FileSync::fail(int statusCode, string detail) {
    SyncResult result;
    result.statusCode = statusCode;
    result.detail = detail;

    DEBUG(D_sync) DFMT(label << ": " << syncStatusText(statusCode) << (detail.length() ? " (" + detail + ")" : ""));
    return result;
}


// 0 if the directory exists, 1 if it doesn't, otherwise the ssh failure status
int FileSync::checkDirectory(const Location &location, string &detail) {
    if (!location.remote)
        return (isDirectory(location.path) ? 0 : 1);

    auto result = runner.run(remoteCommand(location, "test -d " + shellQuote(location.path), connectTimeout), label, deadline);
    detail = result.errors;

    if (result.timedOut)
        return SYNC_TIMEOUT;

    return result.status;
}


int FileSync::createDirectory(const Location &location, string &detail) {
    if (!location.remote) {
        if (mkdirp(location.path)) {
            detail = "unable to mkdir " + location.path + errtext();
            return 1;
        }

        return 0;
    }

    auto result = runner.run(remoteCommand(location, "mkdir -p " + shellQuote(location.path), connectTimeout), label, deadline);
    detail = result.errors;

    return (result.timedOut ? SYNC_TIMEOUT : result.status);
}


vector<string> FileSync::remoteCandidates(const SyncJob &job, SyncResult &result) {
    string findCmd = "cd " + shellQuote(job.source.path) + " && find . -type f -name " + shellQuote(job.filePattern) +
        " -mmin -" + to_string((long)job.retentionDays * 1440);

    auto listing = runner.run(remoteCommand(job.source, findCmd, connectTimeout), label, deadline);
    vector<string> files;

    if (listing.timedOut || listing.status) {
        result.statusCode = listing.timedOut ? SYNC_TIMEOUT : listing.status;
        result.detail = "unable to list files on " + job.source.host + (listing.errors.length() ? ": " + listing.errors : "");
        return files;
    }

    stringstream tokenizer(listing.output);
    string line;

    while (getline(tokenizer, line)) {
        line = trimSpace(line);

        if (line.substr(0, 2) == "./")
            line.erase(0, 2);

        if (line.length())
            files.push_back(line);
    }

    sort(files.begin(), files.end());
    return files;
}


/*******************************************************************************
 * listCandidates(job, result)
 *
 * The files a job would transfer, relative to the source directory: a
 * pattern and age based selection, or the manifest when there's no pattern.
 * Problems are recorded in result.statusCode.
 *******************************************************************************/
vector<string> FileSync::listCandidates(const SyncJob &job, SyncResult &result) {
    vector<string> files;

    if (job.filePattern.length())
        return (job.source.remote ? remoteCandidates(job, result) : localCandidates(job.source.path, job.filePattern, job.retentionDays));

    ifstream manifest;
    manifest.open(job.manifest);

    if (!manifest.is_open()) {
        result.statusCode = SYNC_USAGE_ERROR;
        result.detail = "unable to read manifest " + job.manifest + errtext();
        return files;
    }

    string line;
    while (getline(manifest, line))
        if ((line = trimSpace(line)).length())
            files.push_back(line);

    manifest.close();
    return files;
}


/*******************************************************************************
 * sync(job)
 *
 * Preconditions first, each one final: at most one remote side, the source
 * has to exist and the destination has to exist or be creatable.  Then the
 * candidates are handed to rsync as a files-from list.  Files already at
 * the destination with the same size are skipped.
 *******************************************************************************/
SyncResult FileSync::sync(const SyncJob &job) {
    if (job.source.remote && job.destination.remote)
        return fail(SYNC_USAGE_ERROR, "source and destination can't both be remote");

    if (!job.source.path.length() || !job.destination.path.length())
        return fail(SYNC_USAGE_ERROR, "source and destination are both required");

    if (!job.filePattern.length() && !job.manifest.length())
        return fail(SYNC_USAGE_ERROR, "either a file pattern or a manifest is required");

    string detail;
    int status;

    DEBUG(D_sync) DFMT(label << ": checking if source directory (" << job.source.str() << ") exists");
    if ((status = checkDirectory(job.source, detail)))
        return fail(status == 1 ? SYNC_SOURCE_MISSING : status, detail);

    DEBUG(D_sync) DFMT(label << ": checking if destination directory (" << job.destination.str() << ") exists");
    if ((status = checkDirectory(job.destination, detail))) {
        if (status != 1)
            return fail(status, detail);

        if (job.dryRun)
            log("[" + label + "] dry run: would create destination directory " + job.destination.str());
        else {
            log("[" + label + "] creating destination directory " + job.destination.str());

            if ((status = createDirectory(job.destination, detail)))
                return fail(status == SYNC_TIMEOUT ? SYNC_TIMEOUT : SYNC_DEST_MISSING, detail);
        }
    }

    SyncResult result;
    auto candidates = listCandidates(job, result);

    if (!result.success())
        return fail(result.statusCode, result.detail);

    if (!candidates.size()) {
        DEBUG(D_sync) DFMT(label << ": nothing to transfer");
        return result;
    }

    DEBUG(D_sync) DFMT(label << ": " << plural(candidates.size(), "candidate file"));

    // the manifest is already a files-from list; a pattern selection gets a scratch one
    string listFile = job.manifest;
    bool scratchList = job.filePattern.length() > 0;

    if (scratchList) {
        string scratchDir = slashConcat(TMP_OUTPUT_DIR, to_string(getpid()));
        listFile = slashConcat(scratchDir, "filelist." + safeFilename(label) + ".txt");

        ofstream listOut;
        if (!mkdirp(scratchDir))
            listOut.open(listFile, ios::trunc);

        if (!listOut.is_open())
            return fail(SYNC_USAGE_ERROR, "unable to write " + listFile + errtext());

        for (auto &file: candidates)
            listOut << file << "\n";

        listOut.close();
    }

    string command = "rsync -i -t --size-only" + string(job.dryRun ? " -n" : "") +
        " --timeout=" + to_string(connectTimeout) +
        " -e \"" + sshCommand(connectTimeout, false) + "\"" +
        " --files-from=" + listFile +
        " " + shellQuote(addSlash(job.source.str())) +
        " " + shellQuote(addSlash(job.destination.str()));

    DEBUG(D_transfer) DFMT(label << ": " << command);
    auto transfer = runner.run(command, label, deadline);

    if (scratchList)
        unlink(listFile.c_str());

    if (transfer.timedOut)
        return fail(SYNC_TIMEOUT, transfer.errors);

    if (transfer.status)
        return fail(transfer.status, transfer.errors);

    result.transferredFiles = parseTransferLog(transfer.output);
    return result;
}
