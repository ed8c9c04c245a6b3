#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <stdlib.h>
#include <unistd.h>
#include <utime.h>

#include "ipc.h"
#include "network.h"
#include "exception.h"
#include "util_generic.h"
#include "globals.h"


using namespace std;


// a scratch directory that's removed when it goes out of scope
class TempDir {
public:
    string path;

    TempDir() {
        char pattern[] = "/tmp/aggregatebackups_test.XXXXXX";
        char *dir = mkdtemp(pattern);
        path = dir ? dir : "";
    }

    ~TempDir() {
        if (path.length())
            rmrf(path);
    }

    string file(string name) const { return slashConcat(path, name); }
};


// write a file (creating its directory) and backdate its mtime by ageDays
inline void makeFile(string filename, string content = "data", double ageDays = 0) {
    mkdirp(pathSplit(filename).dir);

    ofstream out(filename, ios::trunc);
    out << content;
    out.close();

    struct utimbuf times;
    times.actime = times.modtime = time(NULL) - (time_t)(ageDays * SECS_PER_DAY);
    utime(filename.c_str(), &times);
}


inline string readFile(string filename) {
    ifstream in(filename);
    stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}


inline cmdResult succeeded(string output = "") {
    cmdResult result;
    result.status = 0;
    result.output = output;
    return result;
}


inline cmdResult failed(int status, string errors = "") {
    cmdResult result;
    result.status = status;
    result.errors = errors;
    return result;
}


inline bool contains(const string &haystack, const string &needle) {
    return haystack.find(needle) != string::npos;
}


/********************************************************************
 * FakeRunner
 * Records every command instead of running it.  respond decides
 * what each command "returns"; without one everything succeeds
 * with no output.
 *******************************************************************/
class FakeRunner : public CommandRunner {
    mutex lock;

public:
    vector<string> commands;
    function<cmdResult(const string&)> respond;

    cmdResult run(string command, string label, time_t deadline) {
        {
            lock_guard<mutex> guard(lock);
            commands.push_back(command);
        }

        return (respond ? respond(command) : succeeded());
    }

    size_t count(string needle) {
        lock_guard<mutex> guard(lock);
        size_t found = 0;

        for (auto &command: commands)
            if (contains(command, needle))
                ++found;

        return found;
    }
};


class FakeProber : public Prober {
    mutex lock;

public:
    map<string, probeResult> answers;   // anything not listed is unreachable
    set<string> broken;                 // these throw
    vector<string> probed;

    probeResult probe(string address, int port = SSH_PORT, unsigned int timeoutSecs = 10) {
        {
            lock_guard<mutex> guard(lock);
            probed.push_back(address);
        }

        if (broken.count(address))
            throw ABException("socket() failed");

        auto it = answers.find(address);
        return (it == answers.end() ? Unreachable : it->second);
    }
};


/*******************************************************************************
 * sizeOnlyTransfer(command)
 *
 * Stands in for a local to local rsync run with --size-only: every file in the
 * --files-from list that's missing at the destination, or differs in size, is
 * copied and itemized as received.
 *******************************************************************************/
inline cmdResult sizeOnlyTransfer(const string &command) {
    auto tokens = commandTokens(command);
    string listFile;

    for (auto &token: tokens)
        if (token.substr(0, 13) == "--files-from=")
            listFile = token.substr(13);

    string source = tokens[tokens.size() - 2];
    string destination = tokens.back();
    string output;

    ifstream list(listFile);
    string name;

    while (getline(list, name)) {
        struct stat sourceStat;
        struct stat destStat;

        if (mystat(source + name, &sourceStat))
            return failed(23, "link_stat " + name + " failed");

        if (!mystat(destination + name, &destStat) && destStat.st_size == sourceStat.st_size)
            continue;

        mkdirp(pathSplit(destination + name).dir);
        ifstream in(source + name, ios::binary);
        ofstream out(destination + name, ios::binary | ios::trunc);
        out << in.rdbuf();

        output += ">f+++++++++ " + name + "\n";
    }

    return succeeded(output);
}

#endif
