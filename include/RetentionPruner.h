#ifndef RETENTIONPRUNER_H
#define RETENTIONPRUNER_H

#include <string>
#include <time.h>

#include "FileSync.h"


using namespace std;


/********************************************************************
 * RetentionPruner
 * Clears out files past the retention window from one host's
 * destination directory ahead of the pull.
 *******************************************************************/
class RetentionPruner {
    CommandRunner &runner;
    int connectTimeout;
    string label;
    time_t deadline;
    unsigned int removed;

public:
    RetentionPruner(CommandRunner &cmdRunner, int timeout = 10, string procLabel = "prune", time_t deadlineTime = 0) :
        runner(cmdRunner), connectTimeout(timeout), label(procLabel), deadline(deadlineTime), removed(0) {}

    // returns a blank string on success, otherwise what went wrong
    string prune(const Location &destination, string namePattern, int olderThanDays, bool dryRun);

    // local prunes only; a remote find doesn't report what it deleted
    unsigned int removedCount() const { return removed; }
};

#endif
