
#include <unistd.h>

#include "RetentionPruner.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"


struct pruneData {
    string pattern;
    time_t maxAge;
    time_t now;
    unsigned int removed;
    string errors;
};


bool pruneCallback(pdCallbackData &file) {
    auto data = (pruneData*)file.dataPtr;

    if (S_ISREG(file.statData.st_mode) && globMatch(data->pattern, file.filename) &&
        data->now - file.statData.st_mtime > data->maxAge) {

        DEBUG(D_prune) DFMT("removing " << file.filename);

        if (unlink(file.filename.c_str()))
            data->errors += (data->errors.length() ? "; " : "") + string("unable to remove ") + file.filename + errtext();
        else
            ++data->removed;
    }

    return true;
}


/*******************************************************************************
 * prune(destination, namePattern, olderThanDays, dryRun)
 *
 * Delete regular files anywhere under destination whose basename matches
 * namePattern and whose age is strictly more than olderThanDays.  Nothing
 * happens in a dry run, and a destination that doesn't exist yet has nothing
 * to prune.  Returns a blank string on success.
 *******************************************************************************/
string RetentionPruner::prune(const Location &destination, string namePattern, int olderThanDays, bool dryRun) {
    removed = 0;

    if (dryRun) {
        DEBUG(D_prune) DFMT(label << ": dry run, not pruning " << destination.str());
        return "";
    }

    logDebug("[" + label + "] clearing " + destination.str() + " and retaining the last " + plural(olderThanDays, "day"));

    if (destination.remote) {
        string command = "[ ! -d " + shellQuote(destination.path) + " ] || find " + shellQuote(destination.path) +
            " -type f -name " + shellQuote(namePattern) + " -mmin +" + to_string((long)olderThanDays * 1440) + " -delete";

        auto result = runner.run(remoteCommand(destination, command, connectTimeout), label, deadline);

        if (result.timedOut)
            return "timed out pruning " + destination.str();

        if (result.status)
            return "unable to prune " + destination.str() + " (status " + to_string(result.status) + ")" +
                (result.errors.length() ? ": " + result.errors : "");

        return "";
    }

    if (!isDirectory(destination.path))
        return "";

    pruneData data;
    data.pattern = namePattern;
    data.maxAge = (time_t)olderThanDays * SECS_PER_DAY;
    data.now = time(NULL);
    data.removed = 0;

    string error = processDirectory(destination.path, pruneCallback, &data);
    removed = data.removed;

    DEBUG(D_prune) DFMT(label << ": removed " << plural(removed, "file") << " from " << destination.path);

    if (error.length())
        return error;

    return data.errors;
}
