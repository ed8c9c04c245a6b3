#ifndef NOTIFY_C
#define NOTIFY_C

#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

#include "ReportSink.h"
#include "util_generic.h"
#include "exception.h"
#include "globals.h"
#include "debug.h"


using namespace std;


// single-quote for /bin/sh, including any single quotes inside
static string shEscape(string text) {
    string result = "'";

    for (auto c: text)
        if (c == '\'')
            result += "'\\''";
        else
            result += c;

    return result + "'";
}


bool notify(const RunConfig &config, string subject, string message) {
    string sender = config.mailFrom().length() ? config.mailFrom() : "aggregatebackups";
    bool success = true;

    stringstream tokenizer(config.notify());
    vector<string> parts;

    // separate the contacts list by commas
    string tempStr;
    while (getline(tokenizer, tempStr, ','))
        if ((tempStr = trimSpace(tempStr)).length())
            parts.push_back(tempStr);

    for (auto contactMethod: parts) {
        DEBUG(D_notify) DFMT("method: " << contactMethod);

        // if there's an at-sign treat it as an email address
        if (contactMethod.find("@") != string::npos) {
            try {
                DEBUG(D_notify) DFMT("recipient: " << contactMethod << "; sending email");
                sendEmail(sender, contactMethod, subject, message);
                log("Email alert sent to " + contactMethod + " detailing script errors");
            }
            catch (ABException &e) {
                log("Failed to send alert email to " + contactMethod + ": " + e.detail(), lError);
                success = false;
            }
        }
        // if there's no at-sign treat it as a script to execute
        else {
            DEBUG(D_notify) DFMT("script: " << contactMethod << "; executing");
            if (system(string(contactMethod + " " + shEscape(subject + "\n\n" + message)).c_str())) {
                log("unable to notify via " + contactMethod + " (cannot execute)", lError);
                success = false;
            }
            else
                log("Alert delivered via " + contactMethod);
        }
    }

    return success;
}


string ReportSink::subject() const {
    return "aggregatebackups has failed to complete on " + hostname();
}


// the alert body: the fixed prefix and then one line per failure
string ReportSink::compose(const RunOutcome &outcome) const {
    string message = ALERT_PREFIX;

    for (auto &error: outcome.errorMessages)
        message += "\n" + error;

    return message;
}


bool ReportSink::dispatch(string subject, string message) {
    if (!config.notify().length()) {
        log("no notify recipients configured; alert not sent", lWarning);
        return false;
    }

    return notify(config, subject, message);
}


/*******************************************************************************
 * report(outcome)
 *
 * Log the per-run summary and, when any failure was recorded, send the one
 * aggregate alert for the whole run.  A dry run only says it would have.
 *******************************************************************************/
bool ReportSink::report(const RunOutcome &outcome) {
    unsigned int synced = 0;
    unsigned int failed = 0;
    unsigned int skipped = 0;

    for (auto &entry: outcome.perHost) {
        switch (entry.second.state) {
            case hsSynced: ++synced; break;
            case hsProbeFailed: ++skipped; break;
            case hsSyncFailed: ++failed; break;
            default: break;
        }

        DEBUG(D_coord) DFMT(entry.second.host.shortName << ": " << hostStateName(entry.second.state));
    }

    log(plural(outcome.perHost.size(), "host") + " processed: " + to_string(synced) + " synced, " + to_string(failed) +
        " failed, " + to_string(skipped) + " unreachable; " + plural(outcome.allTransferredFiles.size(), "file") +
        (config.dryRun ? " would have been" : "") + " copied");

    if (!outcome.anyError())
        return false;

    string message = compose(outcome);

    if (config.dryRun) {
        log("dry run: would have sent alert to " + (config.notify().length() ? config.notify() : "(no recipients)") + ":\n" + message);
        return true;
    }

    if (!dispatch(subject(), message))
        log("alert could not be delivered to every recipient", lError);

    SCREENERR("aggregatebackups has exited with errors. Please check the log in " <<
        (GLOBALS.logDir.length() ? GLOBALS.logDir : LOG_DIR) << " for error information.");

    return true;
}

#endif
