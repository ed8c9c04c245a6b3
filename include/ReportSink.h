#ifndef REPORTSINK_H
#define REPORTSINK_H

#include <string>

#include "BatchCoordinator.h"
#include "RunConfig.h"


using namespace std;

#define ALERT_PREFIX    "Script failed to pull backups. Reason(s): "


/********************************************************************
 * ReportSink
 * Turns a finished run into the closing log lines and, if anything
 * went wrong, exactly one alert.
 *******************************************************************/
class ReportSink {
protected:
    const RunConfig &config;

    virtual bool dispatch(string subject, string message);

public:
    ReportSink(const RunConfig &runConfig) : config(runConfig) {}
    virtual ~ReportSink() {}

    string compose(const RunOutcome &outcome) const;
    string subject() const;

    // true if an alert went out (or, in a dry run, would have)
    bool report(const RunOutcome &outcome);
};


// deliver message to each of the comma separated recipients (email) or scripts
bool notify(const RunConfig &config, string subject, string message);

#endif
