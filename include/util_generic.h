#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <iostream>

#include "globals.h"

using namespace std;


/* logging */

// severities understood by log(); the names are what lands in the log file
enum logSeverity { lTrace, lDebug, lInfo, lWarning, lError, lCritical };

string severityName(logSeverity severity);

string log(string message, logSeverity severity = lInfo);

// only written when debug logging (-d) is enabled
void logDebug(string message);


/* strings */

string plural(size_t number, string text);

string cppgetenv(string variable);

string perlJoin(string delimiter, vector<string> items);

string timeDiffSingle(struct timeval duration, int maxUnits = 2);

string trimSpace(const string &s);

string trimQuotes(string s);

// wrap a value in single quotes so a remote shell sees it as one literal word
string shellQuote(string s);

// spaces, slashes and the like become '_', shell metacharacters are dropped
string safeFilename(string filename);

bool globMatch(string pattern, string filename);


// wall clock time of a run, for the closing log line
class timer {
    struct timeval startTime;
    struct timeval spentTime;

    public:
        timer() { timerclear(&startTime); timerclear(&spentTime); }

        void start() { gettimeofday(&startTime, NULL); }
        void stop() {
            struct timeval endTime;
            gettimeofday(&endTime, NULL);
            timersub(&endTime, &startTime, &spentTime);
        }

        string elapsed() { return timeDiffSingle(spentTime, 3); }
};


/* paths */

struct s_pathSplit {
    string dir;
    string file;
};

s_pathSplit pathSplit(string path);

string slashConcat(string str1, string str2, string str3 = "");

string addSlash(string str);

int mkdirp(string dir, mode_t mode = 0775);

bool exists(const std::string& name);

bool isDirectory(const std::string& name);

int mylstat(string filename, struct stat *buf);
int mystat(string filename, struct stat *buf);

// what processDirectory() hands its callback for each entry
struct pdCallbackData {
    string filename;
    struct stat statData;
    void *dataPtr;
};

string processDirectory(string directory, bool (*callback)(pdCallbackData&), void *passData, bool includeTopDir = false);

string catdir(string dir);

bool rmrf(string directory, bool includeTopDir = true);


/* processes */

vector<string> string2vectorOnSpace(string data);

vector<string> commandTokens(string fullCommand);

[[noreturn]] void varexec(const vector<char*> &argv);

string locateBinary(string app);

int simpleSelect(int rFd, int wFd, int timeoutSecs);


/* system */

string hostname();

void sendEmail(string from, string recipients, string subject, string message);

string errtext(bool format = true);

#endif
