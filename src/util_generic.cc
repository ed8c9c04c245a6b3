#include <iostream>
#include <sstream>
#include <fstream>
#include <dirent.h>
#include <errno.h>
#include <unistd.h>
#include <fnmatch.h>
#include <limits.h>
#include <signal.h>
#include <string.h>
#include <syslog.h>
#include <algorithm>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <mutex>
#include <vector>

#include <pcre++.h>
#include "util_generic.h"
#include "globals.h"
#include "ipc.h"
#include "exception.h"

using namespace pcrepp;

struct global_vars GLOBALS;

// worker threads all log through the same file
static mutex logMutex;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string cppgetenv(string variable) {
    char *value = getenv(variable.c_str());
    return (value == NULL ? "" : value);
}


string perlJoin(string delimiter, vector<string> items) {
    string result;

    for (auto &item: items)
        result += (result.length() ? delimiter : "") + item;

    return result;
}


string severityName(logSeverity severity) {
    switch (severity) {
        case lTrace:    return "TRACE";
        case lDebug:    return "DEBUG";
        case lInfo:     return "INFO";
        case lWarning:  return "WARNING";
        case lError:    return "ERROR";
        case lCritical: return "CRITICAL";
    }

    return "INFO";
}


static int syslogPriority(logSeverity severity) {
    switch (severity) {
        case lCritical: return LOG_CRIT;
        case lError:    return LOG_ERR;
        case lWarning:  return LOG_WARNING;
        case lInfo:     return LOG_INFO;
        default:        return LOG_DEBUG;
    }
}


// multi-line messages (captured stderr mostly) are folded onto one log line
static string oneLine(string data) {
    while (data.length() && data.back() == '\n')
        data.pop_back();

    size_t pos = 0;
    while ((pos = data.find('\n', pos)) != string::npos) {
        data.replace(pos, 1, ", ");
        pos += 2;
    }

    return data;
}


/*******************************************************************************
 * log(message, severity)
 *
 * Append a timestamped line to <logdir>/aggregatebackups.log and mirror it to
 * syslog.  Returns the message so callers can chain it into SCREENERR().
 *******************************************************************************/
string log(string message, logSeverity severity) {
    string line = oneLine(message);
    string level = severityName(severity);

    lock_guard<mutex> lock(logMutex);
    syslog(syslogPriority(severity), "%s %s", level.c_str(), line.c_str());

    char timeStamp[100];
    struct tm nowTm;
    time_t now = time(NULL);

    localtime_r(&now, &nowTm);
    strftime(timeStamp, sizeof(timeStamp), "%Y-%m-%d %H:%M:%S %Z %z", &nowTm);

    ofstream logFile(slashConcat(GLOBALS.logDir.length() ? GLOBALS.logDir : LOG_DIR, LOG_FILE), ios::app);
    if (logFile.is_open())
        logFile << timeStamp << " [" << GLOBALS.pid << "] " << level << " " << line << endl;

    return message;
}


void logDebug(string message) {
    if (GLOBALS.debugLog)
        log(message, lDebug);
}


// "2 hours, 5 minutes" style, largest units first, at most maxUnits of them
string timeDiffSingle(struct timeval duration, int maxUnits) {
    static const vector<pair<unsigned long, string>> units {
        { SECS_PER_DAY, "day" }, { 3600, "hour" }, { 60, "minute" }, { 1, "second" } };

    auto remaining = (unsigned long)duration.tv_sec;
    int used = 0;
    string result;

    for (auto &unit: units) {
        if (remaining < unit.first)
            continue;

        result += (result.length() ? ", " : "") + plural(remaining / unit.first, unit.second);
        remaining %= unit.first;

        if (++used == maxUnits)
            break;
    }

    return (result.length() ? result : "0 seconds");
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1.back() == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    string joined = str1 + "/" + str2;
    return (str3.length() ? slashConcat(joined, str3) : joined);
}


string addSlash(string str) {
    return (str.length() && str.back() == '/' ? str : str + "/");
}


s_pathSplit pathSplit(string path) {
    s_pathSplit parts;
    auto pos = path.rfind('/');

    if (pos == string::npos) {
        parts.dir = ".";
        parts.file = path;
    }
    else {
        parts.dir = pos ? path.substr(0, pos) : "/";
        parts.file = path.substr(pos + 1);
    }

    return parts;
}


// mkdir -p.  returns 0 on success, -1 with errno set otherwise.
int mkdirp(string dir, mode_t mode) {
    if (isDirectory(dir))
        return 0;

    string path = (dir.length() && dir[0] == '/') ? "" : ".";
    stringstream tokenizer(dir);
    string component;

    while (getline(tokenizer, component, '/')) {
        if (!component.length())
            continue;

        path += "/" + component;

        // another worker may get there first
        if (mkdir(path.c_str(), mode) && errno != EEXIST)
            return -1;
    }

    return (isDirectory(dir) ? 0 : -1);
}


string trimSpace(const string &s) {
    size_t start = 0;
    size_t end = s.length();

    while (start < end && isspace((unsigned char)s[start]))
        ++start;

    while (end > start && isspace((unsigned char)s[end - 1]))
        --end;

    return s.substr(start, end - start);
}


// remove matching runs of quotes from both ends: "'x'" becomes x, "x' stays as is
string trimQuotes(string s) {
    size_t depth = 0;

    while (depth < s.length() / 2 && (s[depth] == '\'' || s[depth] == '"') &&
        s[s.length() - 1 - depth] == s[depth])
        ++depth;

    return s.substr(depth, s.length() - 2 * depth);
}


string shellQuote(string s) {
    return "'" + s + "'";
}


// split a string into a vector on spaces, except where quoted or escaped
vector<string> string2vectorOnSpace(string data) {
    Pcre wordRE("((?:([\'\"]).+?(?<!\\\\)\\g2)|(?:\\S|(?:(?<=\\\\)\\s))+)", "g");
    vector<string> result;
    int pos = 0;

    while (pos <= (int)data.length() && wordRE.search(data, pos)) {
        result.push_back(wordRE.get_match(0));
        pos = wordRE.get_match_end(0) + 1;
    }

    return result;
}


// break a command line into arguments the way a shell would for quoting and escaping.
// no wildcard expansion happens here: patterns are meant for the remote find or for
// rsync and are handed over literally.
vector<string> commandTokens(string fullCommand) {
    vector<string> tokens = string2vectorOnSpace(fullCommand);

    for (auto &token: tokens) {
        // escaping has been honored by the tokenizer so any remaining backslashes go
        size_t altpos;
        while ((altpos = token.find("\\")) != string::npos)
            token.erase(altpos, 1);

        token = trimQuotes(token);
    }

    return tokens;
}


/*******************************************************************************
 * varexec(argv)
 *
 * exec() a NULL terminated argument vector built before the fork.  Runs in a
 * freshly forked child of a possibly threaded parent, so it neither allocates
 * nor writes anything.  Never returns; a failed exec exits with 127.
 *******************************************************************************/
void varexec(const vector<char*> &argv) {
    // main() ignores SIGPIPE; the commands we run get the usual behavior
    signal(SIGPIPE, SIG_DFL);

    if (argv.size() > 1)
        execvp(argv[0], argv.data());

    _exit(127);
}


string safeFilename(string filename) {
    Pcre underscored("[\\s#;\\/\\\\:@]+", "g");
    Pcre removed("[\\?\\!\\*\'\"]+", "g");

    return removed.replace(underscored.replace(filename, "_"), "");
}


// full path to an executable, searching PATH when app has no directory part
string locateBinary(string app) {
    if (app.find('/') != string::npos && !access(app.c_str(), X_OK))
        return app;

    string binary = pathSplit(app).file;
    stringstream pathTokenizer(cppgetenv("PATH"));
    string dir;

    while (getline(pathTokenizer, dir, ':')) {
        string candidate = slashConcat(dir, binary);

        if (dir.length() && !access(candidate.c_str(), X_OK))
            return candidate;
    }

    log("unable to locate/execute '" + app + "' command", lWarning);
    return "";
}


// same semantics as find -name: shell glob against the basename, leading dots not special
bool globMatch(string pattern, string filename) {
    return !fnmatch(pattern.c_str(), pathSplit(filename).file.c_str(), 0);
}


string hostname() {
    static string internalHostname = [] {
        char hname[256];

        if (!gethostname(hname, sizeof(hname))) {
            hname[sizeof(hname) - 1] = 0;
            return string(hname);
        }

        log("error: unable to lookup hostname (" + to_string(errno) + ")", lError);
        return string();
    }();

    return internalHostname;
}


void sendEmail(string from, string recipients, string subject, string message) {
    string headers = "X-Mailer: aggregatebackups\nContent-Type: text/plain\nReturn-Path: " + from + "\nSubject: " + subject + "\n\n";
    string bin = locateBinary("/usr/sbin/sendmail");

    if (bin.length())
        bin += " -f " + from + " " + recipients;
    else {
        string mail = locateBinary("mail");
        if (!mail.length())
            throw ABException("neither sendmail nor mail is available to send to " + recipients);

        bin = mail + " -s \"" + subject + "\" " + recipients;
        headers = "";
    }

    PipeExec mail(bin);
    mail.execute("mail");

    if (headers.length())
        mail.ipcWrite(headers.c_str(), headers.length());

    mail.ipcWrite(message.c_str(), message.length());
    mail.closeWrite();
    mail.readAndTrash();

    if (mail.exitStatus())
        throw ABException(pathSplit(bin.substr(0, bin.find(" "))).file + " exited with status " + to_string(mail.exitStatus()), mail.errorOutput());
}


bool catdirCallback(pdCallbackData &file) {
    if (!S_ISREG(file.statData.st_mode))
        return true;

    ifstream aFile(file.filename);
    string data;

    while (getline(aFile, data))
        *(string*)(file.dataPtr) += data + "\n";

    return true;
}


// the contents of every file under dir with blank lines and CRs squeezed out
string catdir(string dir) {
    string raw;
    string result;

    processDirectory(dir, catdirCallback, &raw);

    stringstream lines(raw);
    string line;

    while (getline(lines, line)) {
        if (line.length() && line.back() == '\r')
            line.pop_back();

        if (line.length())
            result += (result.length() ? "\n" : "") + line;
    }

    return result;
}


bool rmrfCallback(pdCallbackData &file) {
    return (S_ISDIR(file.statData.st_mode) ? !rmdir(file.filename.c_str()) : !unlink(file.filename.c_str()));
}


// rm -rf of an absolute directory
bool rmrf(string directory, bool includeTopDir) {
    return (processDirectory(directory, rmrfCallback, NULL, includeTopDir) == "" && (!includeTopDir || !exists(directory)));
}


// wait for rFd to be readable or wFd writable; select()'s result
int simpleSelect(int rFd, int wFd, int timeoutSecs) {
    fd_set readSet;
    fd_set writeSet;
    fd_set errorSet;
    FD_ZERO(&readSet);
    FD_ZERO(&writeSet);
    FD_ZERO(&errorSet);

    if (rFd > 0) {
        FD_SET(rFd, &readSet);
        FD_SET(rFd, &errorSet);
    }

    if (wFd > 0) {
        FD_SET(wFd, &writeSet);
        FD_SET(wFd, &errorSet);
    }

    struct timeval tv;
    tv.tv_sec = timeoutSecs;
    tv.tv_usec = 0;

    int result;
    while ((result = select(std::max(rFd, wFd) + 1, rFd > 0 ? &readSet : NULL, wFd > 0 ? &writeSet : NULL, &errorSet, &tv)) == -1 && errno == EINTR);

    return result;
}


bool exists(const std::string& name) {
    struct stat statBuffer;
    return (mylstat(name, &statBuffer) == 0);
}


bool isDirectory(const std::string& name) {
    struct stat statBuffer;
    return (mystat(name, &statBuffer) == 0 && S_ISDIR(statBuffer.st_mode));
}


/* hand each entry of dir to the callback, descending into subdirectories first so
   a directory is only seen once everything in it has been.  false stops the walk. */
static bool walkDirectory(const string &dir, bool (*callback)(pdCallbackData&), pdCallbackData &file, string &error) {
    DIR *dirPtr = opendir(dir.c_str());

    if (dirPtr == NULL) {
        error = log("error: unable to open " + dir + errtext(), lError);
        return false;
    }

    // read it all up front; the callbacks are allowed to remove what they're given
    vector<string> entries;
    struct dirent *dirEntry;

    while ((dirEntry = readdir(dirPtr)) != NULL)
        if (strcmp(dirEntry->d_name, ".") && strcmp(dirEntry->d_name, ".."))
            entries.push_back(dirEntry->d_name);

    closedir(dirPtr);

    for (auto &entry: entries) {
        string path = slashConcat(dir, entry);
        struct stat entryStat;

        if (mylstat(path, &entryStat))
            continue;

        if (S_ISDIR(entryStat.st_mode) && !walkDirectory(path, callback, file, error))
            return false;

        file.filename = path;
        file.statData = entryStat;

        if (!callback(file))
            return false;
    }

    return true;
}


/*******************************************************************************
 * processDirectory(directory, callback, passData, includeTopDir)
 *
 * Depth-first walk of a directory tree.  callback() gets each file as it's
 * found and each directory after its contents, so callbacks can safely remove
 * what they're handed.  Symlinks aren't followed.  Given a plain file, only
 * that file is handed over.
 *
 * Returns a blank string on success, otherwise the (logged) error.
 *******************************************************************************/
string processDirectory(string directory, bool (*callback)(pdCallbackData&), void *passData, bool includeTopDir) {
    pdCallbackData file;
    file.dataPtr = passData;
    file.filename = directory;

    if (mylstat(directory, &file.statData))
        return "error: stat failed for " + directory + errtext();

    if (!S_ISDIR(file.statData.st_mode)) {
        callback(file);
        return "";
    }

    struct stat topStat = file.statData;
    string error;

    try {
        if (walkDirectory(directory, callback, file, error) && includeTopDir) {
            file.filename = directory;
            file.statData = topStat;
            callback(file);
        }
    }
    catch (ABException &e) {
        return log("error: " + e.detail(), lError);
    }

    return error;
}


int mylstat(string filename, struct stat *buf) {
    return (lstat(filename.c_str(), buf));
}


int mystat(string filename, struct stat *buf) {
    return (stat(filename.c_str(), buf));
}


string errtext(bool format) {
    return ((format ? " - " : "") + string(strerror(errno)));
}
