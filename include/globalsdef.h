
#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.1.0"

#include <string>
#include <time.h>
#include "colors.h"

/*
 Every config file setting is also a commandline option; a few options (--help,
 --dryrun, ...) have no setting.

 A new option needs a CLI_ name below and an entry in defineOptions().  A new
 setting additionally needs an RE_ pattern below, a SetSpecifier (appended, the
 order is the settings vector order), a settingMap entry and a default in the
 RunConfig constructor.  After applyCli() the settings already hold file and
 commandline values merged.
 */


#define CONF_DIR "/etc/aggregatebackups"
#define CONF_FILE "aggregatebackups.conf"
#define LOG_DIR "/var/log"
#define LOG_FILE "aggregatebackups.log"
#define TMP_OUTPUT_DIR "/tmp/aggregatebackups_output"

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl

#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

#define SECS_PER_DAY (60*60*24)

// commandline option names
#define CLI_HELP "help"
#define CLI_DEBUG "debug"
#define CLI_DRYRUN "dryrun"
#define CLI_SYNC "sync"
#define CLI_CONFIG "config"
#define CLI_SOURCE "source"
#define CLI_PATTERN "pattern"
#define CLI_DEST "destination"
#define CLI_DAYS "days"
#define CLI_ACCOUNT "account"
#define CLI_HOSTS "hosts"
#define CLI_PORT "port"
#define CLI_TIMEOUT "timeout"
#define CLI_DEADLINE "deadline"
#define CLI_WORKERS "workers"
#define CLI_NOTIFY "notify"
#define CLI_MAILFROM "from"
#define CLI_MANIFEST "manifest"
#define CLI_LOGDIR "logdir"
#define CLI_NOCOLOR "nocolor"
#define CLI_VERSION "version"
#define CLI_DEFAULTS "defaults"
#define CLI_POSITIONAL "positional"

// config file directives, each with its aliases
#define CAPTURE_VALUE string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_SOURCE "(source|src)"
#define RE_PATTERN "(pattern|regex|file_regex)"
#define RE_DEST "(destination|dest)"
#define RE_DAYS "(days|retention|retention_days)"
#define RE_ACCOUNT "(account|user)"
#define RE_HOSTS "(hosts|hosts_file)"
#define RE_PORT "(port)"
#define RE_TIMEOUT "(timeout|connect_timeout)"
#define RE_DEADLINE "(deadline|host_deadline)"
#define RE_WORKERS "(workers)"
#define RE_NOTIFY "(notify|recipients)"
#define RE_MAILFROM "(mailfrom|from)"
#define RE_SYNC "(sync|sync_target)"
#define RE_MANIFEST "(manifest)"
#define RE_LOGDIR "(logdir|log_dir)"

using namespace std;

enum helpType { hDefaults, hOptions, hSyntax };

struct global_vars {
    unsigned int debugSelector;
    bool debugLog;
    int pid;
    bool color;
    string logDir;
    string confDir;
};

#endif

