
#include <iomanip>
#include <sstream>

#include "Setting.h"
#include "globals.h"

map<string, int>settingMap =
{{ CLI_SOURCE, sSource },
    { CLI_PATTERN, sPattern },
    { CLI_DEST, sDest },
    { CLI_DAYS, sDays },
    { CLI_ACCOUNT, sAccount },
    { CLI_HOSTS, sHosts },
    { CLI_PORT, sPort },
    { CLI_TIMEOUT, sTimeout },
    { CLI_DEADLINE, sDeadline },
    { CLI_WORKERS, sWorkers },
    { CLI_NOTIFY, sNotify },
    { CLI_MAILFROM, sMailFrom },
    { CLI_SYNC, sSync },
    { CLI_MANIFEST, sManifest },
    { CLI_LOGDIR, sLogDir }
    };


Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal) :
    display_name(name), data_type(setType), defaultValue(defaultVal), value(defaultVal), seen(false),
    regex("(?:^|\\s)" + pattern + CAPTURE_VALUE + RE_COMMENT) {}


// defaults come out commented
string Setting::confPrint() const {
    bool isDef = value == defaultValue;
    stringstream line;

    line << left << setw(17) << ((isDef ? "#" : "") + display_name + ":") << setw(25) << value << (isDef ? "  # default" : "");
    return line.str() + "\n";
}
