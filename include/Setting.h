#ifndef SETTING_H
#define SETTING_H

#include <string>
#include <map>
#include <pcre++.h>
#include "util_generic.h"

using namespace std;
using namespace pcrepp;

enum SetType { INT, STRING };

// index into RunConfig::settings; keep in the order the settings are created
enum SetSpecifier { sSource, sPattern, sDest, sDays, sAccount, sHosts, sPort, sTimeout, sDeadline, sWorkers,
    sNotify, sMailFrom, sSync, sManifest, sLogDir };

// commandline option name to SetSpecifier
extern map<string, int>settingMap;


/********************************************************************
 * Setting
 * One configurable value.  regex recognizes its line in a config
 * file (any of its aliases, then ':' or '=', then the value) and
 * seen records whether the file or the commandline supplied it.
 *******************************************************************/
class Setting {
    public:
        string display_name;
        enum SetType data_type;
        string defaultValue;
        string value;
        bool seen;
        Pcre regex;

        Setting(string name, string pattern, enum SetType setType, string defaultVal);

        int ivalue() const { return stoi(value); }

        // the line as it would appear in a config file
        string confPrint() const;
};

#endif
