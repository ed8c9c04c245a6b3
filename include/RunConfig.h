#ifndef RUNCONFIG_H
#define RUNCONFIG_H

#include <string>
#include <vector>
#include "cxxopts.hpp"
#include "Setting.h"


using namespace std;


/********************************************************************
 * RunConfig
 * Everything a run needs to know, settled before the first host is
 * touched: compiled-in defaults, then the config file, then the
 * commandline.  Handed to everything else by const reference.
 *******************************************************************/
class RunConfig {
public:
    string config_filename;
    vector<Setting> settings;
    bool dryRun;

    RunConfig();

    // "" on success, otherwise a description of what's wrong
    string loadConfig(string filename, bool required = false);
    string applyOverride(string name, string value);
    string applyCli(cxxopts::ParseResult &cli);
    string validate() const;

    string source() const { return settings[sSource].value; }
    string pattern() const { return settings[sPattern].value; }
    string destination() const { return settings[sDest].value; }
    int days() const { return settings[sDays].ivalue(); }
    string account() const { return settings[sAccount].value; }
    string hostsFile() const { return settings[sHosts].value; }
    int port() const { return settings[sPort].ivalue(); }
    int timeout() const { return settings[sTimeout].ivalue(); }
    int deadline() const { return settings[sDeadline].ivalue(); }
    int workers() const { return settings[sWorkers].ivalue(); }
    string notify() const { return settings[sNotify].value; }
    string mailFrom() const { return settings[sMailFrom].value; }
    string syncTarget() const { return settings[sSync].value; }
    string manifest() const { return settings[sManifest].value; }

    void fullDump() const;
};


// the commandline options; shared by main() and the tests
void defineOptions(cxxopts::Options &options);

#endif
