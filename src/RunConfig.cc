
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "RunConfig.h"
#include "globals.h"
#include "debug.h"


RunConfig::RunConfig() {
    config_filename = "";
    dryRun = false;

    // define settings and their defaults
    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CLI_SOURCE, RE_SOURCE, STRING, "/data/backups/"));
    settings.insert(settings.end(), Setting(CLI_PATTERN, RE_PATTERN, STRING, "*_backup*"));
    settings.insert(settings.end(), Setting(CLI_DEST, RE_DEST, STRING, "/data/backups/"));
    settings.insert(settings.end(), Setting(CLI_DAYS, RE_DAYS, INT, "7"));
    settings.insert(settings.end(), Setting(CLI_ACCOUNT, RE_ACCOUNT, STRING, "splunk"));
    settings.insert(settings.end(), Setting(CLI_HOSTS, RE_HOSTS, STRING, "/etc/hosts"));
    settings.insert(settings.end(), Setting(CLI_PORT, RE_PORT, INT, "22"));
    settings.insert(settings.end(), Setting(CLI_TIMEOUT, RE_TIMEOUT, INT, "10"));
    settings.insert(settings.end(), Setting(CLI_DEADLINE, RE_DEADLINE, INT, "1800"));
    settings.insert(settings.end(), Setting(CLI_WORKERS, RE_WORKERS, INT, "1"));
    settings.insert(settings.end(), Setting(CLI_NOTIFY, RE_NOTIFY, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_MAILFROM, RE_MAILFROM, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_SYNC, RE_SYNC, STRING, ""));
    settings.insert(settings.end(), Setting(CLI_MANIFEST, RE_MANIFEST, STRING, "/tmp/aggregatebackups_sync_files.txt"));
    settings.insert(settings.end(), Setting(CLI_LOGDIR, RE_LOGDIR, STRING, ""));
}


/*******************************************************************************
 * loadConfig(filename, required)
 *
 * Read "key: value" lines from a config file over the top of the defaults.
 * A missing file is only an error when it was explicitly asked for.
 * Returns a blank string on success.
 *******************************************************************************/
string RunConfig::loadConfig(string filename, bool required) {
    ifstream configFile;

    configFile.open(filename);
    if (!configFile.is_open()) {
        if (required || exists(filename))
            return "unable to read " + filename + errtext();

        DEBUG(D_config) DFMT("no config file at " << filename << "; using defaults");
        return "";
    }

    string dataLine;
    Pcre reBlank(RE_BLANK);
    config_filename = filename;

    unsigned int line = 0;
    while (getline(configFile, dataLine)) {
        ++line;

        // skip blanks and comments
        if (reBlank.search(dataLine))
            continue;

        // compare the line against each of the config settings until there's a match
        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                string value = trimQuotes(setting.regex.get_match(2));

                if (setting.data_type == INT) {
                    size_t pos = 0;

                    try {
                        stoi(value, &pos);
                    }
                    catch (const std::logic_error&) {
                        pos = 0;
                    }

                    // the whole value, not just a leading number
                    if (!pos || pos != value.length()) {
                        configFile.close();
                        return "unable to parse a numeric value for the directive on line " + to_string(line) + " of " + filename + ":\n    " + dataLine;
                    }
                }

                setting.value = value;
                setting.seen = true;
                identified = true;
                break;
            }
        }

        if (!identified) {
            configFile.close();
            return "unrecognized setting on line " + to_string(line) + " of " + filename + ":\n    " + dataLine;
        }
    }

    configFile.close();
    DEBUG(D_config) DFMT("successfully parsed config from " << filename);

    return "";
}


string RunConfig::applyOverride(string name, string value) {
    auto it = settingMap.find(name);
    if (it == settingMap.end())
        return "unknown setting " + name;

    auto &setting = settings[it->second];

    if (setting.data_type == INT)
        try {
            size_t pos;
            stoi(value, &pos);

            if (pos != value.length())
                return "invalid numeric value for " + name + " (" + value + ")";
        }
        catch (const std::logic_error&) {
            return "invalid numeric value for " + name + " (" + value + ")";
        }

    DEBUG(D_config) DFMT("commandline param: " << name << " = " << value);
    setting.value = value;
    setting.seen = true;
    return "";
}


/*******************************************************************************
 * applyCli(cli)
 *
 * Fold the parsed commandline over the settings.  The positional form
 * (source pattern destination days) is all or nothing.
 *******************************************************************************/
string RunConfig::applyCli(cxxopts::ParseResult &cli) {
    string error;

    for (auto &setting : settings)
        if (cli.count(setting.display_name)) {
            string value = setting.data_type == INT ?
                to_string(cli[setting.display_name].as<int>()) : cli[setting.display_name].as<string>();

            if ((error = applyOverride(setting.display_name, value)).length())
                return error;
        }

    if (cli.count(CLI_POSITIONAL)) {
        auto positional = cli[CLI_POSITIONAL].as<vector<string>>();

        if (positional.size() != 4)
            return "expected source, pattern, destination and days together (got " + plural(positional.size(), "argument") + ")";

        if ((error = applyOverride(CLI_SOURCE, positional[0])).length() ||
            (error = applyOverride(CLI_PATTERN, positional[1])).length() ||
            (error = applyOverride(CLI_DEST, positional[2])).length() ||
            (error = applyOverride(CLI_DAYS, positional[3])).length())
            return error;
    }

    dryRun = cli[CLI_DRYRUN].as<bool>();
    return "";
}


// values end up single-quoted inside remote commands and split by our own tokenizer
static bool shellSafe(const string &value) {
    return value.find_first_of("'\"\\|`$") == string::npos;
}


string RunConfig::validate() const {
    if (!source().length())
        return "source directory can't be blank";

    if (!pattern().length())
        return "file pattern can't be blank";

    if (!destination().length())
        return "destination directory can't be blank";

    if (days() < 0)
        return "days must be zero or more";

    if (workers() < 1)
        return "workers must be at least 1";

    if (port() < 1 || port() > 65535)
        return "port must be between 1 and 65535";

    if (timeout() < 1)
        return "timeout must be at least 1 second";

    if (deadline() < 1)
        return "deadline must be at least 1 second";

    Pcre accountRE("^[\\w.-]+$");
    if (!accountRE.search(account()))
        return "invalid account name (" + account() + ")";

    for (auto idx: { sSource, sPattern, sDest, sHosts, sSync, sManifest, sLogDir })
        if (!shellSafe(settings[idx].value))
            return settings[idx].display_name + " can't contain quotes, backslashes, pipes, backticks or dollar signs";

    return "";
}


void RunConfig::fullDump() const {
    for (auto &setting: settings)
        cout << setting.confPrint();
}


void defineOptions(cxxopts::Options &options) {
    options.add_options()(string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        string("d,") + CLI_DEBUG, "Debug logging", cxxopts::value<bool>()->default_value("false"))(
        string("n,") + CLI_DRYRUN, "Dry run", cxxopts::value<bool>()->default_value("false"))(
        string("s,") + CLI_SYNC, "Secondary sync target", cxxopts::value<std::string>())(
        string("c,") + CLI_CONFIG, "Config file", cxxopts::value<std::string>())(
        string("V,") + CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        CLI_SOURCE, "Source directory", cxxopts::value<std::string>())(
        CLI_PATTERN, "File pattern", cxxopts::value<std::string>())(
        CLI_DEST, "Destination directory", cxxopts::value<std::string>())(
        CLI_DAYS, "Retention days", cxxopts::value<int>())(
        CLI_ACCOUNT, "Remote account", cxxopts::value<std::string>())(
        CLI_HOSTS, "Hosts file", cxxopts::value<std::string>())(
        CLI_PORT, "Probe port", cxxopts::value<int>())(
        CLI_TIMEOUT, "Connect timeout", cxxopts::value<int>())(
        CLI_DEADLINE, "Per-host deadline", cxxopts::value<int>())(
        CLI_WORKERS, "Worker threads", cxxopts::value<int>())(
        CLI_NOTIFY, "Notify", cxxopts::value<std::string>())(
        CLI_MAILFROM, "Send mail from", cxxopts::value<std::string>())(
        CLI_MANIFEST, "Forward manifest", cxxopts::value<std::string>())(
        CLI_LOGDIR, "Log directory", cxxopts::value<std::string>())(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        CLI_POSITIONAL, "source pattern destination days", cxxopts::value<std::vector<std::string>>());

    options.parse_positional(std::vector<std::string>{ CLI_POSITIONAL });
}
