#ifndef HELP_H
#define HELP_H

#include <ostream>
#include "globals.h"

void showHelp(enum helpType kind);

// the short form printed alongside a usage error
void showUsage(std::ostream &out);

#endif
