#ifndef COLORS_H
#define COLORS_H

// ANSI escapes, blank when GLOBALS.color is off (--nocolor or not a terminal)
#define ifcolor(x) (GLOBALS.color ? x : "")

#define RESET       ifcolor("\033[0m")
#define RED         ifcolor("\033[31m")
#define GREEN       ifcolor("\033[32m")
#define BOLDGREEN   ifcolor("\033[1;32m")
#define BOLDBLUE    ifcolor("\033[1;34m")

#endif
