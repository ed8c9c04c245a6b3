#ifndef DEBUG_C
#define DEBUG_C

/* Selector parsing follows the behavior of Exim's decode_bits():
 * Exim - an Internet mail transport agent
 * Copyright (c) University of Cambridge 1995 - 2018
 * Copyright (c) The Exim Maintainers 2015 - 2021
 */

#include <ctype.h>
#include <stdlib.h>
#include <algorithm>
#include <string>

#include "debug.h"

using namespace std;

bit_table debug_options[]      = { /* must be in alphabetical order and use
                                 only the enum values from debug.h */
  BIT_TABLE(D, all),
  BIT_TABLE(D, config),
  BIT_TABLE(D, coord),
  BIT_TABLE(D, exec),
  BIT_TABLE(D, hosts),
  BIT_TABLE(D, notify),
  BIT_TABLE(D, probe),
  BIT_TABLE(D, prune),
  BIT_TABLE(D, sync),
  BIT_TABLE(D, transfer),
};

int ndebug_options = sizeof(debug_options) / sizeof(*debug_options);


static const bit_table *findSelector(const string &name) {
    auto end = debug_options + ndebug_options;
    auto it = lower_bound(debug_options, end, name, [](const bit_table &entry, const string &key) {
        return string(entry.name) < key;
    });

    if (it != end && name == it->name)
        return it;

    return NULL;
}


string decode_bits(unsigned int *selector, string parsestring) {
    if (!parsestring.length())
        return "";

    // "=<number>" sets the whole selector word at once
    if (parsestring[0] == '=') {
        char *end;
        unsigned long value = strtoul(parsestring.c_str() + 1, &end, 0);

        if (*end)
            return "unknown debugging selection: " + parsestring;

        *selector = (unsigned int)value;
        return "";
    }

    size_t pos = 0;
    while (pos < parsestring.length()) {
        while (pos < parsestring.length() && isspace((unsigned char)parsestring[pos]))
            ++pos;

        if (pos >= parsestring.length())
            break;

        char op = parsestring[pos];
        if (op != '+' && op != '-')
            return "unknown debugging flag (should be + or -): " + parsestring.substr(pos);

        size_t start = ++pos;
        while (pos < parsestring.length() && (isalnum((unsigned char)parsestring[pos]) || parsestring[pos] == '_'))
            ++pos;

        string name = parsestring.substr(start, pos - start);
        auto entry = findSelector(name);

        if (entry == NULL)
            return string("unknown debugging selection: ") + op + name;

        bool adding = op == '+';
        if (entry->bit == Di_all)
            *selector = adding ? D_all : 0;
        else if (adding)
            *selector |= BIT(entry->bit);
        else
            *selector &= ~BIT(entry->bit);
    }

    return "";
}

#endif

