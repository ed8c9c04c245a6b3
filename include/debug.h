
#ifndef DEBUG_H
#define DEBUG_H

/*
 Selective debugging, modeled on the debug selectors of the Exim MTA.

 Each subsystem gets a bit; -v turns on D_default, --vv turns on everything and
 -v+probe-prune style arguments add or remove individual selectors.
 */

#include <string>

#define BIT(n) (1UL << (n))

/* selector numbers come from line numbers, so the DEBUG_BIT() lines below
   must stay on consecutive lines */

#define IOTA(iota)      (__LINE__ - iota)
#define IOTA_INIT(zero) (__LINE__ - zero + 1)

#define DEBUG_BIT(name) Di_##name = IOTA(Di_iota), D_##name = (int)BIT(Di_##name)

enum {
  Di_all        = -1,
  Di_v          = 0,

  Di_iota = IOTA_INIT(1),
  DEBUG_BIT(config),               /* 1 */
  DEBUG_BIT(coord),
  DEBUG_BIT(exec),
  DEBUG_BIT(hosts),
  DEBUG_BIT(notify),
  DEBUG_BIT(probe),
  DEBUG_BIT(prune),
  DEBUG_BIT(sync),
  DEBUG_BIT(transfer),
};

#define D_all                        0xffffffff

#define D_any                        (D_all)

#define D_default                    (D_all & \
                                       ~(D_transfer         | \
                                         D_config           | \
                                         D_exec))


#define DEBUG(x)      if (GLOBALS.debugSelector & (x))

struct bit_table {
  const char *name;
  int bit;
};

#define BIT_TABLE(T,name) { #name, T##i_##name }

extern bit_table debug_options[];
extern int ndebug_options;


/* decode_bits(selector, parsestring)
 * Apply a selector string ("=0x14" or "+probe-prune") on top of *selector.
 * Returns a blank string on success or a description of the first bad token. */
std::string decode_bits(unsigned int *selector, std::string parsestring);


#endif

