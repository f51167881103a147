/*
 * Portions Copyright 1987, 1993, 1994
 * The Regents of the University of California.  All rights reserved.
 *
 * Portions Copyright 2003-2006, PostgreSQL Global Development Group
 * Adapted for seedkey
 * See COPYING file for license terms
 */

#ifndef GETOPT_SK_HXX_
#define GETOPT_SK_HXX_

#include <string>

extern int sk_optind;
extern std::string sk_optarg;

struct sk_option
{
    std::string name;
    bool has_arg;
    int shortopt;
};

/* returns the option character, '?' on error, -1 when done */
extern int getopt_sk(int argc, const char **argv, const char *optstring,
                     const struct sk_option *longopts, int *longindex);

/* rewind to argv[1] so another argument vector can be scanned */
extern void getopt_sk_reset();

#endif /* GETOPT_SK_HXX_ */
