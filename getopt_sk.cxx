/*
 * getopt_sk() -- long options parser
 *
 * Portions Copyright 1987, 1993, 1994
 * The Regents of the University of California.  All rights reserved.
 *
 * Portions Copyright 2003-2006, PostgreSQL Global Development Group
 * Adapted for seedkey
 * See COPYING file for license terms
 */

#include "getopt_sk.hxx"

#include <cstring>

int sk_optind = 1;
std::string sk_optarg;

static const int BADCH = '?';
static const int BADARG = ':';
static const char EMSG[] = "";

static const char *place = EMSG;   /* option letter processing */

void getopt_sk_reset()
{
    sk_optind = 1;
    sk_optarg = "";
    place = EMSG;
}

/* --name, --name=value or --name value */
static int long_option(int argc, const char **argv, const char *optstring,
                       const struct sk_option *longopts, int *longindex)
{
    size_t namelen = std::strcspn(place, "=");
    std::string name(place, namelen);
    bool inline_arg = (place[namelen] == '=');

    for (int i = 0; longopts[i].name != ""; i++)
    {
        if (name != longopts[i].name)
            continue;

        if (longopts[i].has_arg)
        {
            if (inline_arg)
                sk_optarg = place + namelen + 1;
            else if (sk_optind < argc - 1)
                sk_optarg = argv[++sk_optind];
            else
            {
                place = EMSG;
                sk_optind++;
                return (optstring[0] == ':') ? BADARG : BADCH;
            }
        }
        else
        {
            /* an argument given to a flag is an error */
            if (inline_arg)
            {
                place = EMSG;
                sk_optind++;
                return BADCH;
            }
            sk_optarg = "";
        }

        sk_optind++;
        place = EMSG;

        if (longindex)
            *longindex = i;

        return longopts[i].shortopt;
    }

    place = EMSG;
    sk_optind++;
    return BADCH;
}

int getopt_sk(int argc, const char **argv, const char *optstring,
              const struct sk_option *longopts, int *longindex)
{
    const char *oli;                   /* option letter list index */
    int optopt;

    if (!*place)
    {                            /* update scanning pointer */
        if (sk_optind >= argc)
        {
            place = EMSG;
            return -1;
        }

        place = argv[sk_optind];

        /* operands, and a lone "-" meaning stdin, end the scan */
        if (place[0] != '-' || place[1] == '\0')
        {
            place = EMSG;
            return -1;
        }

        place++;

        if (place[0] == '-' && place[1] == '\0')
        {                        /* found "--" */
            ++sk_optind;
            place = EMSG;
            return -1;
        }

        if (place[0] == '-')
        {
            place++;
            return long_option(argc, argv, optstring, longopts, longindex);
        }
    }

    /* short option */
    optopt = (int) *place++;

    oli = (optopt == ':') ? NULL : std::strchr(optstring, optopt);
    if (!oli)
    {
        if (!*place)
            ++sk_optind;
        return BADCH;
    }

    if (oli[1] != ':')
    {                            /* don't need argument */
        sk_optarg = "";
        if (!*place)
            ++sk_optind;
        return optopt;
    }

    if (*place)                  /* no white space */
        sk_optarg = place;
    else if (argc <= ++sk_optind)
    {                            /* no arg */
        place = EMSG;
        return (*optstring == ':') ? BADARG : BADCH;
    }
    else                         /* white space */
        sk_optarg = argv[sk_optind];

    place = EMSG;
    ++sk_optind;
    return optopt;
}
