/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING file for license terms
 */

#include "skconfig.h"

#include <cstdlib>
#include <iostream>
#include <fstream>
#include <string>

#include "cli_common.hxx"

#ifdef WIN32
static const char HOME_ENV_NAME[] = "USERPROFILE";
static const char DEFAULT_EMPTY_HOME[] = "C:";
#else
static const char HOME_ENV_NAME[] = "HOME";
static const char DEFAULT_EMPTY_HOME[] = "";
#endif

const char MASK_DOTFILE_NAME[] = "/.seedkey_mask";

std::string get_mask_conf_path()
{
    const char *home_dir = std::getenv(HOME_ENV_NAME);

    if (!home_dir)
        home_dir = DEFAULT_EMPTY_HOME;

    std::string mask_fname = home_dir;
    mask_fname += MASK_DOTFILE_NAME;
    return mask_fname;
}

/* first whitespace-separated token of the dotfile, "" if there is none */
std::string get_mask_from_conf_file()
{
    std::ifstream mask_file(get_mask_conf_path());
    if (mask_file.good())
    {
        std::string mask;
        mask_file >> mask;
        return mask;
    }

    return "";
}

void do_version()
{
    std::cerr << PACKAGE_STRING "\n"
        "Seed-to-Key calculator for UDS security access\n"
        "See COPYING file in distribution for details\n\n";
}
