/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#include <iostream>

#include "seedkey_cli.hxx"

int main(int argc, const char **argv)
{
    return run_seedkey(argc, argv, std::cout);
}
