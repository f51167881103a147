/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#ifndef SEEDKEY_CLI_HXX_
#define SEEDKEY_CLI_HXX_

#include <iostream>

/*
 * The seedkey command line.  Results go to out unless -o names a file,
 * diagnostics to std::cerr.  Returns the process exit code.
 */
int run_seedkey(int argc, const char **argv, std::ostream &out);

#endif /* SEEDKEY_CLI_HXX_ */
