/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#ifndef SEED_BATCH_HXX_
#define SEED_BATCH_HXX_

#include <iostream>
#include <string>

#include "seed_key.hxx"

/* "SEED KEY", both as 8 hex digits */
void write_seed_key(std::ostream &out, const SeedKey &algo, uint32_t seed);

/*
 * One seed per line.  Blank lines and lines starting with '#' are
 * skipped; stops at the first bad line and reports its number.
 */
bool process_seed_stream(std::istream &in, std::ostream &out,
                         const SeedKey &algo, const std::string &name);

#endif /* SEED_BATCH_HXX_ */
