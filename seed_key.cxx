/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#include <iostream>

#include "bits.hxx"
#include "hexlib.hxx"
#include "seed_key.hxx"

uint32_t SeedToKey(uint32_t seed, uint32_t mask)
{
    if (0 == seed)
        return 0;

    for (int i = 0; i < SK_ROUNDS; i++)
    {
        if (TESTMSB(seed))
            seed = SHL1(seed) ^ mask;
        else
            seed = SHL1(seed);
    }

    return seed;
}

// ===================================================================

SeedKey::SeedKey(uint32_t mask)
{
    this->mask = mask;
}

uint32_t SeedKey::key(uint32_t seed) const
{
    return SeedToKey(seed, mask);
}

int SeedKey::trace(uint32_t seed, uint32_t *rounds, uint32_t &result) const
{
    int i;

    result = 0;
    if (0 == seed)
        return 0;

    for (i = 0; i < SK_ROUNDS; i++)
    {
        bool carry = TESTMSB(seed);

        seed = SHL1(seed);
        if (carry)
            seed ^= mask;

        rounds[i] = seed;
    }

    result = seed;
    return i;
}

void SeedKey::dump(uint32_t seed) const
{
    uint32_t rounds[SK_ROUNDS];
    uint32_t result;
    int count = trace(seed, rounds, result);

    std::cerr << "seed        : " << hexstr32(seed) << "\n"
                 "mask        : " << hexstr32(mask) << "\n";

    for (int i = 0; i < count; i++)
    {
        std::cerr << "round " << (i < 9 ? " " : "") << (i + 1)
                  << "    : " << hexstr32(rounds[i])
                  << ((i > 0 ? TESTMSB(rounds[i - 1]) : TESTMSB(seed))
                      ? "  ^mask" : "") << "\n";
    }

    std::cerr << "key         : " << hexstr32(result) << "\n\n";
}
