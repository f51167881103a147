/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#ifndef SEED_KEY_HXX_
#define SEED_KEY_HXX_

#include <cstdint>

const int SK_ROUNDS = 35;

/*
 * Derive the security access key for a seed: 35 rounds of shift left,
 * XOR with the mask whenever the bit shifted out was set.
 * A zero seed gives a zero key.
 */
uint32_t SeedToKey(uint32_t seed, uint32_t mask);

class SeedKey
{
    private:
        uint32_t mask;

    public:
        uint32_t getMask() const { return mask; }

        uint32_t key(uint32_t seed) const;

        /* fills rounds[0..SK_ROUNDS-1], returns number of rounds run */
        int      trace(uint32_t seed, uint32_t *rounds,
                       uint32_t &result) const;
        void     dump(uint32_t seed) const;

        explicit SeedKey(uint32_t mask);
};

#endif /* SEED_KEY_HXX_ */
