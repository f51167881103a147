/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

// Some common bitwise operations

#ifndef BITS_HXX_
#define BITS_HXX_

#include <cstdint>

const uint32_t MSB32 = 0x80000000;

// Is the most significant bit of a 32-bit word set

inline bool TESTMSB(uint32_t value)
{
    return (value & MSB32) != 0;
}

// Shift left by one, dropping the bit shifted out of the top

inline uint32_t SHL1(uint32_t value)
{
    return (uint32_t)(value << 1);
}

// Convert big-endian byte sequences to native integers (either endian)

inline uint32_t GET32(const uint8_t *pVal)
{
    return ((uint32_t)pVal[0] << 24) | ((uint32_t)pVal[1] << 16) |
           ((uint32_t)pVal[2] << 8) | pVal[3];
}

// Convert native integers to big-endian byte sequences

inline void PUT32(uint32_t w, uint8_t *b)
{
    b[0] = w >> 24;
    b[1] = (w >> 16) & 0xFF;
    b[2] = (w >> 8) & 0xFF;
    b[3] = w & 0xFF;
}

#endif /* BITS_HXX_ */
