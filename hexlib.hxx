/*
 * hex parsing and dumping routines
 * Copyright Qualcomm Inc 1997
 * Adapted for seedkey
 * See COPYING.md for license terms
 */

#ifndef HEXLIB_HXX_
#define HEXLIB_HXX_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/* 1 to 8 hex digits, optional 0x prefix */
bool hexread32(const std::string &text, uint32_t &value);

/* hex pairs, whitespace allowed between bytes */
bool hexread(const std::string &text, std::vector<uint8_t> &bytes);

std::string hexstr32(uint32_t value);
std::string hexstr(const std::vector<uint8_t> &bytes);

void hexbulk(const uint8_t *, size_t n);

#endif /* HEXLIB_HXX_ */
