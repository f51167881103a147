/* hex parsing and dumping routines */
/* Copyright C Qualcomm Inc 1997 */

#include <cctype>
#include <cstdio>
#include <iostream>
#include <string>

#include "hexlib.hxx"

#define COLS 16

static const char lookup[] = "0123456789ABCDEF";

static int hexval(char ch)
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

bool hexread32(const std::string &text, uint32_t &value)
{
    size_t start = 0;

    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        start = 2;

    size_t ndigits = text.size() - start;
    if (ndigits == 0 || ndigits > 8)
        return false;

    uint32_t result = 0;
    for (size_t i = start; i < text.size(); i++)
    {
        int nibble = hexval(text[i]);
        if (nibble < 0)
            return false;
        result = (result << 4) | (uint32_t)nibble;
    }

    value = result;
    return true;
}

bool hexread(const std::string &text, std::vector<uint8_t> &bytes)
{
    std::vector<uint8_t> result;
    int high = -1;

    for (size_t i = 0; i < text.size(); i++)
    {
        char ch = text[i];

        if (std::isspace((unsigned char)ch))
        {
            /* no splitting a byte in two */
            if (high >= 0)
                return false;
            continue;
        }

        int nibble = hexval(ch);
        if (nibble < 0)
            return false;

        if (high < 0)
            high = nibble;
        else
        {
            result.push_back((uint8_t)((high << 4) | nibble));
            high = -1;
        }
    }

    if (high >= 0)
        return false;

    bytes.swap(result);
    return true;
}

std::string hexstr32(uint32_t value)
{
    std::string out(8, '0');

    for (int i = 7; i >= 0; i--)
    {
        out[i] = lookup[value & 0xf];
        value >>= 4;
    }

    return out;
}

std::string hexstr(const std::vector<uint8_t> &bytes)
{
    std::string out = "";

    for (size_t i = 0; i < bytes.size(); i++)
    {
        if (i)
            out += ' ';
        out += lookup[(bytes[i] >> 4) & 0xf];
        out += lookup[ bytes[i]       & 0xf];
    }

    return out;
}

void hexbulk(const uint8_t *buf, size_t n)
{
    size_t i = 0;

    while (i < n)
    {
        int j = 0;
        char ch;
        char hexdigit[5];
        std::string hexcols = "";
        std::string strstr = "";
        for (j = 0; (j < COLS) && (i < n); j++, i++)
        {
            ch = buf[i];
            if (std::isspace((unsigned char)ch))
                ch = ' ';
            else if (!std::isprint((unsigned char)ch))
                ch = '.';

            std::snprintf(hexdigit, sizeof(hexdigit), "%02x ", buf[i]);
            hexcols += hexdigit;
            strstr += ch;
        }

        while (j < COLS)
        {
            hexcols += "   ";
            j++;
        }

        std::cerr << hexcols << " " << strstr << "\n";
    }
}
