/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#include <iostream>
#include <string>

#include "hexlib.hxx"
#include "security_access.hxx"
#include "seed_batch.hxx"

static std::string trim(const std::string &line)
{
    static const char WS[] = " \t\r\n";

    size_t first = line.find_first_not_of(WS);
    if (first == std::string::npos)
        return "";

    size_t last = line.find_last_not_of(WS);
    return line.substr(first, last - first + 1);
}

void write_seed_key(std::ostream &out, const SeedKey &algo, uint32_t seed)
{
    if (IS_VVERBOSE())
        algo.dump(seed);

    out << hexstr32(seed) << " " << hexstr32(algo.key(seed)) << "\n";
}

bool process_seed_stream(std::istream &in, std::ostream &out,
                         const SeedKey &algo, const std::string &name)
{
    std::string line;
    unsigned long lineno = 0;
    unsigned long count = 0;

    while (std::getline(in, line))
    {
        lineno++;

        std::string text = trim(line);
        if (text.empty() || text[0] == '#')
            continue;

        uint32_t seed;
        if (!hexread32(text, seed))
        {
            std::cerr << name << ":" << lineno << ": bad seed '"
                      << text << "'\n";
            return false;
        }

        write_seed_key(out, algo, seed);
        count++;
    }

    if (in.bad())
    {
        std::cerr << name << ": read error\n";
        return false;
    }

    if (IS_VERBOSE())
        std::cerr << name << ": " << count << " seeds\n";

    return true;
}
