/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "getopt_sk.hxx"
#include "cli_common.hxx"
#include "hexlib.hxx"
#include "security_access.hxx"
#include "seed_batch.hxx"
#include "seed_key.hxx"
#include "seedkey_cli.hxx"

static struct sk_option long_options[] = {
    {"mask", true, 'm'},
    {"out", true, 'o'},
    {"response", true, 'r'},
    {"batch", true, 'b'},
    {"verbose", false, 'v'},
    {"version", false, 'V'},
    {"help", false, 'h'},
    {"", false, 0}
};

static int do_help(const char *arg0, int exitval)
{
    std::cerr << "Usage: " << arg0 << " [--help] [--verbose|-v] "
        "[{--mask|-m} mask] [{--out|-o} outfile] [{--response|-r} frame] "
        "[{--batch|-b} seedfile] [seed ...]\n\n"
        " -m, --mask,       XOR mask, hex (default from ~/.seedkey_mask)\n"
        " -o, --out,        output file (default stdout)\n"
        " -r, --response,   ECU seed response frame, hex bytes "
        "(\"67 01 12 34 56 78\")\n"
        " -b, --batch,      file of seeds, one per line\n"
        " -v, --verbose,    verbose, twice to show every round\n"
        " -V, --version,    print the version information and exit\n"
        " -h, --help,       print this help and exit\n\n"
        "Seeds and the mask are 32-bit hex values.  The file name given "
        "for the seed file may be -, which means stdin.\n\n";
    return exitval;
}

static int do_response(const std::string &text, const SeedKey &algo,
                       std::ostream &out)
{
    std::vector<uint8_t> bytes;
    SecurityAccessFrame frame;

    if (!hexread(text, bytes))
    {
        std::cerr << "bad response frame '" << text << "'\n";
        return 8;
    }

    if (!frame.read(bytes))
        return 8;

    frame.dump();

    if (SA_FRAME_NEGATIVE == frame.type)
    {
        std::cerr << "ECU refused: " << nrc_name(frame.nrc) << "\n";
        return 8;
    }

    if (SA_FRAME_SEED != frame.type)
    {
        std::cerr << "not a seed response\n";
        return 8;
    }

    if (frame.isUnlocked())
    {
        VERBOSE("zero seed, level needs no key\n");
        out << "already unlocked\n";
        return 0;
    }

    if (IS_VVERBOSE())
        algo.dump(frame.seed);

    std::vector<uint8_t> request;
    if (!frame.buildKeyRequest(algo, request))
        return 8;

    out << hexstr(request) << "\n";
    return 0;
}

int run_seedkey(int argc, const char **argv, std::ostream &out)
{
    std::string maskstr = "";
    std::string outfile = "";
    std::string response = "";
    std::string batchfile = "";

    getopt_sk_reset();
    o_verbose = 0;

    while (true)
    {
        int c = getopt_sk(argc, argv, "m:o:r:b:vVh", long_options, 0);

        if (c == -1)
            break;

        switch (c)
        {
            case 'm':
                maskstr = sk_optarg;
                break;
            case 'o':
                outfile = sk_optarg;
                break;
            case 'r':
                response = sk_optarg;
                break;
            case 'b':
                batchfile = sk_optarg;
                break;
            case 'v':
                o_verbose++;
                break;
            case 'h':
                return do_help(argv[0], 1);
            case '?':
                return do_help(argv[0], 2);
            case 'V':
                do_version();
                return 10;
            default:
                return do_help(argv[0], 3);
        }
    }

    std::vector<uint32_t> seeds;
    for (; sk_optind < argc; sk_optind++)
    {
        uint32_t seed;
        if (!hexread32(argv[sk_optind], seed))
        {
            std::cerr << "bad seed '" << argv[sk_optind] << "'\n";
            return 4;
        }
        seeds.push_back(seed);
    }

    if ("" == maskstr)
    {
        maskstr = get_mask_from_conf_file();
        if (IS_VERBOSE() && "" != maskstr)
            std::cerr << "mask from " << get_mask_conf_path() << "\n";
    }

    if ("" == maskstr ||
        (seeds.empty() && "" == response && "" == batchfile))
        return do_help(argv[0], 5);

    uint32_t mask;
    if (!hexread32(maskstr, mask))
    {
        std::cerr << "bad mask '" << maskstr << "'\n";
        return 6;
    }

    SeedKey algo(mask);

    std::ofstream ofs;
    if ("" != outfile && "-" != outfile)
    {
        ofs.open(outfile);
        if (!ofs.good())
        {
            std::perror("opening output file");
            return 7;
        }
    }
    std::ostream &dest = ofs.is_open() ? ofs : out;

    if (IS_VERBOSE())
        std::cerr << "mask        : " << hexstr32(mask) << "\n";

    for (size_t i = 0; i < seeds.size(); i++)
        write_seed_key(dest, algo, seeds[i]);

    if ("" != response)
    {
        int rc = do_response(response, algo, dest);
        if (rc)
            return rc;
    }

    if ("" != batchfile)
    {
        bool ok;

        if ("-" == batchfile)
            ok = process_seed_stream(std::cin, dest, algo, "stdin");
        else
        {
            std::ifstream in(batchfile);
            if (!in.good())
            {
                std::perror(batchfile.c_str());
                return 8;
            }
            ok = process_seed_stream(in, dest, algo, batchfile);
        }

        if (!ok)
            return 8;
    }

    dest.flush();
    if (!dest.good())
    {
        std::perror("write output");
        return 7;
    }

    return 0;
}
