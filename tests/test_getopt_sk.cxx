// tests/test_getopt_sk.cxx
#include "getopt_sk.hxx"

#include <catch2/catch.hpp>

#include <string>

static const struct sk_option test_options[] = {
    {"mask", true, 'm'},
    {"verbose", false, 'v'},
    {"help", false, 'h'},
    {"", false, 0}
};

static const char OPTSTRING[] = "m:vh";

#define ARGC(a) ((int)(sizeof(a) / sizeof((a)[0])))

TEST_CASE("short options with attached and separate arguments")
{
    const char *argv[] = {"seedkey", "-m04C11DB7", "-v", "-m", "FF", "1234"};
    getopt_sk_reset();

    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'm');
    CHECK(sk_optarg == "04C11DB7");
    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'v');
    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'm');
    CHECK(sk_optarg == "FF");
    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == -1);
    CHECK(sk_optind == 5);
    CHECK(std::string(argv[sk_optind]) == "1234");
}

TEST_CASE("clustered flags")
{
    const char *argv[] = {"seedkey", "-vvh"};
    getopt_sk_reset();

    CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'v');
    CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'v');
    CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'h');
    CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == -1);
    CHECK(sk_optind == 2);
}

TEST_CASE("long options")
{
    const char *argv[] = {"seedkey", "--mask=1BADB002", "--verbose",
                          "--mask", "0x10", "--", "-v"};
    int longindex = -1;
    getopt_sk_reset();

    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options,
                      &longindex) == 'm');
    CHECK(sk_optarg == "1BADB002");
    CHECK(longindex == 0);

    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options,
                      &longindex) == 'v');
    CHECK(longindex == 1);

    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == 'm');
    CHECK(sk_optarg == "0x10");

    REQUIRE(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == -1);
    CHECK(sk_optind == 6);
}

TEST_CASE("unknown and incomplete options")
{
    SECTION("unknown short option")
    {
        const char *argv[] = {"seedkey", "-x"};
        getopt_sk_reset();
        CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == '?');
    }

    SECTION("unknown long option")
    {
        const char *argv[] = {"seedkey", "--seed=1"};
        getopt_sk_reset();
        CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == '?');
    }

    SECTION("missing argument")
    {
        const char *argv[] = {"seedkey", "-m"};
        getopt_sk_reset();
        CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == '?');
    }

    SECTION("missing long argument")
    {
        const char *argv[] = {"seedkey", "--mask"};
        getopt_sk_reset();
        CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == '?');
    }

    SECTION("argument to a flag")
    {
        const char *argv[] = {"seedkey", "--verbose=2"};
        getopt_sk_reset();
        CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == '?');
    }
}

TEST_CASE("a lone dash is an operand")
{
    const char *argv[] = {"seedkey", "-", "-v"};
    getopt_sk_reset();

    CHECK(getopt_sk(ARGC(argv), argv, OPTSTRING, test_options, 0) == -1);
    CHECK(sk_optind == 1);
}
