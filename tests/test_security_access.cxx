// tests/test_security_access.cxx
#include "hexlib.hxx"
#include "security_access.hxx"
#include "seed_key.hxx"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

static std::vector<uint8_t> frame_of(const std::string &text)
{
    std::vector<uint8_t> bytes;
    REQUIRE(hexread(text, bytes));
    return bytes;
}

TEST_CASE("seed request for odd levels only")
{
    std::vector<uint8_t> frame;

    REQUIRE(build_seed_request(0x01, frame));
    CHECK(hexstr(frame) == "27 01");

    REQUIRE(build_seed_request(0x11, frame));
    CHECK(hexstr(frame) == "27 11");

    CHECK_FALSE(build_seed_request(0x00, frame));
    CHECK_FALSE(build_seed_request(0x02, frame));
    CHECK_FALSE(build_seed_request(0x7F, frame));
}

TEST_CASE("seed response is answered with the derived key")
{
    SecurityAccessFrame frame;
    SeedKey algo(0x04C11DB7);
    std::vector<uint8_t> request;

    REQUIRE(frame.read(frame_of("67 01 12 34 56 78")));
    CHECK(frame.type == SA_FRAME_SEED);
    CHECK(frame.level == 0x01);
    CHECK(frame.seed == 0x12345678);
    CHECK_FALSE(frame.isUnlocked());

    REQUIRE(frame.buildKeyRequest(algo, request));
    CHECK(hexstr(request) == "27 02 C4 72 BA 80");
}

TEST_CASE("higher access levels keep their level in the reply")
{
    SecurityAccessFrame frame;
    SeedKey algo(0x04C11DB7);
    std::vector<uint8_t> request;

    REQUIRE(frame.read(frame_of("67 03 00 00 00 01")));
    REQUIRE(frame.buildKeyRequest(algo, request));
    CHECK(hexstr(request) == "27 04 26 08 ED B8");
}

TEST_CASE("all zero seed means already unlocked")
{
    SecurityAccessFrame frame;

    REQUIRE(frame.read(frame_of("67 01 00 00 00 00")));
    CHECK(frame.type == SA_FRAME_SEED);
    CHECK(frame.isUnlocked());
}

TEST_CASE("key accepted response")
{
    SecurityAccessFrame frame;
    SeedKey algo(1);
    std::vector<uint8_t> request;

    REQUIRE(frame.read(frame_of("67 02")));
    CHECK(frame.type == SA_FRAME_KEY_ACCEPTED);
    CHECK(frame.isUnlocked());
    CHECK_FALSE(frame.buildKeyRequest(algo, request));
}

TEST_CASE("negative response carries the NRC")
{
    SecurityAccessFrame frame;

    REQUIRE(frame.read(frame_of("7F 27 35")));
    CHECK(frame.type == SA_FRAME_NEGATIVE);
    CHECK(frame.nrc == SA_NRC_INVALID_KEY);
    CHECK(std::string(nrc_name(frame.nrc)) == "invalidKey");
    CHECK_FALSE(frame.isUnlocked());

    CHECK(std::string(nrc_name(0x37)) == "requiredTimeDelayNotExpired");
    CHECK(std::string(nrc_name(0x99)) == "unknown");
}

TEST_CASE("malformed frames are rejected")
{
    SecurityAccessFrame frame;

    CHECK_FALSE(frame.read(frame_of("")));
    CHECK_FALSE(frame.read(frame_of("67")));
    CHECK_FALSE(frame.read(frame_of("50 01")));
    CHECK_FALSE(frame.read(frame_of("67 01 12 34 56")));
    CHECK_FALSE(frame.read(frame_of("67 01 12 34 56 78 9A")));
    CHECK_FALSE(frame.read(frame_of("67 7F 12 34 56 78")));
    CHECK_FALSE(frame.read(frame_of("67 02 00")));
    CHECK_FALSE(frame.read(frame_of("67 00")));
    CHECK_FALSE(frame.read(frame_of("7F 10 35")));
    CHECK_FALSE(frame.read(frame_of("7F 27")));
    CHECK(frame.type == SA_FRAME_NONE);
}
