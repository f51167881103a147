/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#include <iostream>
#include <string>

#include "bits.hxx"
#include "hexlib.hxx"
#include "security_access.hxx"

int o_verbose;

const char *nrc_name(uint8_t nrc)
{
    switch (nrc)
    {
        case SA_NRC_SUB_FUNCTION_NOT_SUPPORTED :
            return "subFunctionNotSupported";
        case SA_NRC_INCORRECT_LENGTH :
            return "incorrectMessageLengthOrInvalidFormat";
        case SA_NRC_CONDITIONS_NOT_CORRECT :
            return "conditionsNotCorrect";
        case SA_NRC_REQUEST_SEQUENCE_ERROR :
            return "requestSequenceError";
        case SA_NRC_REQUEST_OUT_OF_RANGE :
            return "requestOutOfRange";
        case SA_NRC_SECURITY_ACCESS_DENIED :
            return "securityAccessDenied";
        case SA_NRC_INVALID_KEY :
            return "invalidKey";
        case SA_NRC_EXCEEDED_ATTEMPTS :
            return "exceededNumberOfAttempts";
        case SA_NRC_TIME_DELAY_NOT_EXPIRED :
            return "requiredTimeDelayNotExpired";
        default :
            return "unknown";
    }
}

bool is_seed_level(uint8_t level)
{
    return (level & 0x01) && level >= SA_LEVEL_MIN && level <= SA_LEVEL_MAX;
}

bool build_seed_request(uint8_t level, std::vector<uint8_t> &frame)
{
    if (!is_seed_level(level))
    {
        std::cerr << "bad security access level "
                  << hexstr(std::vector<uint8_t>(1, level)) << "\n";
        return false;
    }

    frame.clear();
    frame.push_back(SA_REQUEST_SID);
    frame.push_back(level);
    return true;
}

// ===================================================================

SecurityAccessFrame::SecurityAccessFrame()
{
    type  = SA_FRAME_NONE;
    level = 0;
    seed  = 0;
    nrc   = 0;
}

bool SecurityAccessFrame::read(const std::vector<uint8_t> &frame)
{
    type  = SA_FRAME_NONE;
    level = 0;
    seed  = 0;
    nrc   = 0;

    if (IS_VVERBOSE())
    {
        std::cerr << "frame (" << frame.size() << " bytes) :\n";
        hexbulk(frame.data(), frame.size());
    }

    if (frame.size() < 2)
    {
        std::cerr << "security access frame too short\n";
        return false;
    }

    if (SA_NEGATIVE_SID == frame[0])
    {
        if (frame.size() != 3 || SA_REQUEST_SID != frame[1])
        {
            std::cerr << "malformed negative response\n";
            return false;
        }

        type = SA_FRAME_NEGATIVE;
        nrc  = frame[2];
        return true;
    }

    if (SA_RESPONSE_SID != frame[0])
    {
        std::cerr << "not a security access response\n";
        return false;
    }

    level = frame[1];

    if (level & 0x01)
    {
        if (!is_seed_level(level))
        {
            std::cerr << "seed response for reserved level\n";
            return false;
        }

        if (frame.size() != 2 + SA_SEED_LEN)
        {
            std::cerr << "seed response must carry a "
                      << SA_SEED_LEN << " byte seed\n";
            return false;
        }

        type = SA_FRAME_SEED;
        seed = GET32(&frame[2]);
        return true;
    }

    if (level < SA_LEVEL_MIN + 1 || level > SA_LEVEL_MAX + 1 ||
        frame.size() != 2)
    {
        std::cerr << "malformed send key response\n";
        return false;
    }

    type = SA_FRAME_KEY_ACCEPTED;
    return true;
}

bool SecurityAccessFrame::isUnlocked() const
{
    return SA_FRAME_KEY_ACCEPTED == type ||
           (SA_FRAME_SEED == type && 0 == seed);
}

bool SecurityAccessFrame::buildKeyRequest(const SeedKey &algo,
                                          std::vector<uint8_t> &frame) const
{
    if (SA_FRAME_SEED != type)
    {
        std::cerr << "no seed to answer\n";
        return false;
    }

    uint8_t key[SA_SEED_LEN];
    PUT32(algo.key(seed), key);

    frame.clear();
    frame.push_back(SA_REQUEST_SID);
    frame.push_back(level + 1);
    frame.insert(frame.end(), key, key + SA_SEED_LEN);

    return true;
}

void SecurityAccessFrame::dump() const
{
    if (IS_VERBOSE())
    {
        std::cerr << "Security Access : \n";

        switch (type)
        {
            case SA_FRAME_SEED :
                std::cerr << "       type : seed\n"
                          << "      level : " << (int)level << "\n"
                          << "       seed : " << hexstr32(seed) << "\n\n";
                break;
            case SA_FRAME_KEY_ACCEPTED :
                std::cerr << "       type : key accepted\n"
                          << "      level : " << (int)(level - 1) << "\n\n";
                break;
            case SA_FRAME_NEGATIVE :
                std::cerr << "       type : negative response\n"
                          << "        nrc : "
                          << hexstr(std::vector<uint8_t>(1, nrc))
                          << " (" << nrc_name(nrc) << ")\n\n";
                break;
            default :
                std::cerr << "       type : none\n\n";
        }
    }
}
