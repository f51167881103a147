/*
 * seedkey
 * Copyright 2026, the seedkey developers
 * See COPYING.md for license terms
 */

#ifndef SECURITY_ACCESS_HXX_
#define SECURITY_ACCESS_HXX_

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "seed_key.hxx"

extern int o_verbose;

inline bool IS_VERBOSE()   { return (o_verbose >= 1); }
inline bool IS_VVERBOSE()  { return (o_verbose >= 2); }

inline void VERBOSE(const char *s)   { if (IS_VERBOSE())   std::cerr << s; }

/*
 * UDS (ISO 14229-1) SecurityAccess service.  Odd sub-functions request a
 * seed for an access level, the following even sub-function sends the
 * key for it.
 */

const uint8_t SA_REQUEST_SID  = 0x27;
const uint8_t SA_RESPONSE_SID = 0x67;
const uint8_t SA_NEGATIVE_SID = 0x7F;

const uint8_t SA_LEVEL_MIN = 0x01;
const uint8_t SA_LEVEL_MAX = 0x7D;

const size_t  SA_SEED_LEN = 4;

typedef enum
{
    SA_FRAME_NONE = 0,
    SA_FRAME_SEED,          /* 67 LL seed[4] */
    SA_FRAME_KEY_ACCEPTED,  /* 67 LL+1 */
    SA_FRAME_NEGATIVE       /* 7F 27 NRC */
}
SecurityAccessFrameType;

typedef enum
{
    SA_NRC_SUB_FUNCTION_NOT_SUPPORTED = 0x12,
    SA_NRC_INCORRECT_LENGTH           = 0x13,
    SA_NRC_CONDITIONS_NOT_CORRECT     = 0x22,
    SA_NRC_REQUEST_SEQUENCE_ERROR     = 0x24,
    SA_NRC_REQUEST_OUT_OF_RANGE       = 0x31,
    SA_NRC_SECURITY_ACCESS_DENIED     = 0x33,
    SA_NRC_INVALID_KEY                = 0x35,
    SA_NRC_EXCEEDED_ATTEMPTS          = 0x36,
    SA_NRC_TIME_DELAY_NOT_EXPIRED     = 0x37
}
SecurityAccessNrc;

const char *nrc_name(uint8_t nrc);

bool is_seed_level(uint8_t level);

bool build_seed_request(uint8_t level, std::vector<uint8_t> &frame);

class SecurityAccessFrame
{
    public:
        SecurityAccessFrameType type;
        uint8_t  level;    /* sub-function as sent by the ECU */
        uint32_t seed;
        uint8_t  nrc;

        bool     read(const std::vector<uint8_t> &frame);
        bool     buildKeyRequest(const SeedKey &algo,
                                 std::vector<uint8_t> &frame) const;
        bool     isUnlocked() const;
        void     dump() const;

        SecurityAccessFrame();
};

#endif /* SECURITY_ACCESS_HXX_ */
