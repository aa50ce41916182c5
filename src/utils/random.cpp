/*
 * 설명: 거부 샘플링으로 모듈로 편향 없이 보안 난수를 뽑고 4자리 접미사로 포맷한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/registry_test.cpp
 */
#include "utils/random.hpp"

#include <openssl/rand.h>

#include <cstdint>
#include <cstdio>

namespace utils {

bool SecureRandomBelow(unsigned int bound, unsigned int &out) {
    if (bound == 0) {
        return false;
    }
    const std::uint32_t limit = UINT32_MAX - (UINT32_MAX % bound);
    for (int attempt = 0; attempt < 16; ++attempt) {
        unsigned char bytes[4];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
            return false;
        }
        std::uint32_t value = (static_cast<std::uint32_t>(bytes[0]) << 24) |
                              (static_cast<std::uint32_t>(bytes[1]) << 16) |
                              (static_cast<std::uint32_t>(bytes[2]) << 8) |
                              static_cast<std::uint32_t>(bytes[3]);
        if (value < limit) {
            out = value % bound;
            return true;
        }
    }
    return false;
}

std::string FormatNickSuffix(unsigned int value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "_%04u", value % 10000);
    return buf;
}

}  // namespace utils
