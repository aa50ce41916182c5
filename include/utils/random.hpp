/*
 * 설명: OpenSSL RAND_bytes 로 닉네임 접미사용 난수를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/registry_test.cpp
 */
#pragma once

#include <string>

namespace utils {

// [0, bound) 범위의 균등 난수. 보안 난수원을 쓸 수 없으면 false.
bool SecureRandomBelow(unsigned int bound, unsigned int &out);

// "_0421" 형태. 값은 10000 미만이어야 한다.
std::string FormatNickSuffix(unsigned int value);

}  // namespace utils
