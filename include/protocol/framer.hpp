/*
 * 설명: LF 기준으로 읽기 버퍼에서 한 줄을 분리하고 길이 제한과 제어 문자를 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/framer_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace protocol {

enum class FrameStatus { kNeedMore, kLine, kTooLarge, kInvalidFraming };

// buffer 앞부분에서 완성된 한 줄을 꺼낸다. 끝의 \r\n 은 제거된다.
// 실패(kTooLarge, kInvalidFraming) 시 buffer 는 비워진다.
FrameStatus ExtractLine(std::string &buffer, std::size_t max_length, std::string &line);

// 송신 전 검사. 길이 초과면 kTooLarge, \r 또는 \n 포함이면 kInvalidFraming.
FrameStatus CheckOutgoing(const std::string &line, std::size_t max_length);

bool HasLineBreak(const std::string &text);

}  // namespace protocol
