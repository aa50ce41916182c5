/*
 * 설명: `COMMAND argument` 형식의 라인을 분리하고 닉네임 유효성 검사와 응답 라인 생성을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace protocol {

const std::size_t kMinNicknameLength = 3;
const std::size_t kMaxNicknameLength = 20;

struct ParsedCommand {
    std::string command;
    std::string argument;
};

ParsedCommand ParseCommand(const std::string &line);
bool IsValidNickname(const std::string &nick);
std::string Trim(const std::string &text);

std::string FormatRelay(const std::string &nick, const std::string &text);
std::string FormatReply(const std::string &command, const std::string &argument);

}  // namespace protocol
