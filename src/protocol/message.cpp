/*
 * 설명: 첫 공백 기준으로 명령/인자를 분리하고 닉네임을 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/message_test.cpp
 */
#include "protocol/message.hpp"

#include <cctype>
#include <string>

namespace protocol {

std::string Trim(const std::string &text) {
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

ParsedCommand ParseCommand(const std::string &line) {
    ParsedCommand parsed;

    std::size_t space = line.find(' ');
    if (space == std::string::npos) {
        parsed.command = line;
        return parsed;
    }

    parsed.command = line.substr(0, space);
    parsed.argument = Trim(line.substr(space + 1));
    return parsed;
}

bool IsValidNickname(const std::string &nick) {
    if (nick.size() < kMinNicknameLength || nick.size() > kMaxNicknameLength) {
        return false;
    }

    for (std::size_t i = 0; i < nick.size(); ++i) {
        char ch = nick[i];
        // isalnum 은 로케일 영향을 받으므로 ASCII 범위를 직접 비교한다.
        bool allowed = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                       (ch >= '0' && ch <= '9') || ch == '_';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

std::string FormatRelay(const std::string &nick, const std::string &text) {
    return "MSG " + nick + ": " + text;
}

std::string FormatReply(const std::string &command, const std::string &argument) {
    if (argument.empty()) {
        return command;
    }
    return command + " " + argument;
}

}  // namespace protocol
