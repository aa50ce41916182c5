/*
 * 설명: LF 기준으로 입력 버퍼를 분리하고 길이 초과 및 줄 주입 여부를 판정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/framer_test.cpp
 */
#include "protocol/framer.hpp"

namespace protocol {

bool HasLineBreak(const std::string &text) {
    return text.find_first_of("\r\n") != std::string::npos;
}

FrameStatus ExtractLine(std::string &buffer, std::size_t max_length, std::string &line) {
    std::size_t pos = buffer.find('\n');
    if (pos == std::string::npos) {
        // 종결자 이전에 길이 초과한 경우 즉시 실패 처리한다. (\r\n 두 바이트 여유)
        if (buffer.size() > max_length + 2) {
            buffer.clear();
            return FrameStatus::kTooLarge;
        }
        return FrameStatus::kNeedMore;
    }

    std::string raw = buffer.substr(0, pos);
    buffer.erase(0, pos + 1);

    std::size_t end = raw.size();
    while (end > 0 && (raw[end - 1] == '\r' || raw[end - 1] == '\n')) {
        --end;
    }
    raw.erase(end);

    if (raw.size() > max_length) {
        buffer.clear();
        return FrameStatus::kTooLarge;
    }
    if (HasLineBreak(raw)) {
        buffer.clear();
        return FrameStatus::kInvalidFraming;
    }

    line.swap(raw);
    return FrameStatus::kLine;
}

FrameStatus CheckOutgoing(const std::string &line, std::size_t max_length) {
    if (line.size() > max_length) {
        return FrameStatus::kTooLarge;
    }
    if (HasLineBreak(line)) {
        return FrameStatus::kInvalidFraming;
    }
    return FrameStatus::kLine;
}

}  // namespace protocol
