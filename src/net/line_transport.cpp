/*
 * 설명: 스트림에서 받은 바이트를 줄 단위로 잘라 반환하고, 송신 라인을 검사한 뒤 개행을 붙여 동기 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/line_transport_test.cpp
 */
#include "net/line_transport.hpp"

#include <chrono>
#include <utility>

#include "protocol/framer.hpp"

namespace net {

const char *LineStatusToString(LineStatus status) {
    switch (status) {
        case LineStatus::kOk:
            return "ok";
        case LineStatus::kTimeout:
            return "timeout";
        case LineStatus::kTooLarge:
            return "too large";
        case LineStatus::kInvalidFraming:
            return "invalid framing";
        case LineStatus::kClosed:
            return "closed";
        case LineStatus::kIoError:
            return "io error";
    }
    return "io error";
}

LineTransport::LineTransport(std::unique_ptr<ByteStream> stream, const TransportLimits &limits)
    : stream_(std::move(stream)), limits_(limits) {}

LineTransport::~LineTransport() { Close(); }

LineStatus LineTransport::FromIo(IoStatus status) {
    switch (status) {
        case IoStatus::kOk:
            return LineStatus::kOk;
        case IoStatus::kTimeout:
            return LineStatus::kTimeout;
        case IoStatus::kClosed:
            return LineStatus::kClosed;
        case IoStatus::kError:
            return LineStatus::kIoError;
    }
    return LineStatus::kIoError;
}

IoStatus LineTransport::Handshake() { return stream_->Handshake(limits_.read_timeout_ms); }

LineStatus LineTransport::ReadLine(std::string &line) {
    typedef std::chrono::steady_clock Clock;
    // 데드라인은 ReadLine 호출마다 새로 잡는다. 한 줄이 유휴 시간 안에 완성되어야 한다.
    const Clock::time_point deadline =
        Clock::now() + std::chrono::milliseconds(limits_.read_timeout_ms);

    char buf[1024];
    while (true) {
        protocol::FrameStatus frame =
            protocol::ExtractLine(read_buffer_, limits_.max_line_size, line);
        if (frame == protocol::FrameStatus::kLine) {
            return LineStatus::kOk;
        }
        if (frame == protocol::FrameStatus::kTooLarge) {
            return LineStatus::kTooLarge;
        }
        if (frame == protocol::FrameStatus::kInvalidFraming) {
            return LineStatus::kInvalidFraming;
        }

        long remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - Clock::now()).count();
        if (remaining <= 0) {
            return LineStatus::kTimeout;
        }

        std::size_t received = 0;
        IoStatus status = stream_->Read(buf, sizeof(buf), received, static_cast<int>(remaining));
        if (status != IoStatus::kOk) {
            return FromIo(status);
        }
        read_buffer_.append(buf, received);
    }
}

LineStatus LineTransport::WriteLine(const std::string &line) {
    protocol::FrameStatus check = protocol::CheckOutgoing(line, limits_.max_line_size);
    if (check == protocol::FrameStatus::kTooLarge) {
        return LineStatus::kTooLarge;
    }
    if (check == protocol::FrameStatus::kInvalidFraming) {
        return LineStatus::kInvalidFraming;
    }

    std::string framed = line;
    framed.push_back('\n');

    std::lock_guard<std::mutex> lock(write_mutex_);
    return FromIo(stream_->WriteAll(framed.data(), framed.size(), limits_.write_timeout_ms));
}

void LineTransport::Interrupt() { stream_->Interrupt(); }

void LineTransport::Close() {
    if (stream_) {
        stream_->Close();
    }
}

}  // namespace net
