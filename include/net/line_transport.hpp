/*
 * 설명: 바이트 스트림 위에서 한 줄 단위 읽기/쓰기를 제공한다. 최대 길이, 읽기/쓰기 데드라인, 줄 주입 방지를 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/line_transport_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include "net/byte_stream.hpp"

namespace net {

enum class LineStatus { kOk, kTimeout, kTooLarge, kInvalidFraming, kClosed, kIoError };

const char *LineStatusToString(LineStatus status);

const int kWriteTimeoutMs = 10 * 1000;

struct TransportLimits {
    std::size_t max_line_size;
    int read_timeout_ms;
    int write_timeout_ms;

    TransportLimits(std::size_t max_line, int read_timeout)
        : max_line_size(max_line), read_timeout_ms(read_timeout), write_timeout_ms(kWriteTimeoutMs) {}
};

class LineTransport {
   public:
    LineTransport(std::unique_ptr<ByteStream> stream, const TransportLimits &limits);
    ~LineTransport();

    LineTransport(const LineTransport &) = delete;
    LineTransport &operator=(const LineTransport &) = delete;

    IoStatus Handshake();

    // 읽기는 세션 스레드 하나만 호출한다.
    LineStatus ReadLine(std::string &line);

    // 세션 스레드와 writer 스레드가 동시에 호출할 수 있다. 줄 단위로 직렬화된다.
    LineStatus WriteLine(const std::string &line);

    void Interrupt();
    void Close();

    const char *Kind() const { return stream_->Kind(); }

   private:
    static LineStatus FromIo(IoStatus status);

    std::unique_ptr<ByteStream> stream_;
    TransportLimits limits_;
    std::string read_buffer_;
    std::mutex write_mutex_;
};

}  // namespace net
