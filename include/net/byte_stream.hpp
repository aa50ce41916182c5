/*
 * 설명: TCP/TLS 연결을 공통으로 다루기 위한 양방향 바이트 스트림 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/line_transport_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace net {

enum class IoStatus { kOk, kTimeout, kClosed, kError };

class ByteStream {
   public:
    virtual ~ByteStream() {}

    // 연결 직후 한 번 호출된다. 평문 TCP 는 아무 일도 하지 않는다.
    virtual IoStatus Handshake(int timeout_ms) = 0;

    // 최대 capacity 바이트를 읽는다. timeout_ms 안에 데이터가 없으면 kTimeout.
    virtual IoStatus Read(char *buf, std::size_t capacity, std::size_t &received,
                          int timeout_ms) = 0;

    // len 바이트 전부를 커널 송신 버퍼에 넘길 때까지 쓴다.
    virtual IoStatus WriteAll(const char *data, std::size_t len, int timeout_ms) = 0;

    // 다른 스레드에서 진행 중인 Read/WriteAll 을 깨운다. 여러 번 호출해도 안전하다.
    virtual void Interrupt() = 0;

    // 소켓을 해제한다. 여러 번 호출해도 안전하다.
    virtual void Close() = 0;

    virtual const char *Kind() const = 0;
};

const char *IoStatusToString(IoStatus status);

}  // namespace net
