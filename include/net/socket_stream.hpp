/*
 * 설명: 논블로킹 소켓 fd 위에서 poll 로 데드라인을 적용하는 평문 TCP 스트림.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/line_transport_test.cpp
 */
#pragma once

#include <atomic>
#include <mutex>

#include "net/byte_stream.hpp"

namespace net {

class SocketStream : public ByteStream {
   public:
    // fd 소유권을 넘겨받는다. 생성 시 O_NONBLOCK 으로 전환한다.
    explicit SocketStream(int fd);
    virtual ~SocketStream();

    virtual IoStatus Handshake(int timeout_ms);
    virtual IoStatus Read(char *buf, std::size_t capacity, std::size_t &received, int timeout_ms);
    virtual IoStatus WriteAll(const char *data, std::size_t len, int timeout_ms);
    virtual void Interrupt();
    virtual void Close();
    virtual const char *Kind() const { return "tcp"; }

    SocketStream(const SocketStream &) = delete;
    SocketStream &operator=(const SocketStream &) = delete;

   private:
    std::mutex close_mutex_;
    int fd_;
    std::atomic<bool> interrupted_;
};

bool SetNonBlocking(int fd);

// fd 가 events 중 하나로 준비될 때까지 최대 timeout_ms 기다린다.
IoStatus WaitReady(int fd, short events, int timeout_ms);

}  // namespace net
