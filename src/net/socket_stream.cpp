/*
 * 설명: poll 기반 데드라인을 갖는 평문 TCP 읽기/쓰기와 종료 처리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/line_transport_test.cpp
 */
#include "net/socket_stream.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>

namespace net {

const char *IoStatusToString(IoStatus status) {
    switch (status) {
        case IoStatus::kOk:
            return "ok";
        case IoStatus::kTimeout:
            return "timeout";
        case IoStatus::kClosed:
            return "closed";
        case IoStatus::kError:
            return "error";
    }
    return "error";
}

bool SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

IoStatus WaitReady(int fd, short events, int timeout_ms) {
    typedef std::chrono::steady_clock Clock;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        long remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                             deadline - Clock::now()).count();
        if (remaining < 0) {
            remaining = 0;
        }

        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return IoStatus::kError;
        }
        if (ret == 0) {
            return IoStatus::kTimeout;
        }
        if (pfd.revents & POLLNVAL) {
            return IoStatus::kError;
        }
        // POLLHUP/POLLERR 은 뒤따르는 recv/send 가 구체적인 결과를 알려준다.
        return IoStatus::kOk;
    }
}

SocketStream::SocketStream(int fd) : fd_(fd), interrupted_(false) {
    if (fd_ >= 0) {
        SetNonBlocking(fd_);
    }
}

SocketStream::~SocketStream() { Close(); }

IoStatus SocketStream::Handshake(int) { return fd_ >= 0 ? IoStatus::kOk : IoStatus::kClosed; }

IoStatus SocketStream::Read(char *buf, std::size_t capacity, std::size_t &received,
                            int timeout_ms) {
    received = 0;
    while (true) {
        if (interrupted_.load()) {
            return IoStatus::kClosed;
        }
        IoStatus ready = WaitReady(fd_, POLLIN, timeout_ms);
        if (ready != IoStatus::kOk) {
            return ready;
        }

        ssize_t n = recv(fd_, buf, capacity, 0);
        if (n > 0) {
            received = static_cast<std::size_t>(n);
            return IoStatus::kOk;
        }
        if (n == 0) {
            return IoStatus::kClosed;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            continue;
        }
        if (errno == ECONNRESET) {
            return IoStatus::kClosed;
        }
        return IoStatus::kError;
    }
}

IoStatus SocketStream::WriteAll(const char *data, std::size_t len, int timeout_ms) {
    typedef std::chrono::steady_clock Clock;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    std::size_t offset = 0;
    while (offset < len) {
        if (interrupted_.load()) {
            return IoStatus::kClosed;
        }
        ssize_t n = send(fd_, data + offset, len - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            long remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 deadline - Clock::now()).count();
            if (remaining <= 0) {
                return IoStatus::kTimeout;
            }
            IoStatus ready = WaitReady(fd_, POLLOUT, static_cast<int>(remaining));
            if (ready != IoStatus::kOk) {
                return ready;
            }
            continue;
        }
        if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
            return IoStatus::kClosed;
        }
        return IoStatus::kError;
    }
    return IoStatus::kOk;
}

void SocketStream::Interrupt() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    interrupted_.store(true);
    if (fd_ >= 0) {
        // 소켓을 닫지 않고 양방향을 끊어 대기 중인 poll 을 깨운다.
        shutdown(fd_, SHUT_RDWR);
    }
}

void SocketStream::Close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (fd_ < 0) {
        return;
    }
    close(fd_);
    fd_ = -1;
    interrupted_.store(true);
}

}  // namespace net
