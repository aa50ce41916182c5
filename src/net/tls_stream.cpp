/*
 * 설명: OpenSSL SSL 객체를 논블로킹 소켓과 묶어 데드라인이 있는 TLS 읽기/쓰기를 제공한다.
 *       읽기 스레드와 쓰기 스레드가 같은 SSL 객체를 쓰므로 모든 SSL 호출은 ssl_mutex_ 로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/tls_stream_test.cpp
 */
#include "net/tls_stream.hpp"

#include <openssl/err.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <climits>
#include <stdexcept>

#include "net/socket_stream.hpp"

namespace {
typedef std::chrono::steady_clock Clock;

int RemainingMs(const Clock::time_point &deadline) {
    long remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return remaining < 0 ? 0 : static_cast<int>(remaining);
}

std::string LastSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "알 수 없는 TLS 오류";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}
}  // namespace

namespace net {

TlsContext::TlsContext(const std::string &cert_path, const std::string &key_path)
    : ctx_(SSL_CTX_new(TLS_server_method())) {
    if (!ctx_) {
        throw std::runtime_error("SSL_CTX 생성 실패: " + LastSslError());
    }
    SSL_CTX_set_min_proto_version(ctx_.get(), TLS1_2_VERSION);
    SSL_CTX_set_mode(ctx_.get(), SSL_MODE_ENABLE_PARTIAL_WRITE |
                                     SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // close_notify 없이 끊긴 연결을 오류가 아닌 정상 종료로 본다.
    SSL_CTX_set_options(ctx_.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (SSL_CTX_use_certificate_chain_file(ctx_.get(), cert_path.c_str()) <= 0) {
        throw std::runtime_error("인증서 로드 실패 (" + cert_path + "): " + LastSslError());
    }
    if (SSL_CTX_use_PrivateKey_file(ctx_.get(), key_path.c_str(), SSL_FILETYPE_PEM) <= 0) {
        throw std::runtime_error("개인키 로드 실패 (" + key_path + "): " + LastSslError());
    }
    if (!SSL_CTX_check_private_key(ctx_.get())) {
        throw std::runtime_error("인증서와 개인키가 일치하지 않음");
    }
}

TlsStream::TlsStream(const TlsContext &context, int fd)
    : ssl_(SSL_new(context.get())), fd_(fd), interrupted_(false) {
    if (fd_ >= 0) {
        SetNonBlocking(fd_);
    }
    if (!ssl_) {
        ERR_clear_error();
        return;
    }
    // 실패하면 ssl_ 을 비워 Handshake 가 kError 를 돌려주게 한다. fd 는 Close 가 닫는다.
    if (SSL_set_fd(ssl_.get(), fd_) != 1) {
        ERR_clear_error();
        ssl_.reset();
        return;
    }
    SSL_set_accept_state(ssl_.get());
}

TlsStream::~TlsStream() { Close(); }

IoStatus TlsStream::WaitForRetry(int ssl_error, int timeout_ms) {
    if (ssl_error == SSL_ERROR_WANT_READ) {
        return WaitReady(fd_, POLLIN, timeout_ms);
    }
    if (ssl_error == SSL_ERROR_WANT_WRITE) {
        return WaitReady(fd_, POLLOUT, timeout_ms);
    }
    if (ssl_error == SSL_ERROR_ZERO_RETURN) {
        return IoStatus::kClosed;
    }
    if (ssl_error == SSL_ERROR_SYSCALL) {
        // 피어가 close_notify 없이 끊은 경우도 여기로 온다.
        ERR_clear_error();
        return IoStatus::kClosed;
    }
    ERR_clear_error();
    return IoStatus::kError;
}

IoStatus TlsStream::Handshake(int timeout_ms) {
    if (!ssl_) {
        return IoStatus::kError;
    }
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    while (true) {
        if (interrupted_.load()) {
            return IoStatus::kClosed;
        }
        int ret = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            if (!ssl_) {
                return IoStatus::kClosed;
            }
            ret = SSL_accept(ssl_.get());
            if (ret <= 0) {
                err = SSL_get_error(ssl_.get(), ret);
            }
        }
        if (ret == 1) {
            return IoStatus::kOk;
        }
        IoStatus status = WaitForRetry(err, RemainingMs(deadline));
        if (status != IoStatus::kOk) {
            return status;
        }
    }
}

IoStatus TlsStream::Read(char *buf, std::size_t capacity, std::size_t &received, int timeout_ms) {
    received = 0;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    const int want = capacity > static_cast<std::size_t>(INT_MAX) ? INT_MAX
                                                                  : static_cast<int>(capacity);

    while (true) {
        if (interrupted_.load()) {
            return IoStatus::kClosed;
        }
        int n = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            if (!ssl_) {
                return IoStatus::kClosed;
            }
            n = SSL_read(ssl_.get(), buf, want);
            if (n <= 0) {
                err = SSL_get_error(ssl_.get(), n);
            }
        }
        if (n > 0) {
            received = static_cast<std::size_t>(n);
            return IoStatus::kOk;
        }
        IoStatus status = WaitForRetry(err, RemainingMs(deadline));
        if (status != IoStatus::kOk) {
            return status;
        }
    }
}

IoStatus TlsStream::WriteAll(const char *data, std::size_t len, int timeout_ms) {
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    std::size_t offset = 0;
    while (offset < len) {
        if (interrupted_.load()) {
            return IoStatus::kClosed;
        }
        std::size_t chunk = len - offset;
        if (chunk > static_cast<std::size_t>(INT_MAX)) {
            chunk = INT_MAX;
        }

        int n = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            if (!ssl_) {
                return IoStatus::kClosed;
            }
            n = SSL_write(ssl_.get(), data + offset, static_cast<int>(chunk));
            if (n <= 0) {
                err = SSL_get_error(ssl_.get(), n);
            }
        }
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        int remaining = RemainingMs(deadline);
        if (remaining == 0) {
            return IoStatus::kTimeout;
        }
        IoStatus status = WaitForRetry(err, remaining);
        if (status != IoStatus::kOk) {
            return status;
        }
    }
    return IoStatus::kOk;
}

void TlsStream::Interrupt() {
    interrupted_.store(true);
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
    }
}

void TlsStream::Close() {
    std::lock_guard<std::mutex> lock(ssl_mutex_);
    if (fd_ < 0) {
        return;
    }
    if (ssl_ && !interrupted_.load() && SSL_is_init_finished(ssl_.get())) {
        // 논블로킹이므로 close_notify 전송만 시도하고 응답은 기다리지 않는다.
        SSL_shutdown(ssl_.get());
        ERR_clear_error();
    }
    ssl_.reset();
    close(fd_);
    fd_ = -1;
    interrupted_.store(true);
}

}  // namespace net
