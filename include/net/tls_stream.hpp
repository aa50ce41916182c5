/*
 * 설명: OpenSSL 기반 TLS 서버 컨텍스트와, 논블로킹 fd 위에서 동작하는 TLS 스트림.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/tls_stream_test.cpp
 */
#pragma once

#include <openssl/ssl.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "net/byte_stream.hpp"

namespace net {

struct SslCtxDeleter {
    void operator()(SSL_CTX *ctx) const { SSL_CTX_free(ctx); }
};

struct SslDeleter {
    void operator()(SSL *ssl) const { SSL_free(ssl); }
};

typedef std::unique_ptr<SSL_CTX, SslCtxDeleter> SslCtxPtr;
typedef std::unique_ptr<SSL, SslDeleter> SslPtr;

// 인증서/키 로드에 실패하면 std::runtime_error 를 던진다.
class TlsContext {
   public:
    TlsContext(const std::string &cert_path, const std::string &key_path);

    SSL_CTX *get() const { return ctx_.get(); }

   private:
    SslCtxPtr ctx_;
};

class TlsStream : public ByteStream {
   public:
    // fd 소유권을 넘겨받는다.
    TlsStream(const TlsContext &context, int fd);
    virtual ~TlsStream();

    TlsStream(const TlsStream &) = delete;
    TlsStream &operator=(const TlsStream &) = delete;

    virtual IoStatus Handshake(int timeout_ms);
    virtual IoStatus Read(char *buf, std::size_t capacity, std::size_t &received, int timeout_ms);
    virtual IoStatus WriteAll(const char *data, std::size_t len, int timeout_ms);
    virtual void Interrupt();
    virtual void Close();
    virtual const char *Kind() const { return "tls"; }

   private:
    // SSL_ERROR_WANT_READ/WRITE 이면 소켓이 준비될 때까지 기다린다.
    IoStatus WaitForRetry(int ssl_error, int timeout_ms);

    std::mutex ssl_mutex_;
    SslPtr ssl_;
    int fd_;
    std::atomic<bool> interrupted_;
};

}  // namespace net
