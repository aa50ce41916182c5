/*
 * 설명: 연결 하나를 핸드셰이크(HELLO), 메시지 루프(MSG/PING/BYE), 종료까지 구동하는 상태 기계와 짝을 이루는 writer 스레드.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "broadcast.hpp"
#include "net/line_transport.hpp"
#include "registry.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

enum class SessionState { kConnecting, kAwaitingHello, kActive, kClosed };

enum class CloseReason {
    kTimeout,
    kTooLarge,
    kInvalidFraming,
    kPeerClosed,
    kIoError,
    kTlsHandshakeFailed,
    kHandshakeRejected,
    kNickExhausted,
    kSlotLimitReached,
    kClientBye,
    kWriteFailed
};

const char *SessionStateToString(SessionState state);
const char *CloseReasonToString(CloseReason reason);

struct SessionSettings {
    std::size_t max_conns_per_ip;
    std::size_t max_msgs_per_sec;
    std::size_t max_msg_size;
    int keepalive_timeout_ms;
    std::size_t outbound_lines;
    std::vector<std::string> motd_lines;

    SessionSettings();
};

SessionSettings SessionSettingsFromConfig(const config::Settings &settings);

struct SessionContext {
    ClientRegistry &registry;
    Broadcaster &broadcaster;
    Logger &logger;
    const SessionSettings &settings;

    SessionContext(ClientRegistry &r, Broadcaster &b, Logger &l, const SessionSettings &s)
        : registry(r), broadcaster(b), logger(l), settings(s) {}
};

class Session {
   public:
    Session(std::unique_ptr<net::ByteStream> stream, const std::string &address,
            const SessionContext &context);
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // 호출한 스레드에서 연결의 전체 수명을 처리하고 kClosed 에서 반환한다.
    void Run();

    // 다른 스레드(서버 종료)에서 호출한다. 대기 중인 읽기를 깨워 Run 이 종료되게 한다.
    void Interrupt();

   private:
    bool Admit(CloseReason &reason);
    bool AwaitHello(CloseReason &reason);
    CloseReason ServeActive();
    void HandleMessage(const std::string &text);
    void WriterLoop();

    // 곧 연결을 닫을 것이므로 실패는 로그만 남긴다.
    void SendFinal(const std::string &line);

    // 레지스트리 제거, 송신 큐 닫기, writer 합류. 두 번째 호출부터는 아무 일도 하지 않는다.
    void Detach();
    void Close(CloseReason reason);

    std::string Describe() const;
    static CloseReason FromLineStatus(net::LineStatus status);

    SessionContext context_;
    const std::string address_;
    net::LineTransport transport_;

    std::shared_ptr<Client> client_;
    std::thread writer_;
    std::chrono::steady_clock::duration message_interval_;

    std::atomic<SessionState> state_;
    std::atomic<bool> closed_;
    // WriterLoop 가 송신에 실패해 읽기 쪽을 깨웠음을 ServeActive 에 알린다.
    std::atomic<bool> write_failed_;
    bool slot_reserved_;
    bool detached_;
};
