/*
 * 설명: TCP/TLS 리스너를 poll 로 감시해 연결을 받고, 연결마다 세션 스레드를 띄우며, 종료 시 모든 세션을 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <poll.h>
#include <string>
#include <thread>
#include <vector>

#include "broadcast.hpp"
#include "net/byte_stream.hpp"
#include "net/tls_stream.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

struct ServerStats {
    std::size_t active_clients;
    std::size_t open_connections;
    std::uint64_t total_messages;
    std::uint64_t uptime_seconds;
};

class ChatServer {
   public:
    explicit ChatServer(const config::Settings &settings);
    ~ChatServer();

    ChatServer(const ChatServer &) = delete;
    ChatServer &operator=(const ChatServer &) = delete;

    // 리스너를 연다. 실패 시 std::runtime_error.
    void Start();

    // 종료 요청(RequestShutdown 또는 SIGINT/SIGTERM)까지 연결을 받고, 모든 세션이 닫힌 뒤 반환한다.
    void Run();

    // 어느 스레드에서든 호출할 수 있다.
    void RequestShutdown();

    // 수락된 연결 하나를 세션 스레드에 넘긴다. 종료 중이면 바로 닫는다.
    void Handle(std::unique_ptr<net::ByteStream> stream, const std::string &address);

    ServerStats Snapshot() const;

    int TcpPort() const { return tcp_port_; }

    ClientRegistry &registry() { return registry_; }
    Logger &logger() { return logger_; }

   private:
    struct Listener {
        int fd;
        bool tls;
    };

    struct SessionEntry {
        std::shared_ptr<Session> session;
        std::thread thread;
    };

    int OpenListener(int port);
    void AcceptFrom(const Listener &listener);
    void RunSession(std::uint64_t id, std::shared_ptr<Session> session);
    void ReapFinished();
    void CloseListeners();
    void DrainSessions();
    bool ShutdownRequested() const;

    config::Settings config_;
    SessionSettings session_settings_;
    Logger logger_;
    ClientRegistry registry_;
    Broadcaster broadcaster_;
    std::unique_ptr<net::TlsContext> tls_context_;

    std::vector<Listener> listeners_;
    std::vector<struct pollfd> poll_fds_;
    int tcp_port_;

    mutable std::mutex sessions_mutex_;
    std::map<std::uint64_t, SessionEntry> sessions_;
    std::vector<std::uint64_t> finished_;
    std::uint64_t next_session_id_;

    std::atomic<bool> stop_requested_;
    bool started_;
    const std::chrono::steady_clock::time_point start_time_;
};
