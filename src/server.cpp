/*
 * 설명: 리스너 구성, poll 기반 수락 루프, 세션 스레드 관리, 시그널에 의한 정상 종료를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/chat_flow_test.cpp
 */
#include "server.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "net/socket_stream.hpp"

namespace {
const int kPollIntervalMs = 200;
const int kListenBacklog = 64;
volatile std::sig_atomic_t g_shutdown_requested = 0;

void HandleShutdownSignal(int) { g_shutdown_requested = 1; }

std::string PeerAddress(const sockaddr_storage &addr) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        const sockaddr_in *in4 = reinterpret_cast<const sockaddr_in *>(&addr);
        inet_ntop(AF_INET, &in4->sin_addr, buf, sizeof(buf));
    } else if (addr.ss_family == AF_INET6) {
        const sockaddr_in6 *in6 = reinterpret_cast<const sockaddr_in6 *>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
    }
    return buf[0] != '\0' ? std::string(buf) : std::string("unknown");
}
}  // namespace

ChatServer::ChatServer(const config::Settings &settings)
    : config_(settings),
      session_settings_(SessionSettingsFromConfig(settings)),
      registry_(logger_),
      broadcaster_(registry_, logger_),
      tcp_port_(-1),
      next_session_id_(1),
      stop_requested_(false),
      started_(false),
      start_time_(std::chrono::steady_clock::now()) {
    logger_.SetLevel(config_.log_level);
    if (!logger_.SetOutput(config_.log_file)) {
        throw std::runtime_error("로그 파일 열기 실패: " + config_.log_file);
    }
}

ChatServer::~ChatServer() {
    stop_requested_ = true;
    CloseListeners();
    DrainSessions();
}

void ChatServer::Start() {
    if (started_) {
        return;
    }

    if (config_.tls.enabled) {
        tls_context_.reset(new net::TlsContext(config_.tls.cert, config_.tls.key));
    }

    if (config_.tcp.enabled) {
        Listener listener;
        listener.fd = OpenListener(config_.tcp.port);
        listener.tls = false;
        listeners_.push_back(listener);
    }
    if (config_.tls.enabled) {
        Listener listener;
        listener.fd = OpenListener(config_.tls.port);
        listener.tls = true;
        listeners_.push_back(listener);
    }
    if (listeners_.empty()) {
        throw std::runtime_error("활성화된 리스너 없음");
    }

    for (std::size_t i = 0; i < listeners_.size(); ++i) {
        sockaddr_in bound;
        socklen_t len = sizeof(bound);
        int port = -1;
        if (getsockname(listeners_[i].fd, reinterpret_cast<sockaddr *>(&bound), &len) == 0) {
            port = ntohs(bound.sin_port);
        }
        if (!listeners_[i].tls) {
            tcp_port_ = port;
        }

        struct pollfd pfd;
        pfd.fd = listeners_[i].fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        poll_fds_.push_back(pfd);

        std::ostringstream oss;
        oss << config_.server_name << " 수신 대기: " << (listeners_[i].tls ? "tls" : "tcp")
            << " 포트 " << port;
        logger_.Log(config::LogLevel::kInfo, oss.str());
    }

    started_ = true;
}

int ChatServer::OpenListener(int port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error(std::string("소켓 생성 실패: ") + std::strerror(errno));
    }

    int flags = fcntl(fd, F_GETFL, 0);
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        std::ostringstream oss;
        oss << "바인드 실패 (포트 " << port << "): " << reason;
        throw std::runtime_error(oss.str());
    }

    if (listen(fd, kListenBacklog) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        throw std::runtime_error("리스닝 실패: " + reason);
    }
    return fd;
}

void ChatServer::Run() {
    Start();
    std::signal(SIGINT, HandleShutdownSignal);
    std::signal(SIGTERM, HandleShutdownSignal);
    std::signal(SIGPIPE, SIG_IGN);

    while (!ShutdownRequested()) {
        ReapFinished();

        int ret = poll(poll_fds_.data(), poll_fds_.size(), kPollIntervalMs);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_.Log(config::LogLevel::kError,
                        std::string("poll 실패: ") + std::strerror(errno));
            break;
        }

        for (std::size_t i = 0; i < poll_fds_.size(); ++i) {
            if (poll_fds_[i].revents & POLLIN) {
                AcceptFrom(listeners_[i]);
            }
            poll_fds_[i].revents = 0;
        }
    }

    logger_.Log(config::LogLevel::kInfo, "종료 중: 신규 연결 수락 중단");
    stop_requested_ = true;
    CloseListeners();
    DrainSessions();

    ServerStats stats = Snapshot();
    std::ostringstream oss;
    oss << "종료 완료: 총 메시지=" << stats.total_messages << " 가동 시간="
        << stats.uptime_seconds << "s";
    logger_.Log(config::LogLevel::kInfo, oss.str());
}

void ChatServer::RequestShutdown() { stop_requested_ = true; }

bool ChatServer::ShutdownRequested() const {
    return stop_requested_.load() || g_shutdown_requested != 0;
}

void ChatServer::AcceptFrom(const Listener &listener) {
    while (true) {
        sockaddr_storage client_addr;
        socklen_t len = sizeof(client_addr);
        int client_fd = accept(listener.fd, reinterpret_cast<sockaddr *>(&client_addr), &len);
        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                logger_.Log(config::LogLevel::kWarn,
                            std::string("accept 실패: ") + std::strerror(errno));
            }
            return;
        }

        std::unique_ptr<net::ByteStream> stream;
        if (listener.tls) {
            stream.reset(new net::TlsStream(*tls_context_, client_fd));
        } else {
            stream.reset(new net::SocketStream(client_fd));
        }
        Handle(std::move(stream), PeerAddress(client_addr));
    }
}

void ChatServer::Handle(std::unique_ptr<net::ByteStream> stream, const std::string &address) {
    logger_.Log(config::LogLevel::kDebug,
                std::string("연결 수락: ") + address + " [" + stream->Kind() + "]");

    SessionContext context(registry_, broadcaster_, logger_, session_settings_);
    std::shared_ptr<Session> session(new Session(std::move(stream), address, context));

    // 스레드는 sessions_mutex_ 를 잡은 상태에서 만든다. 세션이 먼저 끝나도
    // RunSession 의 완료 기록이 엔트리 삽입 뒤에 일어난다.
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (ShutdownRequested()) {
        // 세션 소멸자가 전송 계층을 닫는다.
        return;
    }
    std::uint64_t id = next_session_id_++;
    SessionEntry &entry = sessions_[id];
    entry.session = session;
    entry.thread = std::thread(&ChatServer::RunSession, this, id, session);
}

void ChatServer::RunSession(std::uint64_t id, std::shared_ptr<Session> session) {
    session->Run();

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    finished_.push_back(id);
}

void ChatServer::ReapFinished() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (std::size_t i = 0; i < finished_.size(); ++i) {
            std::map<std::uint64_t, SessionEntry>::iterator it = sessions_.find(finished_[i]);
            if (it == sessions_.end()) {
                continue;
            }
            done.push_back(std::move(it->second.thread));
            sessions_.erase(it);
        }
        finished_.clear();
    }

    for (std::size_t i = 0; i < done.size(); ++i) {
        done[i].join();
    }
}

void ChatServer::CloseListeners() {
    for (std::size_t i = 0; i < listeners_.size(); ++i) {
        close(listeners_[i].fd);
    }
    listeners_.clear();
    poll_fds_.clear();
}

void ChatServer::DrainSessions() {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (std::map<std::uint64_t, SessionEntry>::iterator it = sessions_.begin();
             it != sessions_.end(); ++it) {
            it->second.session->Interrupt();
        }
    }

    // 세션은 Interrupt 로 깨어나 스스로 Closed 로 간다. 모든 스레드에 합류한다.
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (std::map<std::uint64_t, SessionEntry>::iterator it = sessions_.begin();
             it != sessions_.end(); ++it) {
            threads.push_back(std::move(it->second.thread));
        }
    }
    for (std::size_t i = 0; i < threads.size(); ++i) {
        if (threads[i].joinable()) {
            threads[i].join();
        }
    }

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
    finished_.clear();
}

ServerStats ChatServer::Snapshot() const {
    ServerStats stats;
    stats.active_clients = registry_.Size();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        stats.open_connections = sessions_.size() - finished_.size();
    }
    stats.total_messages = broadcaster_.TotalMessages();
    stats.uptime_seconds = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                         start_time_)
            .count());
    return stats;
}
