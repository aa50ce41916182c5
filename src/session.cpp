/*
 * 설명: 세션 상태 기계. Connecting → AwaitingHello → Active → Closed 순으로 진행하며,
 *       종료 처리(슬롯 반납, 레지스트리 제거, 큐 닫기, 전송 계층 닫기)는 정확히 한 번만 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/chat_flow_test.cpp
 */
#include "session.hpp"

#include <sstream>
#include <utility>

#include "protocol/message.hpp"

namespace {
const char kErrorHandshake[] = "ERROR 100";
}

const char *SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::kConnecting:
            return "connecting";
        case SessionState::kAwaitingHello:
            return "awaiting-hello";
        case SessionState::kActive:
            return "active";
        case SessionState::kClosed:
            return "closed";
    }
    return "closed";
}

const char *CloseReasonToString(CloseReason reason) {
    switch (reason) {
        case CloseReason::kTimeout:
            return "timeout";
        case CloseReason::kTooLarge:
            return "line too large";
        case CloseReason::kInvalidFraming:
            return "invalid framing";
        case CloseReason::kPeerClosed:
            return "peer closed";
        case CloseReason::kIoError:
            return "io error";
        case CloseReason::kTlsHandshakeFailed:
            return "tls handshake failed";
        case CloseReason::kHandshakeRejected:
            return "handshake rejected";
        case CloseReason::kNickExhausted:
            return "nick exhausted";
        case CloseReason::kSlotLimitReached:
            return "slot limit reached";
        case CloseReason::kClientBye:
            return "bye";
        case CloseReason::kWriteFailed:
            return "write failed";
    }
    return "io error";
}

SessionSettings::SessionSettings()
    : max_conns_per_ip(config::kDefaultMaxConnsPerIp),
      max_msgs_per_sec(config::kDefaultMaxMsgsPerSec),
      max_msg_size(config::kDefaultMaxMsgSize),
      keepalive_timeout_ms(static_cast<int>(config::kDefaultKeepaliveSec * 1000)),
      outbound_lines(config::kDefaultOutboundLines) {}

SessionSettings SessionSettingsFromConfig(const config::Settings &settings) {
    SessionSettings out;
    out.max_conns_per_ip = settings.max_conns_per_ip;
    out.max_msgs_per_sec = settings.max_msgs_per_sec > 0 ? settings.max_msgs_per_sec : 1;
    out.max_msg_size = settings.max_msg_size;
    std::size_t keepalive = settings.max_keepalive_timeout;
    if (keepalive > config::kMaxKeepaliveSec) {
        keepalive = config::kMaxKeepaliveSec;
    }
    out.keepalive_timeout_ms = static_cast<int>(keepalive * 1000);
    out.outbound_lines = settings.outbound_lines;
    out.motd_lines = config::NormalizeMotd(settings.motd);
    return out;
}

Session::Session(std::unique_ptr<net::ByteStream> stream, const std::string &address,
                 const SessionContext &context)
    : context_(context),
      address_(address),
      transport_(std::move(stream),
                 net::TransportLimits(context.settings.max_msg_size,
                                      context.settings.keepalive_timeout_ms)),
      message_interval_(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          std::chrono::microseconds(1000000 / (context.settings.max_msgs_per_sec > 0
                                                   ? context.settings.max_msgs_per_sec
                                                   : 1)))),
      state_(SessionState::kConnecting),
      closed_(false),
      write_failed_(false),
      slot_reserved_(false),
      detached_(false) {}

Session::~Session() {
    // Run 이 끝나지 않은 채 파괴되는 경우에도 writer 스레드가 남지 않게 한다.
    if (client_) {
        client_->outbound.Close();
    }
    if (writer_.joinable()) {
        writer_.join();
    }
}

void Session::Run() {
    CloseReason reason = CloseReason::kPeerClosed;

    if (!Admit(reason)) {
        Close(reason);
        return;
    }

    state_ = SessionState::kAwaitingHello;
    if (!AwaitHello(reason)) {
        Close(reason);
        return;
    }

    state_ = SessionState::kActive;
    Close(ServeActive());
}

void Session::Interrupt() { transport_.Interrupt(); }

bool Session::Admit(CloseReason &reason) {
    if (!context_.registry.TryReserveSlot(address_, context_.settings.max_conns_per_ip)) {
        reason = CloseReason::kSlotLimitReached;
        return false;
    }
    slot_reserved_ = true;

    net::IoStatus handshake = transport_.Handshake();
    if (handshake != net::IoStatus::kOk) {
        context_.logger.Log(config::LogLevel::kDebug,
                            std::string("핸드셰이크 실패(") + net::IoStatusToString(handshake) +
                                "): " + Describe());
        reason = CloseReason::kTlsHandshakeFailed;
        return false;
    }
    return true;
}

bool Session::AwaitHello(CloseReason &reason) {
    std::string line;
    net::LineStatus status = transport_.ReadLine(line);
    if (status != net::LineStatus::kOk) {
        reason = FromLineStatus(status);
        return false;
    }

    protocol::ParsedCommand hello = protocol::ParseCommand(line);
    if (hello.command != "HELLO" || !protocol::IsValidNickname(hello.argument)) {
        SendFinal(kErrorHandshake);
        reason = CloseReason::kHandshakeRejected;
        return false;
    }

    std::shared_ptr<Client> client(new Client(address_, context_.settings.outbound_lines));
    std::string final_nick;
    if (!context_.registry.RegisterUnique(hello.argument, client, final_nick)) {
        SendFinal(kErrorHandshake);
        reason = CloseReason::kNickExhausted;
        return false;
    }
    client_ = client;

    if (transport_.WriteLine(protocol::FormatReply("HELLO", final_nick)) != net::LineStatus::kOk) {
        reason = CloseReason::kWriteFailed;
        return false;
    }
    const std::vector<std::string> &motd = context_.settings.motd_lines;
    for (std::size_t i = 0; i < motd.size(); ++i) {
        if (transport_.WriteLine(protocol::FormatReply("MOTD", motd[i])) != net::LineStatus::kOk) {
            reason = CloseReason::kWriteFailed;
            return false;
        }
    }

    // 인사 라인이 모두 나간 뒤에 writer 를 띄워야 방송이 HELLO 보다 먼저 나가지 않는다.
    writer_ = std::thread(&Session::WriterLoop, this);

    context_.logger.Log(config::LogLevel::kInfo, "핸드셰이크 완료: " + Describe());
    return true;
}

CloseReason Session::ServeActive() {
    std::string line;
    while (true) {
        net::LineStatus status = transport_.ReadLine(line);
        if (status != net::LineStatus::kOk) {
            // writer 가 전송 계층을 깨운 경우 읽기 쪽 상태보다 송신 실패가 원인이다.
            if (write_failed_.load()) {
                return CloseReason::kWriteFailed;
            }
            return FromLineStatus(status);
        }

        protocol::ParsedCommand cmd = protocol::ParseCommand(line);
        if (cmd.command == "MSG") {
            HandleMessage(cmd.argument);
        } else if (cmd.command == "PING") {
            if (transport_.WriteLine("PONG") != net::LineStatus::kOk) {
                return CloseReason::kWriteFailed;
            }
        } else if (cmd.command == "BYE") {
            // CYA 가 마지막 줄이 되도록 먼저 큐를 비우고 writer 를 멈춘다.
            Detach();
            SendFinal("CYA");
            return CloseReason::kClientBye;
        }
        // 그 외 명령은 무시한다.
    }
}

void Session::HandleMessage(const std::string &text) {
    const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    if (client_->has_sent && now - client_->last_message < message_interval_) {
        context_.logger.Log(config::LogLevel::kDebug, "속도 제한으로 메시지 버림: " + Describe());
        return;
    }
    client_->has_sent = true;
    client_->last_message = now;

    const std::string relay = protocol::FormatRelay(client_->nick, text);
    if (relay.size() > context_.settings.max_msg_size) {
        context_.logger.Log(config::LogLevel::kDebug, "중계 라인 길이 초과로 버림: " + Describe());
        return;
    }
    context_.broadcaster.Broadcast(relay);
}

void Session::WriterLoop() {
    std::string line;
    while (client_->outbound.Pop(line)) {
        net::LineStatus status = transport_.WriteLine(line);
        if (status != net::LineStatus::kOk) {
            context_.logger.Log(config::LogLevel::kInfo,
                                std::string("송신 실패(") + net::LineStatusToString(status) +
                                    "): " + Describe());
            // 읽기 쪽을 깨워 세션이 Closed 로 가게 한다.
            write_failed_ = true;
            transport_.Interrupt();
            return;
        }
    }
}

void Session::SendFinal(const std::string &line) {
    net::LineStatus status = transport_.WriteLine(line);
    if (status != net::LineStatus::kOk) {
        context_.logger.Log(config::LogLevel::kDebug,
                            "마지막 응답 전송 실패(" + line + ", " +
                                net::LineStatusToString(status) + "): " + Describe());
    }
}

void Session::Detach() {
    if (detached_) {
        return;
    }
    detached_ = true;

    if (client_) {
        context_.registry.Remove(client_->nick, client_);
        client_->outbound.Close();
    }
    if (writer_.joinable()) {
        writer_.join();
    }
}

void Session::Close(CloseReason reason) {
    if (closed_.exchange(true)) {
        return;
    }

    Detach();
    if (slot_reserved_) {
        context_.registry.ReleaseSlot(address_);
        slot_reserved_ = false;
    }
    transport_.Close();
    state_ = SessionState::kClosed;

    config::LogLevel level = reason == CloseReason::kSlotLimitReached ? config::LogLevel::kWarn
                                                                      : config::LogLevel::kInfo;
    context_.logger.Log(level, std::string("연결 종료(") + CloseReasonToString(reason) +
                                   "): " + Describe());
}

std::string Session::Describe() const {
    std::ostringstream oss;
    oss << address_ << " [" << transport_.Kind() << ", " << SessionStateToString(state_.load())
        << "]";
    if (client_) {
        oss << " nick=" << client_->nick;
    }
    return oss.str();
}

CloseReason Session::FromLineStatus(net::LineStatus status) {
    switch (status) {
        case net::LineStatus::kTimeout:
            return CloseReason::kTimeout;
        case net::LineStatus::kTooLarge:
            return CloseReason::kTooLarge;
        case net::LineStatus::kInvalidFraming:
            return CloseReason::kInvalidFraming;
        case net::LineStatus::kClosed:
            return CloseReason::kPeerClosed;
        case net::LineStatus::kOk:
        case net::LineStatus::kIoError:
            break;
    }
    return CloseReason::kIoError;
}
