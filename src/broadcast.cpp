/*
 * 설명: 레지스트리 스냅샷을 잠금 밖에서 순회하며 best-effort 로 팬아웃한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/broadcast_test.cpp
 */
#include "broadcast.hpp"

#include <memory>
#include <vector>

Broadcaster::Broadcaster(ClientRegistry &registry, Logger &logger)
    : registry_(registry), logger_(logger), total_messages_(0), dropped_deliveries_(0) {}

std::size_t Broadcaster::Broadcast(const std::string &message) {
    const std::vector<std::shared_ptr<Client> > recipients = registry_.Snapshot();

    std::size_t delivered = 0;
    for (std::size_t i = 0; i < recipients.size(); ++i) {
        if (recipients[i]->outbound.TryPush(message)) {
            ++delivered;
            continue;
        }
        ++dropped_deliveries_;
        logger_.Log(config::LogLevel::kDebug, "송신 큐 가득 참, 메시지 버림: " + recipients[i]->nick);
    }

    ++total_messages_;
    return delivered;
}
