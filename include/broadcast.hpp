/*
 * 설명: 등록된 모든 클라이언트의 송신 큐에 메시지를 논블로킹으로 넣는다. 가득 찬 큐는 건너뛴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/broadcast_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "registry.hpp"
#include "utils/logger.hpp"

class Broadcaster {
   public:
    Broadcaster(ClientRegistry &registry, Logger &logger);

    // 실제로 큐에 들어간 수신자 수를 반환한다.
    std::size_t Broadcast(const std::string &message);

    std::uint64_t TotalMessages() const { return total_messages_.load(); }
    std::uint64_t DroppedDeliveries() const { return dropped_deliveries_.load(); }

   private:
    ClientRegistry &registry_;
    Logger &logger_;
    std::atomic<std::uint64_t> total_messages_;
    std::atomic<std::uint64_t> dropped_deliveries_;
};
