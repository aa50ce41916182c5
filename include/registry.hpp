/*
 * 설명: 닉네임 → 클라이언트 매핑과 주소별 동시 접속 수를 하나의 뮤텍스로 관리하는 레지스트리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "outbound_queue.hpp"
#include "utils/logger.hpp"

struct Client {
    Client(const std::string &source_address, std::size_t queue_capacity);

    // RegisterUnique 안에서 한 번만 설정되고 이후 바뀌지 않는다.
    std::string nick;
    const std::string address;
    OutboundQueue outbound;

    // 소유 세션 스레드만 읽고 쓴다.
    std::chrono::steady_clock::time_point last_message;
    bool has_sent;
};

class ClientRegistry {
   public:
    // 0 이상 10000 미만 값을 out 에 넣는다. 실패 시 false.
    typedef std::function<bool(unsigned int &)> SuffixSource;

    explicit ClientRegistry(Logger &logger);
    ClientRegistry(Logger &logger, const SuffixSource &suffix_source);

    bool TryReserveSlot(const std::string &address, std::size_t max_per_address);
    void ReleaseSlot(const std::string &address);
    std::size_t SlotCount(const std::string &address) const;

    // 중복이면 "_NNNN" 접미사를 붙인 이름으로 재검사 후 삽입한다.
    // 그래도 충돌하면 false (닉네임 고갈).
    bool RegisterUnique(const std::string &nick, const std::shared_ptr<Client> &client,
                        std::string &final_nick);

    std::shared_ptr<Client> Lookup(const std::string &nick) const;

    // client 가 현재 그 닉네임의 소유자일 때만 지운다.
    bool Remove(const std::string &nick, const std::shared_ptr<Client> &client);

    std::vector<std::shared_ptr<Client> > Snapshot() const;
    std::size_t Size() const;

   private:
    Logger &logger_;
    SuffixSource suffix_source_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Client> > clients_;
    std::map<std::string, std::size_t> address_counts_;
};
