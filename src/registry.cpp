/*
 * 설명: 주소별 슬롯 예약/반납과 닉네임 고유화 등록을 원자적으로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/registry_test.cpp
 */
#include "registry.hpp"

#include "utils/random.hpp"

namespace {
bool DefaultSuffix(unsigned int &out) { return utils::SecureRandomBelow(10000, out); }
}  // namespace

Client::Client(const std::string &source_address, std::size_t queue_capacity)
    : address(source_address), outbound(queue_capacity), has_sent(false) {}

ClientRegistry::ClientRegistry(Logger &logger) : logger_(logger), suffix_source_(DefaultSuffix) {}

ClientRegistry::ClientRegistry(Logger &logger, const SuffixSource &suffix_source)
    : logger_(logger), suffix_source_(suffix_source) {}

bool ClientRegistry::TryReserveSlot(const std::string &address, std::size_t max_per_address) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t &count = address_counts_[address];
    if (count >= max_per_address) {
        if (count == 0) {
            address_counts_.erase(address);
        }
        return false;
    }
    ++count;
    return true;
}

void ClientRegistry::ReleaseSlot(const std::string &address) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::size_t>::iterator it = address_counts_.find(address);
    if (it == address_counts_.end() || it->second == 0) {
        logger_.Log(config::LogLevel::kWarn, "슬롯 반납 언더플로우: " + address);
        if (it != address_counts_.end()) {
            address_counts_.erase(it);
        }
        return;
    }
    if (--it->second == 0) {
        address_counts_.erase(it);
    }
}

std::size_t ClientRegistry::SlotCount(const std::string &address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::size_t>::const_iterator it = address_counts_.find(address);
    return it == address_counts_.end() ? 0 : it->second;
}

bool ClientRegistry::RegisterUnique(const std::string &nick, const std::shared_ptr<Client> &client,
                                    std::string &final_nick) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string candidate = nick;
    if (clients_.count(candidate) != 0) {
        unsigned int suffix = 0;
        if (!suffix_source_(suffix)) {
            logger_.Log(config::LogLevel::kError, "닉네임 접미사 난수 생성 실패");
            return false;
        }
        candidate = nick + utils::FormatNickSuffix(suffix);
        if (clients_.count(candidate) != 0) {
            return false;
        }
    }

    client->nick = candidate;
    clients_[candidate] = client;
    final_nick = candidate;
    return true;
}

std::shared_ptr<Client> ClientRegistry::Lookup(const std::string &nick) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<Client> >::const_iterator it = clients_.find(nick);
    if (it == clients_.end()) {
        return std::shared_ptr<Client>();
    }
    return it->second;
}

bool ClientRegistry::Remove(const std::string &nick, const std::shared_ptr<Client> &client) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, std::shared_ptr<Client> >::iterator it = clients_.find(nick);
    if (it == clients_.end() || it->second != client) {
        return false;
    }
    clients_.erase(it);
    return true;
}

std::vector<std::shared_ptr<Client> > ClientRegistry::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<Client> > snapshot;
    snapshot.reserve(clients_.size());
    for (std::map<std::string, std::shared_ptr<Client> >::const_iterator it = clients_.begin();
         it != clients_.end(); ++it) {
        snapshot.push_back(it->second);
    }
    return snapshot;
}

std::size_t ClientRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}
