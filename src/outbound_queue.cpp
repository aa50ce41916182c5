/*
 * 설명: 유한 크기 송신 큐 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/outbound_queue_test.cpp
 */
#include "outbound_queue.hpp"

OutboundQueue::OutboundQueue(std::size_t capacity) : capacity_(capacity), closed_(false) {}

bool OutboundQueue::TryPush(const std::string &line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || lines_.size() >= capacity_) {
            return false;
        }
        lines_.push_back(line);
    }
    not_empty_.notify_one();
    return true;
}

bool OutboundQueue::Pop(std::string &line) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (lines_.empty() && !closed_) {
        not_empty_.wait(lock);
    }
    if (lines_.empty()) {
        return false;
    }
    line.swap(lines_.front());
    lines_.pop_front();
    return true;
}

void OutboundQueue::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

bool OutboundQueue::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t OutboundQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}
