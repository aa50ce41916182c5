/*
 * 설명: 세션과 writer 스레드 사이의 유한 크기 송신 큐. 넣기는 논블로킹, 꺼내기는 블로킹이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/outbound_queue_test.cpp
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

class OutboundQueue {
   public:
    explicit OutboundQueue(std::size_t capacity);

    // 가득 찼거나 닫힌 경우 false. 호출자를 절대 블록하지 않는다.
    bool TryPush(const std::string &line);

    // 항목이 생기거나 큐가 닫힐 때까지 기다린다.
    // 닫힌 뒤에도 남은 항목은 모두 꺼낼 수 있고, 비면 false 를 반환한다.
    bool Pop(std::string &line);

    // 여러 번 호출해도 안전하다.
    void Close();

    bool IsClosed() const;
    std::size_t Size() const;
    std::size_t Capacity() const { return capacity_; }

   private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<std::string> lines_;
    bool closed_;
};
