/*
 * 설명: 메모리 스트림 위에서 세션을 돌려 빈 MSG 중계, writer 송신 실패 시 종료 원인, 종료 후 정리를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "session.hpp"

#include <cassert>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
const char kLogPath[] = "vsicd_session_test.log";

// 미리 넣어 둔 줄을 차례로 돌려주고, 다 쓰면 Interrupt 까지 기다리는 스트림.
class ScriptedStream : public net::ByteStream {
   public:
    ScriptedStream(const std::vector<std::string> &inbound, const std::string &failing_prefix)
        : failing_prefix_(failing_prefix), interrupted_(false) {
        for (std::size_t i = 0; i < inbound.size(); ++i) {
            inbound_.push_back(inbound[i] + "\n");
        }
    }

    virtual net::IoStatus Handshake(int) { return net::IoStatus::kOk; }

    virtual net::IoStatus Read(char *buf, std::size_t capacity, std::size_t &received, int) {
        received = 0;
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return interrupted_ || !inbound_.empty(); });
        if (inbound_.empty()) {
            return net::IoStatus::kClosed;
        }
        std::string &next = inbound_.front();
        std::size_t n = next.size() < capacity ? next.size() : capacity;
        next.copy(buf, n);
        next.erase(0, n);
        if (next.empty()) {
            inbound_.pop_front();
        }
        received = n;
        return net::IoStatus::kOk;
    }

    virtual net::IoStatus WriteAll(const char *data, std::size_t len, int) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (interrupted_) {
            return net::IoStatus::kClosed;
        }
        std::string line(data, len);
        if (!failing_prefix_.empty() &&
            line.compare(0, failing_prefix_.size(), failing_prefix_) == 0) {
            return net::IoStatus::kError;
        }
        written_.push_back(line);
        return net::IoStatus::kOk;
    }

    virtual void Interrupt() {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
        cv_.notify_all();
    }

    virtual void Close() { Interrupt(); }

    virtual const char *Kind() const { return "memory"; }

    std::vector<std::string> Written() {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> written_;
    const std::string failing_prefix_;
    bool interrupted_;
};

std::string ReadAll(const char *path) {
    std::ifstream in(path);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}
}  // namespace

void TestEmptyMessageIsRelayed() {
    Logger logger;
    logger.SetLevel(config::LogLevel::kError);
    ClientRegistry registry(logger);
    Broadcaster broadcaster(registry, logger);
    SessionSettings settings;
    SessionContext context(registry, broadcaster, logger, settings);

    std::vector<std::string> inbound;
    inbound.push_back("HELLO alice");
    inbound.push_back("MSG");
    inbound.push_back("BYE");
    ScriptedStream *stream = new ScriptedStream(inbound, "");
    std::unique_ptr<net::ByteStream> owned(stream);
    {
        Session session(std::move(owned), "10.0.0.1", context);
        session.Run();

        std::vector<std::string> written = stream->Written();
        assert(written.size() == 3);
        assert(written[0] == "HELLO alice\n");
        assert(written[1] == "MSG alice: \n");
        assert(written[2] == "CYA\n");
    }
    assert(broadcaster.TotalMessages() == 1);
    assert(registry.Size() == 0);
    assert(registry.SlotCount("10.0.0.1") == 0);
}

void TestWriterFailureClosesAsWriteFailed() {
    Logger logger;
    logger.SetLevel(config::LogLevel::kInfo);
    std::remove(kLogPath);
    bool opened = logger.SetOutput(kLogPath);
    assert(opened);
    (void)opened;

    ClientRegistry registry(logger);
    Broadcaster broadcaster(registry, logger);
    SessionSettings settings;
    SessionContext context(registry, broadcaster, logger, settings);

    // 인사 응답은 나가고, writer 가 쓰는 방송 줄에서 실패한다. 이후 읽기는 Interrupt 로 풀린다.
    std::vector<std::string> inbound;
    inbound.push_back("HELLO alice");
    inbound.push_back("MSG hi");
    {
        Session session(std::unique_ptr<net::ByteStream>(new ScriptedStream(inbound, "MSG ")),
                        "10.0.0.2", context);
        session.Run();
    }

    assert(registry.Size() == 0);
    assert(registry.SlotCount("10.0.0.2") == 0);

    const std::string log = ReadAll(kLogPath);
    assert(log.find("송신 실패") != std::string::npos);
    assert(log.find("연결 종료(write failed)") != std::string::npos);
    assert(log.find("연결 종료(peer closed)") == std::string::npos);
    std::remove(kLogPath);
}

int main() {
    TestEmptyMessageIsRelayed();
    TestWriterFailureClosesAsWriteFailed();
    return 0;
}
