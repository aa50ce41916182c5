/*
 * 설명: socketpair 위에서 줄 단위 전송 계층의 왕복, 길이 제한, 줄 주입 거부, 읽기 타임아웃, 종료 처리를 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "net/line_transport.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "net/socket_stream.hpp"

namespace {
struct Pair {
    std::unique_ptr<net::LineTransport> left;
    std::unique_ptr<net::LineTransport> right;
};

Pair MakePair(std::size_t max_line, int read_timeout_ms) {
    int fds[2];
    int rc = socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(rc == 0);
    (void)rc;

    net::TransportLimits limits(max_line, read_timeout_ms);
    Pair pair;
    pair.left.reset(new net::LineTransport(
        std::unique_ptr<net::ByteStream>(new net::SocketStream(fds[0])), limits));
    pair.right.reset(new net::LineTransport(
        std::unique_ptr<net::ByteStream>(new net::SocketStream(fds[1])), limits));
    return pair;
}

// 전송 계층을 거치지 않고 원시 바이트를 보내기 위한 짝.
struct RawPair {
    int raw_fd;
    std::unique_ptr<net::LineTransport> transport;
};

RawPair MakeRawPair(std::size_t max_line, int read_timeout_ms) {
    int fds[2];
    int rc = socketpair(AF_UNIX, SOCK_STREAM, 0, fds);
    assert(rc == 0);
    (void)rc;

    RawPair pair;
    pair.raw_fd = fds[0];
    pair.transport.reset(new net::LineTransport(
        std::unique_ptr<net::ByteStream>(new net::SocketStream(fds[1])),
        net::TransportLimits(max_line, read_timeout_ms)));
    return pair;
}

void SendRaw(int fd, const std::string &bytes) {
    ssize_t n = send(fd, bytes.data(), bytes.size(), 0);
    assert(n == static_cast<ssize_t>(bytes.size()));
    (void)n;
}
}  // namespace

void TestRoundTrip() {
    Pair pair = MakePair(64, 1000);
    const std::string samples[] = {"HELLO alice", "", "MSG alice: hello world", std::string(64, 'z')};
    for (std::size_t i = 0; i < 4; ++i) {
        assert(pair.left->WriteLine(samples[i]) == net::LineStatus::kOk);
        std::string line;
        assert(pair.right->ReadLine(line) == net::LineStatus::kOk);
        assert(line == samples[i]);
        assert(pair.right->WriteLine(line) == net::LineStatus::kOk);
        std::string echoed;
        assert(pair.left->ReadLine(echoed) == net::LineStatus::kOk);
        assert(echoed == samples[i]);
    }
}

void TestWriteRejectsBadLines() {
    Pair pair = MakePair(16, 1000);
    assert(pair.left->WriteLine("a\nb") == net::LineStatus::kInvalidFraming);
    assert(pair.left->WriteLine("a\rb") == net::LineStatus::kInvalidFraming);
    assert(pair.left->WriteLine(std::string(17, 'x')) == net::LineStatus::kTooLarge);

    // 거부된 쓰기는 아무 바이트도 보내지 않는다.
    assert(pair.left->WriteLine("ok") == net::LineStatus::kOk);
    std::string line;
    assert(pair.right->ReadLine(line) == net::LineStatus::kOk);
    assert(line == "ok");
}

void TestReadStripsCarriageReturn() {
    RawPair pair = MakeRawPair(64, 1000);
    SendRaw(pair.raw_fd, "PING\r\nBYE\n");
    std::string line;
    assert(pair.transport->ReadLine(line) == net::LineStatus::kOk);
    assert(line == "PING");
    assert(pair.transport->ReadLine(line) == net::LineStatus::kOk);
    assert(line == "BYE");
    close(pair.raw_fd);
}

void TestReadRejectsBadLines() {
    {
        RawPair pair = MakeRawPair(16, 1000);
        SendRaw(pair.raw_fd, "MSG a\rMSG b\n");
        std::string line;
        assert(pair.transport->ReadLine(line) == net::LineStatus::kInvalidFraming);
        close(pair.raw_fd);
    }
    {
        RawPair pair = MakeRawPair(16, 1000);
        SendRaw(pair.raw_fd, std::string(17, 'x') + "\n");
        std::string line;
        assert(pair.transport->ReadLine(line) == net::LineStatus::kTooLarge);
        close(pair.raw_fd);
    }
    {
        // 개행 없이 한도를 넘기면 개행을 기다리지 않는다.
        RawPair pair = MakeRawPair(16, 5000);
        SendRaw(pair.raw_fd, std::string(40, 'x'));
        std::string line;
        assert(pair.transport->ReadLine(line) == net::LineStatus::kTooLarge);
        close(pair.raw_fd);
    }
}

void TestReadTimeout() {
    RawPair pair = MakeRawPair(64, 100);
    SendRaw(pair.raw_fd, "partial");

    const std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
    std::string line;
    assert(pair.transport->ReadLine(line) == net::LineStatus::kTimeout);
    const std::chrono::steady_clock::duration elapsed = std::chrono::steady_clock::now() - begin;
    assert(elapsed >= std::chrono::milliseconds(90));
    assert(elapsed < std::chrono::seconds(2));

    // 완성되면 이전 조각과 이어 붙여 읽는다.
    SendRaw(pair.raw_fd, " line\n");
    assert(pair.transport->ReadLine(line) == net::LineStatus::kOk);
    assert(line == "partial line");
    close(pair.raw_fd);
}

void TestPeerCloseAndInterrupt() {
    {
        RawPair pair = MakeRawPair(64, 1000);
        close(pair.raw_fd);
        std::string line;
        assert(pair.transport->ReadLine(line) == net::LineStatus::kClosed);
    }
    {
        RawPair pair = MakeRawPair(64, 5000);
        net::LineTransport *transport = pair.transport.get();
        std::thread stopper([transport]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            transport->Interrupt();
        });

        const std::chrono::steady_clock::time_point begin = std::chrono::steady_clock::now();
        std::string line;
        assert(transport->ReadLine(line) == net::LineStatus::kClosed);
        assert(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
        stopper.join();

        assert(transport->WriteLine("late") != net::LineStatus::kOk);
        transport->Close();
        transport->Close();
        close(pair.raw_fd);
    }
}

int main() {
    TestRoundTrip();
    TestWriteRejectsBadLines();
    TestReadStripsCarriageReturn();
    TestReadRejectsBadLines();
    TestReadTimeout();
    TestPeerCloseAndInterrupt();
    return 0;
}
