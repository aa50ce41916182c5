/*
 * 설명: 로그 레벨 필터링과 파일 출력, 여러 스레드의 동시 기록을 확인한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: 이 파일 자체
 */
#include "utils/logger.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {
std::vector<std::string> ReadLines(const std::string &path) {
    std::ifstream file(path.c_str());
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}
}  // namespace

void TestLevelFilterAndFormat() {
    const std::string path = "vsicd_logger_test.log";
    std::remove(path.c_str());

    Logger logger;
    assert(logger.SetOutput(path));
    logger.SetLevel(config::LogLevel::kWarn);
    assert(!logger.IsEnabled(config::LogLevel::kInfo));
    assert(logger.IsEnabled(config::LogLevel::kError));

    logger.Log(config::LogLevel::kDebug, "hidden debug");
    logger.Log(config::LogLevel::kInfo, "hidden info");
    logger.Log(config::LogLevel::kWarn, "visible warn");
    logger.Log(config::LogLevel::kError, "visible error");
    assert(logger.SetOutput("-"));

    std::vector<std::string> lines = ReadLines(path);
    assert(lines.size() == 2);
    assert(lines[0].find("[warn] visible warn") != std::string::npos);
    assert(lines[1].find("[error] visible error") != std::string::npos);

    std::remove(path.c_str());
}

void TestConcurrentWritersKeepLinesIntact() {
    const std::string path = "vsicd_logger_threads.log";
    std::remove(path.c_str());

    Logger logger;
    assert(logger.SetOutput(path));

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.push_back(std::thread([&logger, t]() {
            for (int i = 0; i < 50; ++i) {
                std::ostringstream oss;
                oss << "worker " << t << " line " << i;
                logger.Log(config::LogLevel::kInfo, oss.str());
            }
        }));
    }
    for (std::size_t i = 0; i < workers.size(); ++i) {
        workers[i].join();
    }
    assert(logger.SetOutput("-"));

    std::vector<std::string> lines = ReadLines(path);
    assert(lines.size() == 200);
    for (std::size_t i = 0; i < lines.size(); ++i) {
        assert(lines[i].find("[info] worker ") != std::string::npos);
    }

    std::remove(path.c_str());
}

void TestUnwritablePath() {
    Logger logger;
    assert(!logger.SetOutput("/nonexistent-dir/vsicd/test.log"));
}

int main() {
    TestLevelFilterAndFormat();
    TestConcurrentWritersKeepLinesIntact();
    TestUnwritablePath();
    return 0;
}
